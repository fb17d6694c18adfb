#include "util/misc.hpp"

#include <algorithm>

#include "absl/strings/str_format.h"

namespace util {

namespace {
const constexpr char* kReplacementCharacter = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at pos, 0 if there is
// none.
size_t SequenceLength(const std::string& text, size_t pos) {
  unsigned char lead = text[pos];
  if (lead < 0x80) return 1;
  size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) low = 0xA0;
    if (lead == 0xED) high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) low = 0x90;
    if (lead == 0xF4) high = 0x8F;
  } else {
    return 0;
  }
  if (pos + length > text.size()) return 0;
  unsigned char second = text[pos + 1];
  if (second < low || second > high) return 0;
  for (size_t i = 2; i < length; i++) {
    if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) return 0;
  }
  return length;
}
}  // namespace

std::string ShellQuote(const std::string& s) {
  std::string quoted = "'";
  for (char c : s) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

int64_t CountLines(const std::string& text) {
  int64_t newlines = std::count(text.begin(), text.end(), '\n');
  if (!text.empty() && text.back() != '\n') newlines++;
  return newlines;
}

int64_t LineAt(const std::string& text, size_t offset) {
  offset = std::min(offset, text.size());
  return 1 + std::count(text.begin(), text.begin() + offset, '\n');
}

std::string NumberLines(const std::string& text, int64_t first_line) {
  std::string numbered;
  int64_t line = first_line;
  for (const std::string& content : SplitLines(text)) {
    absl::StrAppendFormat(&numbered, "%6d\t%s\n", line++, content);
  }
  return numbered;
}

std::string SanitizeUtf8(const std::string& text) {
  std::string clean;
  clean.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t length = SequenceLength(text, pos);
    if (length == 0) {
      clean += kReplacementCharacter;
      pos++;
    } else {
      clean.append(text, pos, length);
      pos += length;
    }
  }
  return clean;
}

size_t Utf8Boundary(const std::string& text, size_t offset) {
  if (offset >= text.size()) return text.size();
  // Steps back over at most three continuation bytes.
  size_t start = offset;
  while (start > 0 && offset - start < 3 &&
         (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
    start--;
  }
  if ((static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) return offset;
  size_t length = SequenceLength(text, start);
  return length != 0 && start + length > offset ? start : offset;
}

}  // namespace util
