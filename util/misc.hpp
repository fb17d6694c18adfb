#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Quotes s for /bin/sh so that it is passed as a single word.
std::string ShellQuote(const std::string& s);

// Splits text into lines, without the terminators. A trailing newline does
// not open an extra empty line.
std::vector<std::string> SplitLines(const std::string& text);

// Number of lines of text, as counted by SplitLines.
int64_t CountLines(const std::string& text);

// 1-based line of the character at offset.
int64_t LineAt(const std::string& text, size_t offset);

// Prefixes every line with its number, the way cat -n does.
std::string NumberLines(const std::string& text, int64_t first_line = 1);

// Replaces every byte that does not start a valid UTF-8 sequence with
// U+FFFD, so that the text can be stored in proto string fields.
std::string SanitizeUtf8(const std::string& text);

// Largest offset not above offset that does not split a UTF-8 sequence.
size_t Utf8Boundary(const std::string& text, size_t offset);

}  // namespace util

#endif
