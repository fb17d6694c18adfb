#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsWriteAll(int fd, const char* data, size_t size) {
  size_t pos = 0;
  while (pos < size) {
    ssize_t written = write(fd, data + pos, size - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

// Returns errno, or 0 on success.
int OsCopyFile(const std::string& from, const std::string& to, mode_t mode) {
  int in = open(from.c_str(), O_RDONLY | O_CLOEXEC);
  if (in == -1) return errno;
  int out = open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (out == -1) {
    int error = errno;
    close(in);
    return error;
  }
  char buf[util::kChunkSize];
  int error = 0;
  while (true) {
    ssize_t amount = read(in, buf, util::kChunkSize);
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      error = errno;
      break;
    }
    if (amount == 0) break;
    error = OsWriteAll(out, buf, amount);
    if (error) break;
  }
  close(in);
  if (close(out) == -1 && !error) error = errno;
  if (!error && chmod(to.c_str(), mode) == -1) error = errno;
  return error;
}

void CopyTreeImpl(const std::string& from, const std::string& to) {
  struct stat st {};
  if (lstat(from.c_str(), &st) == -1)
    throw std::system_error(errno, std::system_category(), "lstat " + from);
  if (S_ISLNK(st.st_mode)) {
    std::string target(st.st_size + 1, '\0');
    ssize_t len = readlink(from.c_str(), &target[0], target.size());
    if (len == -1)
      throw std::system_error(errno, std::system_category(),
                              "readlink " + from);
    target.resize(len);
    if (symlink(target.c_str(), to.c_str()) == -1)
      throw std::system_error(errno, std::system_category(), "symlink " + to);
    return;
  }
  if (S_ISREG(st.st_mode)) {
    int err = OsCopyFile(from, to, st.st_mode & 07777);
    if (err) throw std::system_error(err, std::system_category(), "copy " + to);
    return;
  }
  if (!S_ISDIR(st.st_mode)) return;
  if (mkdir(to.c_str(), (st.st_mode & 07777) | S_IRWXU) == -1 &&
      errno != EEXIST)
    throw std::system_error(errno, std::system_category(), "mkdir " + to);
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(from.c_str()), &closedir);
  if (!dir)
    throw std::system_error(errno, std::system_category(), "opendir " + from);
  while (struct dirent* entry = readdir(dir.get())) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    CopyTreeImpl(util::File::JoinPath(from, name),
                 util::File::JoinPath(to, name));
  }
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw file_not_found("Read " + path);
  std::ostringstream contents;
  contents << fin.rdbuf();
  if (fin.bad())
    throw std::system_error(EIO, std::system_category(), "Read " + path);
  return contents.str();
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) throw file_exists("Write " + path);
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1)
    throw std::system_error(errno, std::system_category(), "Write " + path);
  int err = OsWriteAll(fd, content.data(), content.size());
  if (close(fd) == -1 && !err) err = errno;
  mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  if (!err && chmod(temp_file.c_str(), mode) == -1) err = errno;
  if (!err && rename(temp_file.c_str(), path.c_str()) == -1) err = errno;
  if (err) {
    remove(temp_file.c_str());
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::Append(const std::string& path, const std::string& content) {
  MakeDirs(BaseDir(path));
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                S_IRUSR | S_IWUSR | S_IRGRP);
  if (fd == -1)
    throw std::system_error(errno, std::system_category(), "Append " + path);
  int err = OsWriteAll(fd, content.data(), content.size());
  if (close(fd) == -1 && !err) err = errno;
  if (err)
    throw std::system_error(err, std::system_category(), "Append " + path);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to,
                bool overwrite) {
  if (!overwrite && Size(to) >= 0) throw file_exists("Copy " + to);
  struct stat st {};
  if (stat(from.c_str(), &st) == -1) throw file_not_found("Copy " + from);
  MakeDirs(BaseDir(to));
  int err = OsCopyFile(from, to, st.st_mode & 07777);
  if (err) throw std::system_error(err, std::system_category(), "Copy " + to);
}

void File::CopyTree(const std::string& from, const std::string& to) {
  MakeDirs(BaseDir(to));
  CopyTreeImpl(from, to);
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1)
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, first.back())) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return "";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

bool File::Exists(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
TempDir::TempDir(TempDir&& other) noexcept
    : path_(std::move(other.path_)), keep_(other.keep_) {
  other.keep_ = true;
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  if (!OsRemoveTree(path_)) {
    LOG(WARNING) << "Cannot remove temporary directory " << path_ << ": "
                 << strerror(errno);
  }
}

}  // namespace util
