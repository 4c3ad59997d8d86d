#include "util/file.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <memory>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
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
int OsRead(const std::string& path, int64_t size_limit, std::string* out) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    out->append(buf, amount);
    if (size_limit && static_cast<int64_t>(out->size()) >= size_limit) {
      out->resize(size_limit);
      break;
    }
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.c_str() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  // Keep the permission bits of the file we are replacing, if any.
  struct stat st {};
  mode_t mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  if (stat(path.c_str(), &st) == 0) mode = st.st_mode & 07777;
  if (fchmod(fd, mode) == -1 || close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  if (rename(temp_file.c_str(), path.c_str()) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, int64_t size_limit) {
  std::string contents;
  int err = OsRead(path, size_limit, &contents);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return contents;
}

void File::Write(const std::string& path, const std::string& contents) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents);
  if (err)
    throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to) {
  Write(to, Read(from));
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
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return -1;
  return st.st_size;
}

bool File::Exists(const std::string& path) {
  return access(path.c_str(), F_OK) == 0;
}

absl::optional<double> File::ModificationTime(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return absl::nullopt;
  return static_cast<double>(st.st_mtim.tv_sec) +
         static_cast<double>(st.st_mtim.tv_nsec) * 1e-9;
}

TempDir::TempDir(const std::string& base) {
  MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Cannot remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
