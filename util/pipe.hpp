#ifndef UTIL_PIPE_HPP
#define UTIL_PIPE_HPP

namespace util {

// Owns a file descriptor and closes it when destroyed.
class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { Close(); }

  FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.Release()) {}
  FileDescriptor& operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.Release();
    }
    return *this;
  }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const { return fd_; }
  bool Valid() const { return fd_ != -1; }
  int Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  void Close();

 private:
  int fd_ = -1;
};

// A unidirectional pipe. Both ends are close-on-exec, so that a child only
// receives the ends explicitly redirected to its standard streams.
struct Pipe {
  FileDescriptor read;
  FileDescriptor write;

  // Throws std::system_error if the pipe cannot be created.
  static Pipe Create();
};

}  // namespace util

#endif
