#include "util/pipe.hpp"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace util {

void FileDescriptor::Close() {
  if (fd_ == -1) return;
  close(fd_);
  fd_ = -1;
}

Pipe Pipe::Create() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1)
    throw std::system_error(errno, std::system_category(), "pipe2");
  Pipe result;
  result.read = FileDescriptor(fds[0]);
  result.write = FileDescriptor(fds[1]);
  return result;
}

}  // namespace util
