#include "shread/fd_io.hpp"
#include <cerrno>
#include <unistd.h>

namespace shread {

InputSource InputSource::from_fd(int fd, bool directly_redirected) {
  InputSource s;
  s.fd = fd;
  s.directly_redirected = directly_redirected;
  s.is_tty = fd >= 0 && ::isatty(fd) == 1;
  return s;
}

ssize_t read_blocked(int fd, void* buf, std::size_t count) {
  while (true) {
    ssize_t n = ::read(fd, buf, count);
    if (n < 0 && errno == EINTR) continue;
    return n;
  }
}

bool is_seekable(int fd) { return ::lseek(fd, 0, SEEK_CUR) != -1; }

bool seek_relative(int fd, off_t delta) { return ::lseek(fd, delta, SEEK_CUR) != -1; }

}
