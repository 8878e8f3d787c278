#pragma once
#include <cstddef>
#include <sys/types.h>

namespace shread {

// The descriptor a read invocation consumes from.
struct InputSource {
  int  fd = 0;
  bool directly_redirected = false; // exclusively ours: no need to rewind
  bool is_tty = false;

  // Samples isatty() once.
  static InputSource from_fd(int fd, bool directly_redirected = false);
};

// read(2) retried on EINTR. Returns bytes read, 0 at EOF, -1 on error.
ssize_t read_blocked(int fd, void* buf, std::size_t count);

bool is_seekable(int fd);

// lseek(fd, delta, SEEK_CUR); false on failure with errno set.
bool seek_relative(int fd, off_t delta);

}
