#include "shread/line_editor.hpp"
#include "shread/decoder.hpp"
#include "shread/fd_io.hpp"

#include <termios.h>
#include <unistd.h>

namespace shread {

namespace {

// Turns terminal echo off for the lifetime of the guard.
class EchoOff {
public:
  EchoOff(int fd, bool enable) : fd_(fd) {
    if (!enable || ::tcgetattr(fd_, &saved_) != 0) return;
    struct termios t = saved_;
    t.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    active_ = ::tcsetattr(fd_, TCSANOW, &t) == 0;
  }
  ~EchoOff() {
    if (active_) (void)::tcsetattr(fd_, TCSADRAIN, &saved_);
  }
  EchoOff(const EchoOff&) = delete;
  EchoOff& operator=(const EchoOff&) = delete;
  bool active() const noexcept { return active_; }

private:
  int fd_;
  struct termios saved_{};
  bool active_{false};
};

void write_all(int fd, const std::string& s) {
  std::size_t off = 0;
  while (off < s.size()) {
    ssize_t n = ::write(fd, s.data() + off, s.size() - off);
    if (n <= 0) return;
    off += static_cast<std::size_t>(n);
  }
}

}

std::optional<std::u32string> TtyLineEditor::readline(const EditorRequest& req) {
  std::u32string prompt = req.prompt_str ? *req.prompt_str : std::u32string(U"read> ");
  std::u32string line = req.commandline.value_or(std::u32string{});
  write_all(STDERR_FILENO, text2str(prompt) + text2str(line));

  EchoOff echo_off(req.fd, req.silent);
  ByteDecoder dec;
  bool typed = false;
  bool eof = false;
  while (true) {
    unsigned char b = 0;
    if (read_blocked(req.fd, &b, 1) <= 0) { eof = true; break; }
    typed = true;
    if (dec.feed(b, line) == DecodeState::Complete && line.back() == U'\n') {
      line.pop_back();
      break;
    }
  }
  dec.flush(line);
  if (echo_off.active()) write_all(STDERR_FILENO, "\n");

  if (eof && !typed) return std::nullopt;
  return line;
}

}
