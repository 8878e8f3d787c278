#include "shread/chunk_reader.hpp"
#include "shread/decoder.hpp"
#include "shread/fd_io.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string_view>
#include <vector>

namespace shread {

struct ChunkReader::Impl {
  int fd;
  Config cfg;
  ByteBudget budget;
  int last_errno{0};
  std::uint64_t bytes{0};

  ReadStatus read_record(std::u32string& out) {
    ReadStatus res = ReadStatus::Success;
    std::string narrow;
    std::vector<char> buf(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1);
    bool eof = false;

    while (true) {
      ssize_t n = read_blocked(fd, buf.data(), buf.size());
      if (n <= 0) { eof = true; break; }
      bytes += static_cast<std::uint64_t>(n);

      std::string_view block(buf.data(), static_cast<std::size_t>(n));
      std::size_t k = block.find(cfg.delimiter);
      if (k == std::string_view::npos) {
        narrow.append(block);
        if (budget.exceeded(narrow.size())) {
          res = ReadStatus::ReadTooMuch;
          break;
        }
        continue;
      }

      narrow.append(block.substr(0, k));
      // The delimiter counts as consumed; everything after it goes back.
      if (cfg.rollback) {
        off_t delta = static_cast<off_t>(k) - static_cast<off_t>(n) + 1;
        if (!seek_relative(fd, delta)) {
          last_errno = errno;
          std::cerr << "[read] lseek: " << std::strerror(last_errno) << "\n";
          return ReadStatus::CmdFailure;
        }
      }
      break;
    }

    out = str2text(narrow);
    if (out.empty() && eof) res = ReadStatus::CmdFailure;
    return res;
  }
};

ChunkReader::ChunkReader(int fd, ByteBudget budget)
  : ChunkReader(fd, Config{}, budget) {}

ChunkReader::ChunkReader(int fd, Config cfg, ByteBudget budget)
  : p_(new Impl{fd, cfg, budget}) {}

ChunkReader::~ChunkReader() { delete p_; }

ReadStatus ChunkReader::read_record(std::u32string& out) { return p_->read_record(out); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
