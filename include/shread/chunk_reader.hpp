#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "shread/byte_budget.hpp"
#include "shread/status.hpp"

namespace shread {

// Reads one delimiter-terminated record from a seekable or exclusively owned
// descriptor in fixed-size chunks. With rollback on, the descriptor is left
// positioned just past the delimiter so later readers see the rest.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 128;   // same as bash
    char        delimiter   = '\n';
    bool        rollback    = true;  // seek back over bytes past the delimiter
  };

  ChunkReader(int fd, ByteBudget budget);      // uses default Config{}
  ChunkReader(int fd, Config cfg, ByteBudget budget);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Over budget returns ReadTooMuch with everything read so far in `out`.
  ReadStatus read_record(std::u32string& out);

  int  last_error() const noexcept;            // errno of a failed seek
  std::uint64_t bytes_read() const noexcept;   // raw bytes, all calls

private:
  struct Impl; Impl* p_;
};

}
