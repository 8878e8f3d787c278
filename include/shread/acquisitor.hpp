#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "shread/byte_budget.hpp"
#include "shread/fd_io.hpp"
#include "shread/line_editor.hpp"
#include "shread/read_config.hpp"
#include "shread/status.hpp"

namespace shread {

enum class Strategy { Interactive, Chunked, OneChar };

const char* to_string(Strategy s) noexcept;

// Terminal (unless splitting on NUL) -> Interactive; seekable or exclusively
// owned, no char limit, not --line -> Chunked; anything else -> OneChar.
Strategy select_strategy(const ReadConfig& cfg, const InputSource& in);

// Delegates to the editor. Output longer than cfg.nchars is cut, not requeued.
ReadStatus read_interactive(LineEditor& editor, const ReadConfig& cfg, int fd, std::u32string& out);

// One read(2) per byte so nothing past the delimiter is consumed.
ReadStatus read_one_char_at_a_time(int fd, std::u32string& out, std::size_t nchars,
                                   bool split_null, const ByteBudget& budget,
                                   std::uint64_t* nbytes = nullptr);

// Produces one record per acquire() with the strategy fixed at construction.
class InputAcquisitor {
public:
  InputAcquisitor(const ReadConfig& cfg, const InputSource& in, ByteBudget budget,
                  LineEditor& editor);

  ReadStatus acquire(std::u32string& out);

  Strategy strategy() const noexcept { return strategy_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  const ReadConfig& cfg_;
  InputSource in_;
  ByteBudget budget_;
  LineEditor& editor_;
  Strategy strategy_;
  std::uint64_t bytes_{0};
};

}
