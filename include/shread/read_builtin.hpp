#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>

#include "shread/acquisitor.hpp"
#include "shread/byte_budget.hpp"
#include "shread/env.hpp"
#include "shread/fd_io.hpp"
#include "shread/line_editor.hpp"
#include "shread/read_config.hpp"
#include "shread/status.hpp"

namespace shread {

struct ReadOutcome {
  ReadStatus status = ReadStatus::Success;
  Strategy strategy = Strategy::OneChar;
  std::uint64_t bytes = 0;    // raw bytes pulled from the descriptor
  std::size_t records = 0;    // acquisitions that succeeded
};

// Runs acquisition and field assignment for one validated invocation. With
// --line it acquires once per remaining slot; otherwise once.
class ReadBuiltin {
public:
  ReadBuiltin(Environment& env, LineEditor& editor, ByteBudget budget)
    : env_(env), editor_(editor), budget_(budget) {}

  void set_verbose(bool v) noexcept { verbose_ = v; }

  // `out` receives the record when cfg.to_stdout; `err` receives diagnostics.
  ReadOutcome run(const ReadConfig& cfg, const InputSource& in, std::ostream& out,
                  std::ostream& err);

private:
  Environment& env_;
  LineEditor& editor_;
  ByteBudget budget_;
  bool verbose_{false};
};

}
