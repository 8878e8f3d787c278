#include "shread/read_builtin.hpp"
#include "shread/decoder.hpp"
#include "shread/field_splitter.hpp"

#include <string>

namespace shread {

ReadOutcome ReadBuiltin::run(const ReadConfig& cfg, const InputSource& in, std::ostream& out,
                             std::ostream& err) {
  ReadOutcome res;
  FieldSplitter splitter(cfg, env_);
  std::size_t next = 0;

  if (in.fd < 0) {
    err << "read: stdin is closed\n";
    res.status = ReadStatus::CmdFailure;
    return res;
  }

  InputAcquisitor acq(cfg, in, budget_, editor_);
  res.strategy = acq.strategy();
  if (verbose_) err << "[read] strategy=" << to_string(res.strategy) << "\n";

  enum class State { Looping, Done } state = State::Looping;
  std::u32string buff;
  while (state == State::Looping) {
    res.status = acq.acquire(buff);
    res.bytes = acq.bytes_read();

    if (res.status != ReadStatus::Success) {
      splitter.clear_remaining(next);
      break;
    }
    ++res.records;

    if (cfg.to_stdout) {
      out << text2str(buff);
      break;
    }

    splitter.assign(buff, next);
    if (!cfg.one_line || splitter.slots_left(next) == 0) state = State::Done;
  }

  // more slots than fields
  if (!cfg.array) splitter.clear_remaining(next);

  if (verbose_) {
    err << "[read] status=" << to_string(res.status) << " records=" << res.records
        << " bytes=" << res.bytes << "\n";
  }
  return res;
}

}
