#include "shread/acquisitor.hpp"
#include "shread/chunk_reader.hpp"
#include "shread/decoder.hpp"

namespace shread {

const char* to_string(Strategy s) noexcept {
  switch (s) {
    case Strategy::Interactive: return "interactive";
    case Strategy::Chunked:     return "chunked";
    case Strategy::OneChar:     return "one_char";
  }
  return "unknown";
}

Strategy select_strategy(const ReadConfig& cfg, const InputSource& in) {
  if (in.is_tty && !cfg.split_null) return Strategy::Interactive;
  // --line could pull several records into one chunk, so it never chunks.
  if (cfg.nchars == 0 && !in.is_tty && !cfg.one_line &&
      (in.directly_redirected || is_seekable(in.fd)))
    return Strategy::Chunked;
  return Strategy::OneChar;
}

ReadStatus read_interactive(LineEditor& editor, const ReadConfig& cfg, int fd, std::u32string& out) {
  EditorRequest req;
  req.prompt = cfg.prompt.value_or(std::u32string(DEFAULT_READ_PROMPT));
  req.prompt_str = cfg.prompt_str;
  req.right_prompt = cfg.right_prompt;
  req.commandline = cfg.commandline;
  req.nchars = cfg.nchars;
  req.shell = cfg.shell;
  req.silent = cfg.silent;
  req.fd = fd;

  auto line = editor.readline(req);
  if (!line) return ReadStatus::CmdFailure;

  out = std::move(*line);
  // Key bindings may insert text beyond the limit; that tail was never typed.
  if (cfg.nchars > 0 && cfg.nchars < out.size()) out.resize(cfg.nchars);
  return ReadStatus::Success;
}

ReadStatus read_one_char_at_a_time(int fd, std::u32string& out, std::size_t nchars,
                                   bool split_null, const ByteBudget& budget,
                                   std::uint64_t* nbytes_out) {
  ReadStatus res = ReadStatus::Success;
  const char32_t delim = split_null ? U'\0' : U'\n';
  std::size_t nbytes = 0;
  ByteDecoder dec(InvalidPolicy::Passthrough);

  while (true) {
    const std::size_t chars_read = out.size();
    bool complete = false;
    while (true) {
      unsigned char b = 0;
      if (read_blocked(fd, &b, 1) <= 0) break;
      ++nbytes;
      if (budget.exceeded(nbytes)) {
        // the char that crossed the ceiling is not kept
        out.resize(chars_read);
        if (nbytes_out) *nbytes_out += nbytes;
        return ReadStatus::ReadTooMuch;
      }
      if (dec.feed(b, out) == DecodeState::Complete) { complete = true; break; }
    }

    if (!complete) {
      dec.flush(out);
      if (out.empty()) res = ReadStatus::CmdFailure;
      break;
    }
    if (out.back() == delim) {
      out.pop_back();
      break;
    }
    if (nchars > 0 && nchars <= out.size()) {
      // a lead byte left over from a broken sequence goes out as a byte
      dec.flush(out);
      break;
    }
  }

  if (nbytes_out) *nbytes_out += nbytes;
  return res;
}

InputAcquisitor::InputAcquisitor(const ReadConfig& cfg, const InputSource& in, ByteBudget budget,
                                 LineEditor& editor)
  : cfg_(cfg), in_(in), budget_(budget), editor_(editor),
    strategy_(select_strategy(cfg, in)) {}

ReadStatus InputAcquisitor::acquire(std::u32string& out) {
  out.clear();
  switch (strategy_) {
    case Strategy::Interactive:
      return read_interactive(editor_, cfg_, in_.fd, out);
    case Strategy::Chunked: {
      ChunkReader::Config rcfg;
      rcfg.delimiter = cfg_.split_null ? '\0' : '\n';
      // A directly redirected stream is about to be closed; no point rewinding.
      rcfg.rollback = !in_.directly_redirected;
      ChunkReader reader(in_.fd, rcfg, budget_);
      ReadStatus res = reader.read_record(out);
      bytes_ += reader.bytes_read();
      return res;
    }
    case Strategy::OneChar:
      return read_one_char_at_a_time(in_.fd, out, cfg_.nchars, cfg_.split_null, budget_, &bytes_);
  }
  return ReadStatus::CmdFailure;
}

}
