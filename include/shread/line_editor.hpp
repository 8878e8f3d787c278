#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace shread {

struct EditorRequest {
  std::u32string prompt;                      // prompt command, opaque here
  std::optional<std::u32string> prompt_str;   // literal prompt text if known
  std::u32string right_prompt;
  std::optional<std::u32string> commandline;  // initial buffer
  std::size_t nchars = 0;                     // 0 = unbounded
  bool shell  = false;                        // syntax-aware editing
  bool silent = false;                        // do not echo input
  int  fd     = 0;
};

// Interactive line source. nullopt means the session was cancelled.
class LineEditor {
public:
  virtual ~LineEditor() = default;
  virtual std::optional<std::u32string> readline(const EditorRequest& req) = 0;
};

// Plain terminal editor: prompt on stderr, one cooked-mode line from req.fd.
class TtyLineEditor : public LineEditor {
public:
  std::optional<std::u32string> readline(const EditorRequest& req) override;
};

}
