#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "shread/env.hpp"

namespace shread {

enum class SplitMode { Ifs, Delimiter, PerChar, Tokenize };

// Options for one invocation. Validated once, then treated as immutable.
struct ReadConfig {
  // Set when -d was given; an empty delimiter means split per character.
  std::optional<std::u32string> delimiter;
  bool tokenize   = false;
  bool array      = false;
  bool split_null = false;      // records end at NUL instead of newline
  std::size_t nchars = 0;       // 0 = unbounded
  bool one_line   = false;      // one record per destination slot
  bool silent     = false;
  bool shell      = false;
  bool to_stdout  = false;      // no names given: echo the record
  bool print_help = false;

  std::optional<std::u32string> prompt;      // prompt command
  std::optional<std::u32string> prompt_str;  // literal prompt text
  std::u32string right_prompt;
  std::optional<std::u32string> commandline; // initial editor contents

  EnvMode place = env_mode::USER;
  std::vector<std::string> vars;

  SplitMode split_mode() const;
  char32_t record_delimiter() const { return split_null ? U'\0' : U'\n'; }
};

extern const char32_t* const DEFAULT_READ_PROMPT;

// Checks option combinations and variable names against `env`, then fills
// defaults (prompt, --line normalization). On failure returns false with a
// message suitable for "read: <msg>".
bool validate_read_config(ReadConfig& cfg, const Environment& env, std::string* err);

// Quote `s` so a shell reads it back as one literal word.
std::u32string escape_single_quoted(std::u32string_view s);

}
