#include "shread/read_config.hpp"

namespace shread {

const char32_t* const DEFAULT_READ_PROMPT =
    U"set_color green; echo -n read; set_color normal; echo -n \"> \"";

SplitMode ReadConfig::split_mode() const {
  if (tokenize) return SplitMode::Tokenize;
  if (!delimiter) return SplitMode::Ifs;
  return delimiter->empty() ? SplitMode::PerChar : SplitMode::Delimiter;
}

std::u32string escape_single_quoted(std::u32string_view s) {
  std::u32string out;
  out.reserve(s.size() + 2);
  out.push_back(U'\'');
  for (char32_t c : s) {
    if (c == U'\'') out += U"'\\''";
    else out.push_back(c);
  }
  out.push_back(U'\'');
  return out;
}

static bool fail(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

bool validate_read_config(ReadConfig& cfg, const Environment& env, std::string* err) {
  if (cfg.prompt && cfg.prompt_str)
    return fail(err, "Options -p and -P cannot be used together");
  if (cfg.delimiter && cfg.one_line)
    return fail(err, "Options --delimiter and --line cannot be used together");
  if (cfg.one_line && cfg.split_null)
    return fail(err, "Options -z and --line cannot be used together");

  if ((cfg.place & env_mode::EXPORT) && (cfg.place & env_mode::UNEXPORT))
    return fail(err, "cannot both export and unexport");

  int scopes = 0;
  for (EnvMode m : {env_mode::LOCAL, env_mode::FUNCTION, env_mode::GLOBAL, env_mode::UNIVERSAL})
    if (cfg.place & m) ++scopes;
  if (scopes > 1) return fail(err, "scope can be only one of: universal function global local");

  const std::size_t argc = cfg.vars.size();
  if (cfg.array && argc != 1)
    return fail(err, "expected 1 argument, got " + std::to_string(argc));
  if (cfg.to_stdout && argc > 0)
    return fail(err, "expected 0 arguments, got " + std::to_string(argc));
  if (!cfg.array && argc < 1 && !cfg.to_stdout)
    return fail(err, "expected at least 1 argument, got 0");

  if (cfg.tokenize && cfg.delimiter)
    return fail(err, "--delimiter and --tokenize are mutually exclusive");
  if (cfg.tokenize && cfg.one_line)
    return fail(err, "--line and --tokenize are mutually exclusive");

  for (const auto& name : cfg.vars) {
    if (!valid_var_name(name)) return fail(err, name + ": invalid variable name");
    if (env.is_read_only(name)) return fail(err, name + ": cannot overwrite read-only variable");
  }

  if (cfg.prompt_str) {
    cfg.prompt = U"echo " + escape_single_quoted(*cfg.prompt_str);
  } else if (!cfg.prompt) {
    cfg.prompt = std::u32string(DEFAULT_READ_PROMPT);
  }

  // --line is "read -d \n" repeated once per variable
  if (cfg.one_line) {
    cfg.delimiter = std::u32string(U"\n");
    cfg.split_null = false;
    cfg.shell = false;
  }
  return true;
}

}
