#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace shread {

struct Token {
  std::size_t offset = 0;
  std::size_t length = 0;
};

// Splits a line into shell words. Quotes and backslashes keep whitespace
// inside a word; an unterminated quote runs to the end of input.
class ShellTokenizer {
public:
  explicit ShellTokenizer(std::u32string_view src) : src_(src) {}

  std::optional<Token> next();
  std::u32string_view text_of(const Token& t) const { return src_.substr(t.offset, t.length); }

private:
  std::u32string_view src_;
  std::size_t pos_{0};
};

// Removes quoting and resolves backslash escapes. nullopt on an unterminated
// quote or a trailing lone backslash.
std::optional<std::u32string> unescape_string(std::u32string_view in);

}
