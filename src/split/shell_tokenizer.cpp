#include "shread/shell_tokenizer.hpp"
#include "shread/decoder.hpp"

namespace shread {

namespace {

bool is_token_space(char32_t c) noexcept {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r';
}

}

std::optional<Token> ShellTokenizer::next() {
  const std::size_t end = src_.size();
  while (pos_ < end && is_token_space(src_[pos_])) ++pos_;
  if (pos_ >= end) return std::nullopt;

  enum class Mode { Unquoted, Single, Double } mode = Mode::Unquoted;
  const std::size_t start = pos_;
  for (; pos_ < end; ++pos_) {
    char32_t c = src_[pos_];
    switch (mode) {
      case Mode::Unquoted:
        if (is_token_space(c)) return Token{start, pos_ - start};
        if (c == U'\\') { if (pos_ + 1 < end) ++pos_; }
        else if (c == U'\'') mode = Mode::Single;
        else if (c == U'"') mode = Mode::Double;
        break;
      case Mode::Single:
        if (c == U'\\') { if (pos_ + 1 < end) ++pos_; }
        else if (c == U'\'') mode = Mode::Unquoted;
        break;
      case Mode::Double:
        if (c == U'\\') { if (pos_ + 1 < end) ++pos_; }
        else if (c == U'"') mode = Mode::Unquoted;
        break;
    }
  }
  return Token{start, end - start};
}

static int hex_value(char32_t c) {
  if (c >= U'0' && c <= U'9') return int(c - U'0');
  if (c >= U'a' && c <= U'f') return int(c - U'a') + 10;
  if (c >= U'A' && c <= U'F') return int(c - U'A') + 10;
  return -1;
}

// Resolves one escape starting after the backslash at in[i]. Advances i past it.
static void unescape_one(std::u32string_view in, std::size_t& i, std::u32string& out) {
  char32_t c = in[i++];
  switch (c) {
    case U'a': out.push_back(U'\a'); return;
    case U'b': out.push_back(U'\b'); return;
    case U'e': out.push_back(U'\x1B'); return;
    case U'f': out.push_back(U'\f'); return;
    case U'n': out.push_back(U'\n'); return;
    case U'r': out.push_back(U'\r'); return;
    case U't': out.push_back(U'\t'); return;
    case U'v': out.push_back(U'\v'); return;
    case U'c':
      if (i < in.size()) { out.push_back(in[i++] & 0x1F); return; }
      out.push_back(c);
      return;
    case U'x': case U'X': case U'u': case U'U': {
      const std::size_t max_digits = (c == U'u') ? 4 : (c == U'U') ? 8 : 2;
      char32_t v = 0;
      std::size_t n = 0;
      for (; n < max_digits && i < in.size() && hex_value(in[i]) >= 0; ++n, ++i)
        v = v * 16 + char32_t(hex_value(in[i]));
      if (n == 0) { out.push_back(c); return; }
      // \xHH names a byte, not a code point
      if ((c == U'x' || c == U'X') && v > 0x7F) out.push_back(encode_byte_to_char((unsigned char)v));
      else out.push_back(v > 0x10FFFF ? char32_t(0xFFFD) : v);
      return;
    }
    default:
      break;
  }
  if (c >= U'0' && c <= U'7') {
    char32_t v = c - U'0';
    for (int n = 1; n < 3 && i < in.size() && in[i] >= U'0' && in[i] <= U'7'; ++n, ++i)
      v = v * 8 + (in[i] - U'0');
    if (v > 0x7F) out.push_back(encode_byte_to_char((unsigned char)(v & 0xFF)));
    else out.push_back(v);
    return;
  }
  out.push_back(c);
}

std::optional<std::u32string> unescape_string(std::u32string_view in) {
  std::u32string out;
  out.reserve(in.size());
  enum class Mode { Unquoted, Single, Double } mode = Mode::Unquoted;

  std::size_t i = 0;
  while (i < in.size()) {
    char32_t c = in[i++];
    switch (mode) {
      case Mode::Unquoted:
        if (c == U'\\') {
          if (i >= in.size()) return std::nullopt;
          unescape_one(in, i, out);
        } else if (c == U'\'') {
          mode = Mode::Single;
        } else if (c == U'"') {
          mode = Mode::Double;
        } else {
          out.push_back(c);
        }
        break;
      case Mode::Single:
        if (c == U'\\' && i < in.size() && (in[i] == U'\\' || in[i] == U'\'')) {
          out.push_back(in[i++]);
        } else if (c == U'\'') {
          mode = Mode::Unquoted;
        } else {
          out.push_back(c);
        }
        break;
      case Mode::Double:
        if (c == U'\\' && i < in.size() &&
            (in[i] == U'\\' || in[i] == U'"' || in[i] == U'$' || in[i] == U'\n')) {
          if (in[i] != U'\n') out.push_back(in[i]);  // backslash-newline joins lines
          ++i;
        } else if (c == U'"') {
          mode = Mode::Unquoted;
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  if (mode != Mode::Unquoted) return std::nullopt;
  return out;
}

}
