#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace shread {

// Bytes that are not valid UTF-8 are carried through as code points in a
// private-use block so they survive a decode/encode cycle unchanged.
constexpr char32_t ENCODE_DIRECT_BASE = 0xF600;

constexpr char32_t encode_byte_to_char(unsigned char b) { return ENCODE_DIRECT_BASE + b; }
constexpr bool is_encoded_byte(char32_t c) {
  return c >= ENCODE_DIRECT_BASE && c < ENCODE_DIRECT_BASE + 256;
}

enum class DecodeState { Incomplete, Complete, Error };
enum class InvalidPolicy { Error, Passthrough };

// Incremental UTF-8 decoder fed one byte at a time.
// Complete means at least one code point was appended to `out`.
class ByteDecoder {
public:
  explicit ByteDecoder(InvalidPolicy policy = InvalidPolicy::Passthrough) : policy_(policy) {}

  DecodeState feed(unsigned char byte, std::u32string& out);

  // Emit a dangling partial sequence as encoded bytes (end of input).
  void flush(std::u32string& out);

  bool pending() const noexcept { return len_ != 0; }
  void reset() noexcept { len_ = 0; need_ = 0; }

private:
  DecodeState start(unsigned char byte, std::u32string& out);
  void emit_buffered(std::u32string& out);

  InvalidPolicy policy_;
  unsigned char buf_[4]{};
  std::size_t len_{0};
  std::size_t need_{0};
};

// Whole-buffer conversions built on ByteDecoder.
std::u32string str2text(std::string_view bytes);
std::string text2str(std::u32string_view text);

}
