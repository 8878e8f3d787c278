#include "shread/decoder.hpp"

namespace shread {

DecodeState ByteDecoder::start(unsigned char byte, std::u32string& out) {
  if (byte < 0x80) { out.push_back(static_cast<char32_t>(byte)); return DecodeState::Complete; }

  std::size_t need = 0;
  if (byte >= 0xC2 && byte <= 0xDF)      need = 2;
  else if (byte >= 0xE0 && byte <= 0xEF) need = 3;
  else if (byte >= 0xF0 && byte <= 0xF4) need = 4;

  if (need == 0) {
    // stray continuation byte, overlong lead (C0/C1) or out of range (F5..FF)
    if (policy_ == InvalidPolicy::Error) return DecodeState::Error;
    out.push_back(encode_byte_to_char(byte));
    return DecodeState::Complete;
  }

  buf_[0] = byte;
  len_ = 1;
  need_ = need;
  return DecodeState::Incomplete;
}

void ByteDecoder::emit_buffered(std::u32string& out) {
  for (std::size_t i = 0; i < len_; ++i) out.push_back(encode_byte_to_char(buf_[i]));
  reset();
}

DecodeState ByteDecoder::feed(unsigned char byte, std::u32string& out) {
  if (len_ == 0) return start(byte, out);

  bool ok = (byte & 0xC0) == 0x80;
  if (ok && len_ == 1) {
    // second-byte ranges that rule out overlongs, surrogates and > U+10FFFF
    const unsigned char lead = buf_[0];
    if (lead == 0xE0 && byte < 0xA0) ok = false;
    else if (lead == 0xED && byte > 0x9F) ok = false;
    else if (lead == 0xF0 && byte < 0x90) ok = false;
    else if (lead == 0xF4 && byte > 0x8F) ok = false;
  }

  if (!ok) {
    if (policy_ == InvalidPolicy::Error) { reset(); return DecodeState::Error; }
    emit_buffered(out);
    // The byte that broke the sequence may itself be a delimiter or a new lead.
    (void)start(byte, out);
    return DecodeState::Complete;
  }

  buf_[len_++] = byte;
  if (len_ < need_) return DecodeState::Incomplete;

  char32_t cp = 0;
  switch (need_) {
    case 2:
      cp = (char32_t(buf_[0] & 0x1F) << 6) | char32_t(buf_[1] & 0x3F);
      break;
    case 3:
      cp = (char32_t(buf_[0] & 0x0F) << 12) | (char32_t(buf_[1] & 0x3F) << 6) |
           char32_t(buf_[2] & 0x3F);
      break;
    default:
      cp = (char32_t(buf_[0] & 0x07) << 18) | (char32_t(buf_[1] & 0x3F) << 12) |
           (char32_t(buf_[2] & 0x3F) << 6) | char32_t(buf_[3] & 0x3F);
      break;
  }

  if (is_encoded_byte(cp)) {
    // A literal private-use char would be indistinguishable from an encoded byte.
    emit_buffered(out);
  } else {
    out.push_back(cp);
    reset();
  }
  return DecodeState::Complete;
}

void ByteDecoder::flush(std::u32string& out) {
  if (len_ != 0) emit_buffered(out);
}

std::u32string str2text(std::string_view bytes) {
  std::u32string out;
  out.reserve(bytes.size());
  ByteDecoder dec(InvalidPolicy::Passthrough);
  for (char c : bytes) (void)dec.feed(static_cast<unsigned char>(c), out);
  dec.flush(out);
  return out;
}

std::string text2str(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t c : text) {
    if (is_encoded_byte(c)) {
      out.push_back(static_cast<char>(c - ENCODE_DIRECT_BASE));
    } else if (c < 0x80) {
      out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (c >> 6)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (c >> 12)));
      out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0x10FFFF) {
      out.push_back(static_cast<char>(0xF0 | (c >> 18)));
      out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
      out.append("\xEF\xBF\xBD"); // U+FFFD
    }
  }
  return out;
}

}
