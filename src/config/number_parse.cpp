#include "shread/number_parse.hpp"
#include <fast_float/fast_float.h>
#include <system_error>

namespace shread {

static bool blank(char c) { return c == ' ' || c == '\t' || c == '\n'; }

std::optional<std::uint64_t> parse_count(std::string_view s, NumberError* why) {
  auto set = [&](NumberError e) { if (why) *why = e; };
  while (!s.empty() && blank(s.front())) s.remove_prefix(1);
  while (!s.empty() && blank(s.back()))  s.remove_suffix(1);

  std::int64_t v = 0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec == std::errc::result_out_of_range) { set(NumberError::OutOfRange); return std::nullopt; }
  if (ec != std::errc() || ptr != s.data() + s.size() || v < 0) {
    set(NumberError::NotANumber);
    return std::nullopt;
  }
  set(NumberError::None);
  return static_cast<std::uint64_t>(v);
}

}
