#include "shread/split.hpp"

namespace shread {

std::vector<std::u32string> split_string_tok(std::u32string_view val, std::u32string_view seps,
                                             std::size_t max_results) {
  std::vector<std::u32string> out;
  const std::size_t end = val.size();
  std::size_t pos = 0;
  while (pos < end && out.size() + 1 < max_results) {
    pos = val.find_first_not_of(seps, pos);
    if (pos == std::u32string_view::npos) return out;
    std::size_t next = val.find_first_of(seps, pos);
    if (next == std::u32string_view::npos) next = end;
    out.emplace_back(val.substr(pos, next - pos));
    // skip exactly one separator; the final token keeps interior runs
    pos = next + 1;
  }

  if (pos < end && max_results > 0) {
    pos = val.find_first_not_of(seps, pos);
    if (pos != std::u32string_view::npos) {
      std::size_t last = val.find_last_not_of(seps);
      out.emplace_back(val.substr(pos, last + 1 - pos));
    }
  }
  return out;
}

std::vector<std::u32string> split_about(std::u32string_view val, std::u32string_view sep,
                                        std::size_t max_splits, bool no_empty) {
  std::vector<std::u32string> out;
  std::u32string_view rest = val;
  std::size_t remaining = max_splits;
  while (remaining > 0 && !rest.empty()) {
    std::size_t at;
    if (sep.empty()) {
      if (rest.size() == 1) break;
      at = 1;
    } else {
      at = rest.find(sep);
      if (at == std::u32string_view::npos) break;
    }
    if (!no_empty || at != 0) out.emplace_back(rest.substr(0, at));
    rest.remove_prefix(at + sep.size());
    --remaining;
  }
  if (!no_empty || !rest.empty()) out.emplace_back(rest);
  return out;
}

}
