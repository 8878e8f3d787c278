#pragma once
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace shread {

constexpr std::size_t kNoLimit = std::numeric_limits<std::size_t>::max();

// IFS-style: every char of `seps` separates, runs collapse, leading seps are
// skipped. Once max_results - 1 tokens exist the trimmed rest is the last one.
std::vector<std::u32string> split_string_tok(std::u32string_view val, std::u32string_view seps,
                                             std::size_t max_results = kNoLimit);

// `string split` style: `sep` is one multi-char separator, at most
// `max_splits` splits, the remainder is always the final element.
std::vector<std::u32string> split_about(std::u32string_view val, std::u32string_view sep,
                                        std::size_t max_splits = kNoLimit, bool no_empty = false);

}
