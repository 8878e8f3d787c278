#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace shread {

enum class NumberError { None, NotANumber, OutOfRange };

// Non-negative decimal integer (fast_float). Surrounding blanks are allowed.
std::optional<std::uint64_t> parse_count(std::string_view s, NumberError* why = nullptr);

}
