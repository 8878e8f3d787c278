#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "shread/env.hpp"
#include "shread/read_config.hpp"

namespace shread {

// Distributes one record over the destination slots of `cfg`, left to right.
// The slot cursor is shared with the caller so --line can fill slots across
// several records.
class FieldSplitter {
public:
  FieldSplitter(const ReadConfig& cfg, Environment& env) : cfg_(cfg), env_(env) {}

  // Assigns from slot `next` onward and advances it past every slot written.
  void assign(std::u32string_view record, std::size_t& next);

  // Binds every slot from `next` on to an empty value.
  void clear_remaining(std::size_t& next);

  std::size_t slots_left(std::size_t next) const noexcept { return cfg_.vars.size() - next; }

private:
  void bind(std::size_t& next, std::vector<std::u32string> values);

  void assign_tokenized(std::u32string_view record, std::size_t& next);
  void assign_per_char(std::u32string_view record, std::size_t& next);
  void assign_ifs(std::u32string_view record, std::u32string_view ifs, std::size_t& next);
  void assign_delimited(std::u32string_view record, std::u32string_view delim, std::size_t& next);

  const ReadConfig& cfg_;
  Environment& env_;
};

}
