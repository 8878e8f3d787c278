#include "shread/field_splitter.hpp"
#include "shread/shell_tokenizer.hpp"
#include "shread/split.hpp"

#include <algorithm>

namespace shread {

void FieldSplitter::bind(std::size_t& next, std::vector<std::u32string> values) {
  env_.set(cfg_.vars[next], cfg_.place, std::move(values));
  ++next;
}

void FieldSplitter::clear_remaining(std::size_t& next) {
  while (slots_left(next) != 0) {
    env_.set_empty(cfg_.vars[next], cfg_.place);
    ++next;
  }
}

void FieldSplitter::assign(std::u32string_view record, std::size_t& next) {
  if (slots_left(next) == 0) return;

  switch (cfg_.split_mode()) {
    case SplitMode::Tokenize:
      assign_tokenized(record, next);
      return;
    case SplitMode::PerChar:
      assign_per_char(record, next);
      return;
    case SplitMode::Delimiter:
      assign_delimited(record, *cfg_.delimiter, next);
      return;
    case SplitMode::Ifs: {
      auto ifs = env_.get_unless_empty("IFS");
      if (!ifs) assign_per_char(record, next);
      else assign_ifs(record, *ifs, next);
      return;
    }
  }
}

void FieldSplitter::assign_tokenized(std::u32string_view record, std::size_t& next) {
  ShellTokenizer tok(record);
  auto word = [&](const Token& t) {
    std::u32string_view text = tok.text_of(t);
    auto out = unescape_string(text);
    return out ? std::move(*out) : std::u32string(text);
  };

  if (cfg_.array) {
    std::vector<std::u32string> tokens;
    while (auto t = tok.next()) tokens.push_back(word(*t));
    bind(next, std::move(tokens));
    return;
  }

  while (slots_left(next) > 1) {
    auto t = tok.next();
    if (!t) return;
    bind(next, {word(*t)});
  }
  // The last slot takes the raw rest of the line, starting at the next token.
  if (auto t = tok.next()) bind(next, {std::u32string(record.substr(t->offset))});
}

void FieldSplitter::assign_per_char(std::u32string_view record, std::size_t& next) {
  std::vector<std::u32string> chars;
  chars.reserve(std::max<std::size_t>(1, record.size()));
  for (std::size_t i = 0; i < record.size(); ++i) {
    if (cfg_.array || i + 1 < slots_left(next)) {
      chars.emplace_back(1, record[i]);
    } else {
      chars.emplace_back(record.substr(i));
      break;
    }
  }

  if (cfg_.array) {
    bind(next, std::move(chars));
    return;
  }
  for (auto& c : chars) bind(next, {std::move(c)});
}

void FieldSplitter::assign_ifs(std::u32string_view record, std::u32string_view ifs,
                               std::size_t& next) {
  if (cfg_.array) {
    bind(next, split_string_tok(record, ifs));
    return;
  }
  auto vals = split_string_tok(record, ifs, slots_left(next));
  std::size_t idx = 0;
  while (slots_left(next) != 0) {
    std::u32string v;
    if (idx < vals.size()) v = std::move(vals[idx++]);
    bind(next, {std::move(v)});
  }
}

void FieldSplitter::assign_delimited(std::u32string_view record, std::u32string_view delim,
                                     std::size_t& next) {
  if (cfg_.array) {
    bind(next, split_about(record, delim));
    return;
  }
  // Leave the last unfilled slot to take whatever follows the final split.
  auto pieces = split_about(record, delim, slots_left(next) - 1);
  for (auto& p : pieces) bind(next, {std::move(p)});
}

}
