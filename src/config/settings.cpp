#include "shread/settings.hpp"
#include "shread/decoder.hpp"
#include "shread/number_parse.hpp"

#include <simdjson.h>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace shread {

bool load_settings_file(const std::string& path, Settings& s, std::string* err) {
  simdjson::padded_string json;
  if (auto ec = simdjson::padded_string::load(path).get(json)) {
    if (err) *err = path + ": " + simdjson::error_message(ec);
    return false;
  }

  simdjson::ondemand::parser parser;
  Settings next = s;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();
      if (key == "read_byte_limit") {
        next.read_byte_limit = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "ifs") {
        next.ifs = str2text(v.get_string().value());
      } else if (key == "read_only") {
        next.read_only.clear();
        for (auto item : v.get_array()) next.read_only.emplace_back(item.get_string().value());
      } else {
        std::cerr << "[config] " << path << ": ignoring unknown key '" << key << "'\n";
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = path + ": " + e.what();
    return false;
  }

  s = std::move(next);
  return true;
}

bool apply_env_overrides(Settings& s, std::string* err) {
  const char* v = std::getenv("SHREAD_READ_LIMIT");
  if (!v || !*v) return true;
  auto n = parse_count(v);
  if (!n) {
    if (err) *err = std::string("SHREAD_READ_LIMIT: invalid value '") + v + "'";
    return false;
  }
  s.read_byte_limit = static_cast<std::size_t>(*n);
  return true;
}

}
