#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "shread/byte_budget.hpp"

namespace shread {

// Process-level knobs read by the driver and handed to the engine.
struct Settings {
  std::size_t read_byte_limit = kDefaultReadByteLimit; // 0 = unlimited
  std::u32string ifs = U" \n\t";
  std::vector<std::string> read_only;                 // names read may not assign

  ByteBudget budget() const { return ByteBudget{read_byte_limit}; }
};

// Overlays keys present in a JSON file:
//   {"read_byte_limit": 1048576, "ifs": " \t\n", "read_only": ["PWD"]}
// Unknown keys are logged and skipped.
bool load_settings_file(const std::string& path, Settings& s, std::string* err);

// SHREAD_READ_LIMIT, when set and non-empty, replaces read_byte_limit.
bool apply_env_overrides(Settings& s, std::string* err);

}
