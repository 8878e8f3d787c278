#pragma once
#include <string>
#include <vector>

#include "shread/env.hpp"
#include "shread/read_builtin.hpp"

namespace shread {

class ReportWriter {
public:
  // {"status":..,"exit_code":..,"strategy":..,"bytes":..,"records":..,"vars":{name:[..]}}
  static std::string to_json(const ReadOutcome& r, const VarStore& vars,
                             const std::vector<std::string>& names);

  // One `name='value'` line per name, or `name=('a' 'b')` when `as_array`.
  static std::string to_shell(const VarStore& vars, const std::vector<std::string>& names,
                              bool as_array);
};

}
