#pragma once
#include <ostream>
#include <string>

#include "shread/read_config.hpp"

namespace shread {

struct CliOptions {
  ReadConfig read;
  std::string config_path;   // JSON settings file
  std::string input_path;    // read from this file instead of stdin
  bool json    = false;      // print assignments as JSON
  bool verbose = false;
};

// getopt_long over the read builtin's flags plus the driver's own. Names
// left after the options become destination slots. Returns false with *err
// set on a usage error.
bool parse_args(int argc, char** argv, CliOptions& opts, std::string* err);

void print_usage(std::ostream& os);

}
