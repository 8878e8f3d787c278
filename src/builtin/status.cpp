#include "shread/status.hpp"

namespace shread {

int exit_code(ReadStatus s) noexcept {
  switch (s) {
    case ReadStatus::Success:     return 0;
    case ReadStatus::CmdFailure:  return 1;
    case ReadStatus::InvalidArgs: return 2;
    case ReadStatus::ReadTooMuch: return 122;
  }
  return 1;
}

const char* to_string(ReadStatus s) noexcept {
  switch (s) {
    case ReadStatus::Success:     return "success";
    case ReadStatus::CmdFailure:  return "cmd_failure";
    case ReadStatus::InvalidArgs: return "invalid_args";
    case ReadStatus::ReadTooMuch: return "read_too_much";
  }
  return "unknown";
}

}
