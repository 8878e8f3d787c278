#pragma once

namespace shread {

enum class ReadStatus { Success, CmdFailure, ReadTooMuch, InvalidArgs };

int exit_code(ReadStatus s) noexcept;
const char* to_string(ReadStatus s) noexcept;

}
