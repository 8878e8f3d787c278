#include "shread/args.hpp"
#include "shread/line_editor.hpp"
#include "shread/read_builtin.hpp"
#include "shread/read_config.hpp"
#include "shread/report.hpp"
#include "shread/settings.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

// Closes an fd we opened for --input.
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  int get() const noexcept { return fd_; }
private:
  int fd_;
};

bool load_settings(const shread::CliOptions& cli, shread::Settings& s) {
  std::string err;
  if (!cli.config_path.empty() && !shread::load_settings_file(cli.config_path, s, &err)) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  if (!shread::apply_env_overrides(s, &err)) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  return true;
}

}

int main(int argc, char** argv) {
  shread::CliOptions cli;
  std::string err;
  if (!shread::parse_args(argc, argv, cli, &err)) {
    std::cerr << "read: " << err << "\n";
    return shread::exit_code(shread::ReadStatus::InvalidArgs);
  }
  if (cli.read.print_help) {
    shread::print_usage(std::cout);
    return 0;
  }

  shread::Settings settings;
  if (!load_settings(cli, settings)) return shread::exit_code(shread::ReadStatus::InvalidArgs);

  shread::VarStore vars;
  vars.set("IFS", shread::env_mode::GLOBAL, {settings.ifs});
  for (const auto& name : settings.read_only) vars.mark_read_only(name);
  if (cli.verbose) {
    vars.add_listener([](const std::string& name, const shread::VarStore::Var& v) {
      std::cerr << "[shread] set " << name << " (" << v.values.size() << " values)\n";
    });
  }

  if (!shread::validate_read_config(cli.read, vars, &err)) {
    std::cerr << "read: " << err << "\n";
    return shread::exit_code(shread::ReadStatus::InvalidArgs);
  }

  // A file opened here belongs to us alone, so it need not be rewound.
  FdGuard owned(cli.input_path.empty() ? -1 : ::open(cli.input_path.c_str(), O_RDONLY));
  if (!cli.input_path.empty() && owned.get() < 0) {
    std::cerr << "[shread] " << cli.input_path << ": " << std::strerror(errno) << "\n";
    return shread::exit_code(shread::ReadStatus::CmdFailure);
  }
  const shread::InputSource in = owned.get() >= 0
      ? shread::InputSource::from_fd(owned.get(), true)
      : shread::InputSource::from_fd(STDIN_FILENO, false);

  shread::TtyLineEditor editor;
  shread::ReadBuiltin builtin(vars, editor, settings.budget());
  builtin.set_verbose(cli.verbose);
  const shread::ReadOutcome res = builtin.run(cli.read, in, std::cout, std::cerr);

  if (!cli.read.to_stdout) {
    if (cli.json) std::cout << shread::ReportWriter::to_json(res, vars, cli.read.vars) << "\n";
    else std::cout << shread::ReportWriter::to_shell(vars, cli.read.vars, cli.read.array);
  }
  std::cout.flush();
  return shread::exit_code(res.status);
}
