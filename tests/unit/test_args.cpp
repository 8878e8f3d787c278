#include "shread/args.hpp"
#include "shread/env.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

// argv with the terminating null getopt expects
class ArgvBuilder {
public:
  ArgvBuilder& add(const char* arg) { args_.insert(args_.end() - 1, strdup(arg)); return *this; }
  int argc() const { return static_cast<int>(args_.size()) - 1; }
  char** argv() { return args_.data(); }
  ~ArgvBuilder() { for (char* a : args_) std::free(a); }
private:
  std::vector<char*> args_{nullptr};
};

static bool parse(std::vector<const char*> args, shread::CliOptions& opts, std::string* err = nullptr) {
  ArgvBuilder b;
  b.add("shread");
  for (auto a : args) b.add(a);
  std::string e;
  bool ok = shread::parse_args(b.argc(), b.argv(), opts, &e);
  if (err) *err = e;
  return ok;
}

// parse + validate against a fresh store
static bool accepted(std::vector<const char*> args, std::string* err = nullptr) {
  shread::CliOptions opts;
  std::string e;
  if (!parse(std::move(args), opts, &e)) { if (err) *err = e; return false; }
  shread::VarStore env;
  env.mark_read_only("status");
  bool ok = shread::validate_read_config(opts.read, env, &e);
  if (err) *err = e;
  return ok;
}

int main(){
  {
    shread::CliOptions o;
    bool ok = parse({"-d", ",", "-g", "--nchars=4", "a", "b"}, o);
    check(ok && o.read.delimiter == std::u32string(U",") && o.read.nchars == 4 &&
          (o.read.place & shread::env_mode::GLOBAL) && o.read.vars == std::vector<std::string>{"a", "b"},
          "basic flags and names");
  }
  {
    shread::CliOptions o;
    bool ok = parse({"-azs", "--json", "--input", "data.txt", "list"}, o);
    check(ok && o.read.array && o.read.split_null && o.read.silent && o.json && o.input_path == "data.txt",
          "clustered short flags and driver options");
  }
  {
    shread::CliOptions o;
    check(parse({}, o) && o.read.to_stdout, "no names means echo to stdout");
  }
  {
    shread::CliOptions o;
    std::string err;
    check(!parse({"-n", "-3", "x"}, o, &err) && err.find("invalid integer") != std::string::npos, "negative nchars rejected");
    check(!parse({"-n", "99999999999999999999999", "x"}, o, &err) && err.find("out of range") != std::string::npos,
          "huge nchars out of range");
    check(!parse({"-i", "x"}, o, &err) && err.find("deprecated") != std::string::npos, "-i is deprecated");
    check(!parse({"--bogus", "x"}, o, &err), "unknown option rejected");
    check(!parse({"x", "-d"}, o, &err) && err.find("requires an argument") != std::string::npos, "missing option argument");
  }

  std::string err;
  check(accepted({"-L", "a", "b"}), "--line accepted");
  check(!accepted({"-p", "cmd", "-P", "str", "x"}, &err), "-p with -P rejected");
  check(!accepted({"-d", ",", "-L", "x"}, &err), "--delimiter with --line rejected");
  check(!accepted({"-z", "-L", "x"}, &err), "-z with --line rejected");
  check(!accepted({"-x", "-u", "x"}, &err), "export with unexport rejected");
  check(!accepted({"-l", "-g", "x"}, &err), "two scopes rejected");
  check(!accepted({"-a", "x", "y"}, &err) && err.find("expected 1 argument") != std::string::npos, "array needs one name");
  check(!accepted({"-a"}, &err), "array with no name rejected");
  check(!accepted({"-t", "-d", ",", "x"}, &err), "tokenize with delimiter rejected");
  check(!accepted({"-t", "-L", "x"}, &err), "tokenize with line rejected");
  check(!accepted({"1-bad"}, &err) && err.find("invalid variable name") != std::string::npos, "bad variable name");
  check(!accepted({"status"}, &err) && err.find("read-only") != std::string::npos, "read-only variable");

  {
    shread::CliOptions o;
    parse({"-L", "a"}, o);
    shread::VarStore env;
    shread::validate_read_config(o.read, env, nullptr);
    check(o.read.delimiter == std::u32string(U"\n") && o.read.split_mode() == shread::SplitMode::Delimiter,
          "--line becomes a newline delimiter");
    check(o.read.prompt && !o.read.prompt->empty(), "default prompt filled in");
  }
  {
    shread::CliOptions o;
    parse({"-d", "", "a"}, o);
    check(o.read.split_mode() == shread::SplitMode::PerChar, "empty delimiter means per character");
  }

  if (failures) { std::cerr << "[FAIL] args: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] args\n";
  return 0;
}
