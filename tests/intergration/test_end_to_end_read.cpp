#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/wait.h>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static fs::path write_fixture(const std::string& name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream out(p, std::ios::binary);
  out << body;
  return p;
}

struct RunResult {
  int code = -1;
  std::string out;
};

// Runs a shell command line, capturing stdout; stderr is discarded.
static RunResult run(const std::string& cmd) {
  RunResult r;
  FILE* p = ::popen((cmd + " 2>/dev/null").c_str(), "r");
  if (!p) return r;
  char buf[512];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), p)) > 0) r.out.append(buf, n);
  int st = ::pclose(p);
  if (st != -1 && WIFEXITED(st)) r.code = WEXITSTATUS(st);
  return r;
}

int main() {
  const std::string bin = "'" + env_or("SHREAD_BIN", "./shread") + "'";
  if (!fs::exists(env_or("SHREAD_BIN", "./shread"))) {
    std::cerr << "[ERR] shread binary not found; set SHREAD_BIN\n";
    return 2;
  }

  fs::path lines = write_fixture("shread_e2e_lines.txt", "hello world foo\nsecond line\n");
  fs::path empty = write_fixture("shread_e2e_empty.txt", "");
  fs::path longline = write_fixture("shread_e2e_long.txt", std::string(300, 'a') + "\n");

  {
    auto r = run(bin + " --input '" + lines.string() + "' a b");
    check(r.code == 0, "file input exits 0");
    check(r.out == "a='hello'\nb='world foo'\n", "last variable takes the remainder: " + r.out);
  }
  {
    auto r = run("printf 'x y z\\n' | " + bin + " -a arr");
    check(r.code == 0 && r.out == "arr=('x' 'y' 'z')\n", "array from pipe: " + r.out);
  }
  {
    auto r = run("printf \"it's\\n\" | " + bin + " v");
    check(r.out == "v='it'\\''s'\n", "single quotes escaped in shell output: " + r.out);
  }
  {
    auto r = run("printf 'a b\\0c d\\0' | " + bin + " -z v");
    check(r.code == 0 && r.out == "v='a b'\n", "NUL-terminated record: " + r.out);
  }
  {
    auto r = run("printf 'a:b:c\\n' | " + bin + " -d : x y");
    check(r.code == 0 && r.out == "x='a'\ny='b:c'\n", "explicit delimiter splits on the string: " + r.out);
  }
  {
    auto r = run("printf 'one\\ntwo\\n' | " + bin + " -L first second");
    check(r.code == 0 && r.out == "first='one'\nsecond='two'\n", "--line reads one line per variable: " + r.out);
  }
  {
    auto r = run(bin + " --json --input '" + lines.string() + "' a");
    check(r.code == 0, "json run exits 0");
    check(r.out.find("\"status\":\"success\"") != std::string::npos, "json carries status");
    check(r.out.find("\"strategy\":\"chunked\"") != std::string::npos, "owned file uses the chunked reader");
    check(r.out.find("\"vars\":{\"a\":[\"hello world foo\"]}") != std::string::npos, "json carries values: " + r.out);
  }
  {
    auto r = run("printf 'abc\\n' | " + bin + " -n 2 v");
    check(r.code == 0 && r.out == "v='ab'\n", "-n stops after N chars: " + r.out);
  }
  {
    auto r = run("printf 'data\\n' | " + bin);
    check(r.code == 0 && r.out == "data", "no names echoes the record: " + r.out);
  }
  {
    auto r = run(bin + " --input '" + empty.string() + "' v");
    check(r.code == 1 && r.out == "v=''\n", "empty input fails and clears: " + r.out);
  }
  {
    auto r = run("SHREAD_READ_LIMIT=16 " + bin + " --input '" + longline.string() + "' v");
    check(r.code == 122, "byte ceiling exceeded exits 122 (got " + std::to_string(r.code) + ")");
  }
  {
    auto r = run("SHREAD_READ_LIMIT=16 " + bin + " < '" + longline.string() + "' v");
    check(r.code == 122, "byte ceiling on redirected stdin exits 122");
  }
  {
    auto r = run("SHREAD_READ_LIMIT=nope " + bin + " v < /dev/null");
    check(r.code == 2, "bad env ceiling is an argument error");
  }
  {
    auto r = run(bin + " -n abc v < /dev/null");
    check(r.code == 2, "non-numeric -n exits 2");
    r = run(bin + " --bogus v < /dev/null");
    check(r.code == 2, "unknown option exits 2");
    r = run(bin + " 'bad name' < /dev/null");
    check(r.code == 2, "invalid variable name exits 2");
  }

  fs::remove(lines);
  fs::remove(empty);
  fs::remove(longline);

  if (failures) { std::cerr << "[FAIL] end-to-end read: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] end-to-end read\n";
  return 0;
}
