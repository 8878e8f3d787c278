#include "shread/chunk_reader.hpp"
#include "shread/decoder.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static int open_with(const std::string& name, const std::string& bytes) {
  fs::path p = fs::temp_directory_path() / ("shread_chunk_" + name);
  { std::ofstream out(p, std::ios::binary); out << bytes; }
  int fd = ::open(p.c_str(), O_RDONLY);
  fs::remove(p); // fd keeps the inode alive
  return fd;
}

int main(){
  {
    int fd = open_with("rollback", "line1\nline2\n");
    if (fd < 0) { std::cerr << "[ERR] cannot create temp file\n"; return 2; }
    shread::ChunkReader r(fd, shread::ByteBudget{});
    std::u32string out;
    auto s1 = r.read_record(out);
    check(s1 == shread::ReadStatus::Success && out == U"line1", "first record is line1");
    check(::lseek(fd, 0, SEEK_CUR) == 6, "descriptor rewound to just past the newline");
    auto s2 = r.read_record(out);
    check(s2 == shread::ReadStatus::Success && out == U"line2", "second call yields line2");
    auto s3 = r.read_record(out);
    check(s3 == shread::ReadStatus::CmdFailure && out.empty(), "end of input with nothing read fails");
    ::close(fd);
  }
  {
    int fd = open_with("norollback", "a\nb\nc\n");
    shread::ChunkReader::Config cfg;
    cfg.rollback = false;
    shread::ChunkReader r(fd, cfg, shread::ByteBudget{});
    std::u32string out;
    check(r.read_record(out) == shread::ReadStatus::Success && out == U"a", "no-rollback still stops at delimiter");
    check(::lseek(fd, 0, SEEK_CUR) == 6, "no-rollback leaves the whole chunk consumed");
    ::close(fd);
  }
  {
    int fd = open_with("nul", std::string("x y\0z\n", 6));
    shread::ChunkReader::Config cfg;
    cfg.delimiter = '\0';
    shread::ChunkReader r(fd, cfg, shread::ByteBudget{});
    std::u32string out;
    r.read_record(out);
    check(out == U"x y", "NUL delimiter");
    r.read_record(out);
    check(out == U"z\n", "newline kept inside NUL-split record");
    ::close(fd);
  }
  {
    // spans several 128-byte chunks, ends without a delimiter
    std::string big(300, 'q');
    int fd = open_with("long", big);
    shread::ChunkReader r(fd, shread::ByteBudget{});
    std::u32string out;
    check(r.read_record(out) == shread::ReadStatus::Success && out.size() == 300, "record across chunks, no trailing newline");
    ::close(fd);
  }
  {
    std::string big(300, 'q');
    int fd = open_with("budget", big + "\n");
    shread::ChunkReader r(fd, shread::ByteBudget{200});
    std::u32string out;
    auto s = r.read_record(out);
    // over budget after the second chunk: the full 256 bytes come back
    check(s == shread::ReadStatus::ReadTooMuch && out.size() == 256, "over budget keeps everything read");
    check(r.bytes_read() == 256, "bytes_read counts raw bytes");
    ::close(fd);
  }
  {
    int fd = open_with("empty_line", "\nrest\n");
    shread::ChunkReader r(fd, shread::ByteBudget{});
    std::u32string out = U"stale";
    check(r.read_record(out) == shread::ReadStatus::Success && out.empty(), "empty line is a successful empty record");
    ::close(fd);
  }
  {
    int fd = open_with("utf8", "caf\xC3\xA9\n");
    shread::ChunkReader r(fd, shread::ByteBudget{});
    std::u32string out;
    r.read_record(out);
    check(out == U"caf\u00e9", "bytes decoded once at the end");
    ::close(fd);
  }

  {
    // a pipe cannot be rewound, so rollback past the delimiter is fatal
    int fds[2];
    if (::pipe(fds) != 0) { std::cerr << "[ERR] pipe setup failed\n"; return 2; }
    const std::string data = "ab\ncd\n";
    bool wrote = ::write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size());
    ::close(fds[1]);
    shread::ChunkReader r(fds[0], shread::ByteBudget{});
    std::u32string out;
    check(wrote && r.last_error() == 0, "no error before the first read");
    check(r.read_record(out) == shread::ReadStatus::CmdFailure, "seek back on a pipe fails the read");
    check(r.last_error() == ESPIPE, "last_error reports ESPIPE");
    ::close(fds[0]);
  }

  if (failures) { std::cerr << "[FAIL] chunk_reader: " << failures << " failures\n"; return 1; }
  std::cout << "[PASS] chunk_reader\n";
  return 0;
}
