#include "text_buffer.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
  fs::path dir = fs::temp_directory_path() / ("medit_io_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void write_raw(const fs::path& p, const std::string& bytes) {
  std::ofstream out(p, std::ios::binary);
  out << bytes;
}

static std::string read_raw(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void test_round_trip(const fs::path& dir) {
  fs::path p = dir / "round.txt";
  std::string msg;
  TextBuffer b("first line\nsecond line\n");
  assert(b.write_file(p, msg));
  assert(msg.find("saved file") == 0);
  assert(read_raw(p) == "first line\nsecond line\n");
  assert(!fs::exists(dir / "round.txt.tmp"));

  TextBuffer loaded;
  assert(loaded.load_file(p, msg));
  assert(msg.find("opened file") == 0);
  assert(loaded.content() == b.content());
  assert(loaded.cursor() == 0);
  assert(!loaded.can_undo());
}

static void test_large_write_spans_chunks(const fs::path& dir) {
  fs::path p = dir / "large.txt";
  std::string big;
  for (int i = 0; i < 20000; ++i) big += "0123456789\n";
  TextBuffer b(big);
  std::string msg;
  assert(b.write_file(p, msg));
  assert(read_raw(p) == big);
}

static void test_line_endings_normalized(const fs::path& dir) {
  fs::path p = dir / "crlf.txt";
  write_raw(p, "a\r\nb\rc\r\n");
  std::string out, msg;
  assert(mmap_read_text(p, out, msg));
  assert(out == "a\nb\nc\n");

  TextBuffer b;
  assert(b.load_file(p, msg));
  assert(b.content() == "a\nb\nc\n");
  assert(b.line_count() == 4);
}

static void test_empty_file(const fs::path& dir) {
  fs::path p = dir / "empty.txt";
  write_raw(p, "");
  TextBuffer b("stale");
  std::string msg;
  assert(b.load_file(p, msg));
  assert(b.content().empty());
}

static void test_missing_file(const fs::path& dir) {
  TextBuffer b("keep");
  std::string msg;
  assert(!b.load_file(dir / "does_not_exist.txt", msg));
  assert(msg.find("can not open file") == 0);
  assert(b.content() == "keep");
}

static void test_write_into_missing_dir(const fs::path& dir) {
  TextBuffer b("data");
  std::string msg;
  assert(!b.write_file(dir / "no_such_dir" / "out.txt", msg));
  assert(msg.find("write file failed") == 0);
}

static void test_overwrite_existing(const fs::path& dir) {
  fs::path p = dir / "over.txt";
  write_raw(p, "old contents that are longer");
  TextBuffer b("new");
  std::string msg;
  assert(b.write_file(p, msg));
  assert(read_raw(p) == "new");
}

int main() {
  fs::path dir = make_temp_dir();
  test_round_trip(dir);
  test_large_write_spans_chunks(dir);
  test_line_endings_normalized(dir);
  test_empty_file(dir);
  test_missing_file(dir);
  test_write_into_missing_dir(dir);
  test_overwrite_existing(dir);
  fs::remove_all(dir);
  return 0;
}
