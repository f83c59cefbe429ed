#include "line_chunker/config.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main(){
  lc::SplitConfig c;
  std::string err;

  expect(lc::parse_args({"tool", "in.log", "out/part"}, c, &err), "minimal args");
  expect(c.chunk_bytes == 100u * 1024 * 1024 && c.line_ending == "\n" &&
         c.encoding == lc::Encoding::Utf8, "defaults");

  expect(lc::parse_args({"tool", "in", "out", "5", "crlf", "gbk", "--level=9", "--report=r.json"}, c, &err),
         "full args");
  expect(c.chunk_bytes == 5u * 1024 * 1024, "chunk size in MB");
  expect(c.line_ending == "\r\n" && c.encoding == lc::Encoding::Gbk, "line ending and encoding");
  expect(c.level == 9 && c.report_path == "r.json", "flags");

  expect(lc::parse_args({"tool", "in", "out", "1", "custom:\\r\\n--End--\\n"}, c, &err) &&
         c.line_ending == "\r\n--End--\n", "custom literal keeps case and unescapes");

  expect(!lc::parse_args({"tool", "in"}, c, &err), "missing prefix");
  expect(!lc::parse_args({"tool", "in", "out", "0"}, c, &err), "zero chunk size");
  expect(!lc::parse_args({"tool", "in", "out", "12x"}, c, &err), "non-numeric chunk size");
  expect(!lc::parse_args({"tool", "in", "out", "1", "custom:"}, c, &err) && !err.empty(), "empty custom");
  expect(!lc::parse_args({"tool", "in", "out", "1", "NEL"}, c, &err), "unknown line ending");
  expect(!lc::parse_args({"tool", "in", "out", "1", "LF", "KOI8"}, c, &err), "unknown encoding");
  expect(!lc::parse_args({"tool", "in", "out", "--level=12"}, c, &err), "bad level");
  expect(!lc::parse_args({"tool", "in", "out", "--bogus"}, c, &err), "unknown flag");

  expect(lc::is_help_request({"tool", "--help"}), "help flag");
  expect(lc::usage("tool").find("line_ending") != std::string::npos, "usage text");

  if (failures) return 1;
  std::cout << "[PASS] config parsing\n";
  return 0;
}
