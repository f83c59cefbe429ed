#include "line_chunker/gzip_codec.hpp"
#include "line_chunker/path_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <ctime>
#include <sys/wait.h>
#include <unistd.h>
#include <simdjson.h>

namespace fs = std::filesystem;

#ifndef LC_CLI_BIN
#define LC_CLI_BIN "line-chunker"
#endif

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string read_file(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

// simdjson_result has no value_or(); yields the value, or defv on error.
template <typename T, typename D>
static T value_or(simdjson::simdjson_result<T>&& r, D defv) {
  T v;
  if (std::move(r).get(v)) return T(defv);
  return v;
}

static int run(const std::string& cmd) {
  int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

int main() {
  std::string bin = env_or("LC_CLI_BIN", LC_CLI_BIN);

  fs::path art = fs::temp_directory_path() /
      ("line-chunker-cli-" + std::to_string(::getpid()) + "-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);
  const fs::path log = art / "cli.log";

  // ~2.5 MB of CRLF lines so a 1 MB threshold yields several chunks.
  const fs::path in = art / "input.txt";
  std::string data;
  for (int i = 0; data.size() < 2600 * 1024; ++i)
    data += "line " + std::to_string(i) + " " + std::string(static_cast<std::size_t>(i % 120), 'x') + "\r\n";
  {
    std::ofstream f(in, std::ios::binary);
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
  }

  const fs::path prefix = art / "out" / "part";
  const fs::path report = art / "run.json";
  std::string cmd = "\"" + bin + "\" \"" + in.string() + "\" \"" + prefix.string() + "\" 1 CRLF UTF-8 "
                    "--level=3 --read-mb=1 --report=\"" + report.string() + "\" "
                    ">\"" + log.string() + "\" 2>&1";
  int rc = run(cmd);
  if (rc != 0) {
    std::cerr << "[FAIL] line-chunker returned " << rc << " (see " << log << ")\n";
    return 1;
  }
  if (!fs::exists(report)) { std::cerr << "[FAIL] no run.json produced\n"; return 1; }

  simdjson::ondemand::parser p;
  auto json = simdjson::padded_string::load(report.string());
  auto doc = p.iterate(json);

  bool ok = true;
  uint64_t chunks = value_or(doc["chunks"].get_uint64(), 0);
  uint64_t bytes = value_or(doc["bytes"].get_uint64(), 0);
  uint64_t level = value_or(doc["level"].get_uint64(), 0);
  std::string line_ending(value_or(doc["line_ending"].get_string(), ""));

  if (chunks < 2) { std::cerr << "[FAIL] expected several chunks, got " << chunks << "\n"; ok = false; }
  if (bytes != data.size()) { std::cerr << "[FAIL] bytes=" << bytes << " want " << data.size() << "\n"; ok = false; }
  if (level != 3) { std::cerr << "[FAIL] level=" << level << "\n"; ok = false; }
  if (line_ending != "\\r\\n") { std::cerr << "[FAIL] line_ending=" << line_ending << "\n"; ok = false; }

  uint64_t files = 0;
  std::string joined;
  for (auto f : doc["files"].get_array()) {
    ++files;
    uint64_t index = value_or(f["index"].get_uint64(), 0);
    std::string path(value_or(f["path"].get_string(), ""));
    std::string sha(value_or(f["sha256"].get_string(), ""));
    if (index != files) { std::cerr << "[FAIL] file index " << index << " out of order\n"; ok = false; }
    if (path != lc::chunk_path(prefix.string(), index)) {
      std::cerr << "[FAIL] unexpected path " << path << "\n"; ok = false;
    }
    std::string raw;
    if (!lc::gzip_decompress(read_file(path), raw)) {
      std::cerr << "[FAIL] cannot decompress " << path << "\n"; ok = false; continue;
    }
    if (lc::sha256_hex(raw) != sha) { std::cerr << "[FAIL] sha256 mismatch for " << path << "\n"; ok = false; }
    joined += raw;
  }
  if (files != chunks) { std::cerr << "[FAIL] files=" << files << " chunks=" << chunks << "\n"; ok = false; }
  if (joined != data) { std::cerr << "[FAIL] chunks do not reassemble to the input\n"; ok = false; }

  // Bad arguments exit with the configuration status and write nothing.
  const fs::path bad_prefix = art / "bad" / "part";
  rc = run("\"" + bin + "\" \"" + in.string() + "\" \"" + bad_prefix.string() + "\" 1 TAB "
           ">>\"" + log.string() + "\" 2>&1");
  if (rc != 2) { std::cerr << "[FAIL] bad line ending exit code " << rc << "\n"; ok = false; }
  if (fs::exists(art / "bad")) { std::cerr << "[FAIL] output written for bad arguments\n"; ok = false; }

  // Missing input is a runtime failure.
  rc = run("\"" + bin + "\" \"" + (art / "nope.txt").string() + "\" \"" + bad_prefix.string() + "\" "
           ">>\"" + log.string() + "\" 2>&1");
  if (rc != 1) { std::cerr << "[FAIL] missing input exit code " << rc << "\n"; ok = false; }

  if (!ok) return 1;
  std::error_code ec;
  fs::remove_all(art, ec);
  std::cout << "[PASS] cli run report: chunks=" << chunks << " bytes=" << bytes << "\n";
  return 0;
}
