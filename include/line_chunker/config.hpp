#pragma once
#include "line_chunker/text_codec.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lc {

struct SplitConfig {
  std::string input_path;
  std::string output_prefix;
  std::size_t chunk_bytes = 100 * 1024 * 1024;  // 100 MiB
  std::string line_ending = "\n";               // UTF-8 spelling
  Encoding    encoding    = Encoding::Utf8;
  std::size_t read_bytes  = 8 * 1024 * 1024;    // 8 MiB
  int         level       = 6;                  // gzip level
  std::string report_path;                      // run.json, optional
  bool        quiet       = false;
};

// <input> <prefix> [chunk_size_mb] [line_ending] [encoding]
// plus --level=N, --read-mb=N, --report=PATH anywhere after argv[0].
bool parse_args(const std::vector<std::string>& args, SplitConfig& out,
                std::string* err_out = nullptr);

// LF | CRLF | CR | custom:<literal> (\n and \r escapes allowed in literal).
bool parse_line_ending(std::string_view name, std::string& out,
                       std::string* err_out = nullptr);

bool is_help_request(const std::vector<std::string>& args);
std::string usage(std::string_view argv0);

}
