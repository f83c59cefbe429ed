#include "line_chunker/config.hpp"
#include "line_chunker/path_utils.hpp"
#include "line_chunker/splitter.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitRuntime = 1;
constexpr int kExitConfig  = 2;

void print_config(const lc::SplitConfig& cfg) {
  std::cout << "[config] input=" << cfg.input_path
            << " prefix=" << cfg.output_prefix << "\n"
            << "[config] encoding=" << lc::encoding_name(cfg.encoding)
            << " line_ending=" << lc::escape_for_display(cfg.line_ending)
            << " chunk=" << cfg.chunk_bytes / (1024 * 1024) << " MB"
            << " level=" << cfg.level << "\n";
}

void print_summary(const lc::SplitSummary& s) {
  const auto& st = s.stats;
  std::cout << std::fixed << std::setprecision(2)
            << "[split] chunks=" << st.chunks
            << " bytes=" << st.bytes_in / (1024.0 * 1024.0) << " MB"
            << " compressed=" << st.bytes_out / (1024.0 * 1024.0) << " MB"
            << " time=" << st.wall_time_ms / 1000.0 << " s"
            << " speed=" << st.throughput_mb_s << " MB/s\n";
  if (st.decode_warnings)
    std::cout << "[split] decode warnings: " << st.decode_warnings << "\n";
}

}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv, argv + argc);
  const std::string prog = args.empty() ? "line-chunker" : args[0];

  if (lc::is_help_request(args)) {
    std::cout << lc::usage(prog);
    return 0;
  }

  lc::SplitConfig cfg;
  std::string err;
  if (!lc::parse_args(args, cfg, &err) || !lc::validate_config(cfg, &err)) {
    std::cerr << "[config] error: " << err << "\n" << lc::usage(prog);
    return kExitConfig;
  }

  if (!cfg.quiet) print_config(cfg);

  lc::SplitSummary summary;
  if (!lc::split_file(cfg, summary, &err)) {
    std::cerr << "[split] failed: " << err << "\n";
    return kExitRuntime;
  }

  print_summary(summary);
  return 0;
}
