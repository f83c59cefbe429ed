#include "line_chunker/splitter.hpp"
#include "line_chunker/artifact_writer.hpp"
#include "line_chunker/boundary_locator.hpp"
#include "line_chunker/chunk_accumulator.hpp"
#include "line_chunker/path_utils.hpp"
#include "line_chunker/run_json.hpp"
#include "line_chunker/stream_driver.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace lc {

namespace {

constexpr std::uint64_t kMaxLoggedWarnings = 10;

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

}

bool validate_config(const SplitConfig& cfg, std::string* err_out) {
  BoundaryLocator loc(BoundaryLocator::Config{cfg.line_ending, cfg.encoding});
  if (!loc.ok()) return fail(err_out, loc.error());
  if (cfg.chunk_bytes == 0) return fail(err_out, "chunk size must be positive");
  if (cfg.level < 1 || cfg.level > 9) return fail(err_out, "compression level must be 1..9");
  return true;
}

bool split_file(const SplitConfig& cfg, SplitSummary& out, std::string* err_out) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  MetricsRegistry metrics;

  std::uint64_t logged = 0;
  auto on_warning = [&](std::uint64_t invalid, std::string_view msg) {
    metrics.add_decode_warnings(invalid);
    if (logged == kMaxLoggedWarnings) return;
    std::cerr << "[decode] warning: " << msg << "\n";
    if (++logged == kMaxLoggedWarnings) std::cerr << "[decode] further warnings are counted only\n";
  };
  BoundaryLocator locator(BoundaryLocator::Config{cfg.line_ending, cfg.encoding}, on_warning);
  if (!locator.ok()) return fail(err_out, locator.error());

  // Open before anything is written so a missing input leaves no output.
  StreamDriver::Config dcfg;
  dcfg.read_bytes = cfg.read_bytes;
  StreamDriver driver(cfg.input_path, dcfg);
  if (!driver.open())
    return fail(err_out, "cannot open " + cfg.input_path + ": " + std::strerror(driver.last_error()));

  ChunkEmitter::Config ecfg;
  ecfg.output_prefix = cfg.output_prefix;
  ecfg.level = cfg.level;
  ecfg.quiet = cfg.quiet;
  ChunkEmitter emitter(ecfg, &metrics);

  ChunkAccumulator::Config acfg;
  acfg.threshold = cfg.chunk_bytes;
  ChunkAccumulator acc(acfg, locator,
                       [&](std::string_view chunk, std::uint64_t index) {
                         return emitter.emit(chunk, index);
                       });

  const bool read_ok = driver.for_each_block([&](std::string_view block) {
    return acc.append(block);
  });
  if (!read_ok) {
    if (!driver.stopped_by_callback())
      return fail(err_out, "read failed on " + cfg.input_path + ": " + std::strerror(driver.last_error()));
    return fail(err_out, emitter.error().empty() ? acc.error() : emitter.error());
  }
  if (!acc.finish())
    return fail(err_out, emitter.error().empty() ? acc.error() : emitter.error());

  metrics.add_stage_time("read", driver.read_ms());
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();

  SplitSummary s;
  s.stats = metrics.snapshot(wall_ms);
  s.chunks = emitter.records();
  s.bytes_read = driver.bytes_read();
  s.blocks_read = driver.blocks_read();
  s.peak_buffer_bytes = acc.high_water();

  if (!cfg.report_path.empty()) {
    RunJsonPayload p;
    p.input_path = cfg.input_path;
    std::error_code fec;
    p.file_size = std::filesystem::file_size(cfg.input_path, fec);
    p.output_prefix = cfg.output_prefix;
    p.encoding = encoding_name(cfg.encoding);
    p.line_ending = escape_for_display(cfg.line_ending);
    p.chunk_bytes = cfg.chunk_bytes;
    p.level = cfg.level;
    p.stats = s.stats;
    p.peak_buffer_bytes = s.peak_buffer_bytes;
    p.chunks = s.chunks;

    std::string werr;
    if (!write_artifact(cfg.report_path, RunJsonWriter::to_json(p), &werr))
      return fail(err_out, "report: " + werr);
  }

  out = std::move(s);
  return true;
}

}
