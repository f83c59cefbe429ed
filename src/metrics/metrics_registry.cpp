#include "line_chunker/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace lc {

void MetricsRegistry::reset() {
  chunks_ = bytes_in_ = bytes_out_ = decode_warnings_ = 0;
  stage_accum_us_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_stage_time(std::string_view name, double ms) {
  if (ms <= 0.0) return;
  stage_accum_us_[std::string(name)] += static_cast<std::uint64_t>(ms * 1000.0);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.chunks = chunks_;
  r.bytes_in = bytes_in_;
  r.bytes_out = bytes_out_;
  r.decode_warnings = decode_warnings_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_in_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.compression_ratio = bytes_in_ ? static_cast<double>(bytes_out_) / bytes_in_ : 0.0;

  r.stages.reserve(stage_accum_us_.size());
  for (auto& kv : stage_accum_us_) r.stages.push_back(StageTiming{kv.first, kv.second / 1000.0});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
