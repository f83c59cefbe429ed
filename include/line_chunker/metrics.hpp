#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t chunks = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  std::uint64_t decode_warnings = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double compression_ratio = 0.0;

  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void reset();
  void add_chunk(std::uint64_t raw, std::uint64_t compressed) noexcept {
    ++chunks_; bytes_in_ += raw; bytes_out_ += compressed;
  }
  void add_decode_warnings(std::uint64_t n) noexcept { decode_warnings_ += n; }
  std::uint64_t decode_warnings() const noexcept { return decode_warnings_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);
  void add_stage_time(std::string_view name, double ms);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t chunks_{0};
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};
  std::uint64_t decode_warnings_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// RAII start/end pair.
class StageTimer {
public:
  StageTimer(MetricsRegistry* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~StageTimer() { if (m_) m_->end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry* m_;
  std::string_view name_;
};

}
