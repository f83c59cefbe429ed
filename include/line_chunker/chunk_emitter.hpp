#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lc {

class MetricsRegistry;

struct ChunkRecord {
  std::uint64_t index = 0;
  std::string   path;
  std::uint64_t raw_bytes = 0;
  std::uint64_t compressed_bytes = 0;
  std::string   sha256;          // of the uncompressed chunk
};

// Compresses each finished chunk and writes it as "<prefix>.<NNN>.gz".
class ChunkEmitter {
public:
  struct Config {
    std::string output_prefix;
    int         level       = 6;
    int         index_width = 3;
    std::string extension   = ".gz";
    bool        quiet       = false; // no per-chunk log line
  };

  explicit ChunkEmitter(Config cfg, MetricsRegistry* metrics = nullptr);

  bool emit(std::string_view chunk, std::uint64_t index);

  std::string path_for(std::uint64_t index) const;
  const std::vector<ChunkRecord>& records() const noexcept { return records_; }
  const std::string& error() const { return err_; }

private:
  Config cfg_;
  MetricsRegistry* metrics_;
  std::vector<ChunkRecord> records_;
  std::string scratch_;
  std::string err_;
};

}
