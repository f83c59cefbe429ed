#pragma once
#include "line_chunker/chunk_emitter.hpp"
#include "line_chunker/metrics.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lc {

struct RunJsonPayload {
  // Input and configuration
  std::string input_path;
  std::uint64_t file_size = 0;
  std::string output_prefix;
  std::string encoding;
  std::string line_ending;      // escaped for display
  std::uint64_t chunk_bytes = 0;
  int level = 0;

  // Totals and stage timings
  RunStats stats;
  std::uint64_t peak_buffer_bytes = 0;

  std::vector<ChunkRecord> chunks;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

}
