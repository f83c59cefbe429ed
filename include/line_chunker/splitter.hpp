#pragma once
#include "line_chunker/chunk_emitter.hpp"
#include "line_chunker/config.hpp"
#include "line_chunker/metrics.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace lc {

struct SplitSummary {
  RunStats stats;
  std::vector<ChunkRecord> chunks;
  std::uint64_t bytes_read = 0;
  std::uint64_t blocks_read = 0;
  std::uint64_t peak_buffer_bytes = 0;
};

// Checks what parse_args cannot: the encoding is available and the line
// ending is representable in it.
bool validate_config(const SplitConfig& cfg, std::string* err_out = nullptr);

// Reads cfg.input_path and writes one compressed file per chunk. Chunks
// already written stay in place when a later step fails.
bool split_file(const SplitConfig& cfg, SplitSummary& out, std::string* err_out = nullptr);

}
