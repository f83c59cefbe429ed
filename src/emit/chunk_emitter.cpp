#include "line_chunker/chunk_emitter.hpp"
#include "line_chunker/artifact_writer.hpp"
#include "line_chunker/gzip_codec.hpp"
#include "line_chunker/metrics.hpp"
#include "line_chunker/path_utils.hpp"
#include <iostream>

namespace lc {

ChunkEmitter::ChunkEmitter(Config cfg, MetricsRegistry* metrics)
  : cfg_(std::move(cfg)), metrics_(metrics) {}

std::string ChunkEmitter::path_for(std::uint64_t index) const {
  return chunk_path(cfg_.output_prefix, index, cfg_.index_width, cfg_.extension);
}

bool ChunkEmitter::emit(std::string_view chunk, std::uint64_t index) {
  ChunkRecord rec;
  rec.index = index;
  rec.path = path_for(index);
  rec.raw_bytes = chunk.size();

  {
    StageTimer t(metrics_, "compress");
    std::string zerr;
    if (!gzip_compress(chunk, cfg_.level, scratch_, &zerr)) {
      err_ = "chunk " + std::to_string(index) + ": " + zerr;
      return false;
    }
  }
  rec.compressed_bytes = scratch_.size();

  {
    StageTimer t(metrics_, "digest");
    rec.sha256 = sha256_hex(chunk);
  }

  {
    StageTimer t(metrics_, "write");
    if (!write_artifact(rec.path, scratch_, &err_)) return false;
  }

  if (metrics_) metrics_->add_chunk(rec.raw_bytes, rec.compressed_bytes);
  if (!cfg_.quiet) {
    std::cout << "[emit] chunk " << index << " -> " << rec.path
              << " (raw " << rec.raw_bytes << " B, compressed " << rec.compressed_bytes << " B)\n";
  }
  records_.push_back(std::move(rec));
  return true;
}

}
