#include "line_chunker/chunk_accumulator.hpp"
#include "line_chunker/boundary_locator.hpp"
#include <vector>

namespace lc {

ChunkAccumulator::ChunkAccumulator(Config cfg, BoundaryLocator& locator, ChunkSink sink)
  : cfg_(cfg), locator_(locator), sink_(std::move(sink)), arena_(cfg.initial_bytes) {
  if (cfg_.threshold == 0) cfg_.threshold = 1;
}

ChunkAccumulator::State ChunkAccumulator::state() const noexcept {
  if (emitting_) return State::ReadyToEmit;
  if (finished_) return State::Final;
  return arena_.empty() ? State::Empty : State::Accumulating;
}

bool ChunkAccumulator::append(std::string_view bytes) {
  if (finished_) { err_ = "append after finish"; return false; }
  if (bytes.empty()) return true;

  arena_.append(bytes);

  // Only the unscanned suffix is searched; it begins on a character boundary
  // and includes any partial line carried from earlier reads.
  std::size_t resume = 0;
  auto last = locator_.locate_last_boundary(arena_.view().substr(scanned_), &resume);
  if (last) line_end_ = scanned_ + *last;
  scanned_ += resume;

  if (line_end_ < cfg_.threshold) {
    safe_split_ = line_end_;
    return true;
  }

  // Every cut this read makes possible, from one scan starting at the last
  // line end below the threshold.
  auto cuts = locator_.locate_cuts(arena_.view(safe_split_, line_end_ - safe_split_),
                                   cfg_.threshold - safe_split_, cfg_.threshold);
  std::size_t start = 0;
  for (std::size_t c : cuts) {
    const std::size_t end = safe_split_ + c;
    if (!emit(start, end - start)) return false;
    start = end;
  }
  // Self-overlapping delimiters can leave the last match out of phase with
  // the forward walk; line_end_ is still a boundary.
  if (line_end_ - start >= cfg_.threshold) {
    if (!emit(start, line_end_ - start)) return false;
    start = line_end_;
  }

  arena_.consume(start);
  line_end_  -= start;
  scanned_   -= start;
  safe_split_ = line_end_;
  return true;
}

bool ChunkAccumulator::finish() {
  if (finished_) return true;
  locator_.finish_scan(arena_.view().substr(scanned_));
  scanned_ = arena_.used();
  if (!arena_.empty() && !emit(0, arena_.used())) return false;
  finished_ = true;
  arena_.reset_and_shrink(0);
  line_end_ = scanned_ = safe_split_ = 0;
  return true;
}

bool ChunkAccumulator::emit(std::size_t off, std::size_t n) {
  emitting_ = true;
  const bool ok = sink_(arena_.view(off, n), next_index_);
  emitting_ = false;
  if (!ok) {
    err_ = "chunk " + std::to_string(next_index_) + " could not be emitted";
    return false;
  }
  ++next_index_;
  return true;
}

}
