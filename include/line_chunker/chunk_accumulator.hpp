#pragma once
#include "line_chunker/chunk_arena.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace lc {

class BoundaryLocator;

// Buffers incoming bytes and cuts them into line-aligned chunks of at least
// `threshold` bytes. A single line longer than the threshold is never split;
// the chunk grows until that line ends.
class ChunkAccumulator {
public:
  struct Config {
    std::size_t threshold     = 100 * 1024 * 1024; // 100 MiB
    std::size_t initial_bytes = 0;                  // arena pre-reservation
  };

  enum class State { Empty, Accumulating, ReadyToEmit, Final };

  // Receives each finished chunk with its 1-based index. Returning false
  // aborts the run.
  using ChunkSink = std::function<bool(std::string_view chunk, std::uint64_t index)>;

  ChunkAccumulator(Config cfg, BoundaryLocator& locator, ChunkSink sink);

  bool append(std::string_view bytes);

  // Emits whatever is left as the final chunk.
  bool finish();

  State state() const noexcept;
  std::uint64_t chunks_emitted() const noexcept { return next_index_ - 1; }
  std::size_t pending_bytes() const noexcept { return arena_.used(); }
  std::size_t high_water() const noexcept { return arena_.high_water(); }
  const std::string& error() const { return err_; }

private:
  bool emit(std::size_t off, std::size_t n);

  Config cfg_;
  BoundaryLocator& locator_;
  ChunkSink sink_;
  ChunkArena arena_;
  std::size_t line_end_{0};   // end of the last complete line in arena_
  std::size_t scanned_{0};    // next boundary search starts here
  std::size_t safe_split_{0}; // last line end below the threshold
  std::uint64_t next_index_{1};
  bool emitting_{false};
  bool finished_{false};
  std::string err_;
};

}
