#pragma once
#include <string_view>
#include <vector>
#include <cstddef>

namespace lc {

// Growable byte buffer holding the bytes of the chunk being built.
class ChunkArena {
public:
  explicit ChunkArena(std::size_t cap_bytes = 0);

  void append(std::string_view s);
  std::string_view view() const noexcept;
  std::string_view view(std::size_t off, std::size_t n) const noexcept;

  // Drop the first `n` bytes; the remainder moves to offset 0.
  void consume(std::size_t n) noexcept;

  // Reset head to zero; capacity stays (reuse buffer).
  void reset() noexcept;

  // Reset and optionally shrink capacity to `keep_capacity` bytes.
  void reset_and_shrink(std::size_t keep_capacity = 0);

  bool empty() const noexcept { return head_ == 0; }
  std::size_t used() const noexcept;
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t high_water_{0};
};

}
