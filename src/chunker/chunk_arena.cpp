#include "line_chunker/chunk_arena.hpp"
#include <algorithm>
#include <cstring>

namespace lc {

ChunkArena::ChunkArena(std::size_t cap_bytes) : buf_(cap_bytes), head_(0), high_water_(0) {}

void ChunkArena::append(std::string_view s) {
  if (s.empty()) return;
  if (head_ + s.size() > buf_.size()) {
    std::size_t need = head_ + s.size();
    std::size_t grow = std::max(need, buf_.size() + buf_.size() / 2 + 1);
    buf_.resize(grow);
  }
  std::memcpy(buf_.data() + head_, s.data(), s.size());
  head_ += s.size();
  if (head_ > high_water_) high_water_ = head_;
}

std::string_view ChunkArena::view() const noexcept {
  return std::string_view(buf_.data(), head_);
}

std::string_view ChunkArena::view(std::size_t off, std::size_t n) const noexcept {
  if (off > head_) return {};
  return std::string_view(buf_.data() + off, std::min(n, head_ - off));
}

void ChunkArena::consume(std::size_t n) noexcept {
  if (n == 0) return;
  if (n >= head_) { head_ = 0; return; }
  std::memmove(buf_.data(), buf_.data() + n, head_ - n);
  head_ -= n;
}

void ChunkArena::reset() noexcept { head_ = 0; }

void ChunkArena::reset_and_shrink(std::size_t keep_capacity) {
  head_ = 0;
  if (keep_capacity < buf_.size()) {
    buf_.resize(keep_capacity);
    buf_.shrink_to_fit();
  }
}

std::size_t ChunkArena::used() const noexcept { return head_; }
std::size_t ChunkArena::capacity() const noexcept { return buf_.size(); }
std::size_t ChunkArena::high_water() const noexcept { return high_water_; }

}
