#pragma once
#include "line_chunker/text_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lc {

// Finds line-ending boundaries in a byte span by searching the decoded text,
// so that bytes inside multi-byte characters never match. Offsets returned
// are byte offsets one past the end of the matched line ending.
class BoundaryLocator {
public:
  struct Config {
    std::string line_ending = "\n";       // UTF-8 spelling of the delimiter
    Encoding    encoding    = Encoding::Utf8;
  };

  // Called with the number of invalid sequences found in a stretch of input
  // that will not be scanned again. Each invalid byte sequence is reported
  // once; a character cut off by the end of a span is left for the next scan.
  using WarningCallback = std::function<void(std::uint64_t invalid, std::string_view msg)>;

  explicit BoundaryLocator(Config cfg, WarningCallback on_warning = {});
  ~BoundaryLocator();

  BoundaryLocator(const BoundaryLocator&) = delete;
  BoundaryLocator& operator=(const BoundaryLocator&) = delete;

  // False if the encoding is unavailable or the line ending is empty,
  // malformed UTF-8, or not representable in the encoding.
  bool ok() const noexcept;
  const std::string& error() const;

  // Rightmost boundary in `bytes`. When `resume` is given it receives the
  // offset the next search of a longer span should start from. Invalid
  // sequences before that offset are reported.
  std::optional<std::size_t> locate_last_boundary(std::string_view bytes,
                                                  std::size_t* resume = nullptr);

  // First non-overlapping boundary whose end offset is >= `min_end`.
  std::optional<std::size_t> locate_first_boundary(std::string_view bytes,
                                                   std::size_t min_end);

  // Cut points of a span that starts on a boundary, found in one pass: the
  // first boundary ending at or past `first_min`, then each next boundary
  // ending at least `threshold` bytes after the previous cut.
  std::vector<std::size_t> locate_cuts(std::string_view bytes,
                                       std::size_t first_min,
                                       std::size_t threshold);

  // Reports every invalid sequence in the unscanned rest of the input,
  // including a truncated last character.
  void finish_scan(std::string_view tail);

  // Line ending as it appears on disk in the configured encoding.
  const std::string& encoded_line_ending() const noexcept;

  // Invalid sequences reported so far.
  std::uint64_t decode_warnings() const noexcept;
  std::uint64_t bytes_scanned() const noexcept;

private:
  struct Impl; Impl* p_;
};

// One-shot form; builds a locator per call.
std::optional<std::size_t> locate_last_boundary(std::string_view bytes,
                                                std::string_view line_ending,
                                                Encoding encoding);

}
