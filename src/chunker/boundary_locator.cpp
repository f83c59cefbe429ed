#include "line_chunker/boundary_locator.hpp"
#include <algorithm>

namespace lc {

struct BoundaryLocator::Impl {
  Config cfg;
  WarningCallback on_warning;
  TextCodec codec;
  std::u32string pattern;
  std::string encoded;
  std::string err;
  std::uint64_t warnings{0};
  std::uint64_t scanned{0};

  Impl(Config c, WarningCallback cb)
    : cfg(std::move(c)), on_warning(std::move(cb)), codec(cfg.encoding) {
    if (!codec.ok()) { err = codec.error(); return; }
    if (cfg.line_ending.empty()) { err = "line ending is empty"; return; }

    TextCodec utf8(Encoding::Utf8);
    DecodedText d = utf8.decode(cfg.line_ending);
    if (!utf8.ok() || d.had_errors()) { err = "line ending is not valid UTF-8"; return; }
    pattern = std::move(d.text);

    if (!codec.encode(pattern, encoded)) {
      err = "line ending cannot be encoded: " + codec.error();
      pattern.clear();
    }
  }

  bool ok() const noexcept { return err.empty() && !pattern.empty(); }

  DecodedText decode(std::string_view bytes) {
    scanned += bytes.size();
    return codec.decode(bytes);
  }

  // Counts invalid spans starting before `limit`. A truncated last character
  // is only counted when `with_tail` is set.
  void report(const DecodedText& d, std::size_t limit, bool with_tail) {
    std::uint64_t n = 0;
    for (std::size_t i = 0; i < d.spans.size(); ++i) {
      const DecodedSpan& s = d.spans[i];
      if (s.valid || s.byte_begin >= limit) continue;
      if (d.truncated_tail && i + 1 == d.spans.size() && !with_tail) continue;
      ++n;
    }
    if (n == 0) return;
    warnings += n;
    if (on_warning) {
      on_warning(n, std::to_string(n) + " invalid " + encoding_name(cfg.encoding) +
                    " sequence(s) in " + std::to_string(limit) + " scanned bytes");
    }
  }

  // Ends of the boundaries selected as cuts, at most `max_cuts` of them.
  std::vector<std::size_t> cuts(std::string_view bytes, std::size_t first_min,
                                std::size_t threshold, std::size_t max_cuts) {
    std::vector<std::size_t> out;
    if (!ok() || bytes.empty() || first_min > bytes.size()) return out;

    DecodedText d = decode(bytes);
    OffsetMapper map(codec, bytes, d);
    std::size_t need = first_min;
    std::size_t from = 0;
    while (out.size() < max_cuts) {
      const std::size_t pos = d.text.find(pattern, from);
      if (pos == std::u32string::npos) break;
      from = pos + pattern.size();
      auto end = map.byte_at(from);
      if (!end) break;
      if (*end >= need) {
        out.push_back(*end);
        need = *end + std::max<std::size_t>(threshold, 1);
      }
    }
    return out;
  }
};

BoundaryLocator::BoundaryLocator(Config cfg, WarningCallback on_warning)
  : p_(new Impl(std::move(cfg), std::move(on_warning))) {}

BoundaryLocator::~BoundaryLocator() { delete p_; }

bool BoundaryLocator::ok() const noexcept { return p_->ok(); }
const std::string& BoundaryLocator::error() const { return p_->err; }
const std::string& BoundaryLocator::encoded_line_ending() const noexcept { return p_->encoded; }
std::uint64_t BoundaryLocator::decode_warnings() const noexcept { return p_->warnings; }
std::uint64_t BoundaryLocator::bytes_scanned() const noexcept { return p_->scanned; }

std::optional<std::size_t> BoundaryLocator::locate_last_boundary(std::string_view bytes,
                                                                 std::size_t* resume) {
  if (resume) *resume = 0;
  if (!p_->ok() || bytes.empty()) return std::nullopt;

  DecodedText d = p_->decode(bytes);
  const std::u32string& pat = p_->pattern;
  const std::size_t pos = d.text.rfind(pat);

  std::optional<std::size_t> found;
  if (pos != std::u32string::npos) {
    found = p_->codec.byte_offset(bytes, d, pos + pat.size());
  }

  // A line ending may straddle the end of the span; so may a truncated
  // character, which decodes differently once its tail arrives.
  std::size_t r = d.text.size() >= pat.size() - 1 ? d.text.size() - (pat.size() - 1) : 0;
  if (!d.spans.empty() && !d.spans.back().valid) r = std::min(r, d.spans.back().char_begin);
  if (pos != std::u32string::npos) r = std::max(r, pos + pat.size());
  auto b = p_->codec.byte_offset(bytes, d, r);
  const std::size_t next = b ? *b : (found ? *found : 0);

  p_->report(d, next, false);
  if (resume) *resume = next;
  return found;
}

std::optional<std::size_t> BoundaryLocator::locate_first_boundary(std::string_view bytes,
                                                                  std::size_t min_end) {
  auto c = p_->cuts(bytes, min_end, 1, 1);
  if (c.empty()) return std::nullopt;
  return c.front();
}

std::vector<std::size_t> BoundaryLocator::locate_cuts(std::string_view bytes,
                                                      std::size_t first_min,
                                                      std::size_t threshold) {
  return p_->cuts(bytes, first_min, threshold, bytes.size());
}

void BoundaryLocator::finish_scan(std::string_view tail) {
  if (!p_->ok() || tail.empty()) return;
  DecodedText d = p_->decode(tail);
  p_->report(d, tail.size(), true);
}

std::optional<std::size_t> locate_last_boundary(std::string_view bytes,
                                                std::string_view line_ending,
                                                Encoding encoding) {
  BoundaryLocator loc(BoundaryLocator::Config{std::string(line_ending), encoding});
  return loc.locate_last_boundary(bytes);
}

}
