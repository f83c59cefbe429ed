#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lc {

enum class Encoding { Utf8, Gbk, Gb18030, Utf16Le, Utf16Be, Latin1 };

// Case-insensitive: "UTF-8", "utf8", "GBK", "GB18030", "UTF-16LE", "UTF-16BE",
// "ISO-8859-1", "LATIN1".
std::optional<Encoding> parse_encoding(std::string_view name);
const char* encoding_name(Encoding e);

// A run of decoded characters and the input bytes they came from.
// Invalid runs hold exactly one U+FFFD.
struct DecodedSpan {
  std::size_t byte_begin = 0;
  std::size_t byte_end   = 0;
  std::size_t char_begin = 0;
  std::size_t char_end   = 0;
  bool        valid      = true;
};

struct DecodedText {
  std::u32string text;
  std::vector<DecodedSpan> spans;
  std::size_t invalid_sequences = 0;
  // The input ended inside a character. Its bytes are the last (invalid)
  // span and are not counted in invalid_sequences.
  bool truncated_tail = false;

  bool had_errors() const noexcept { return invalid_sequences != 0 || truncated_tail; }
};

// iconv-backed converter between `Encoding` and UTF-32.
class TextCodec {
public:
  explicit TextCodec(Encoding enc);
  ~TextCodec();

  TextCodec(const TextCodec&) = delete;
  TextCodec& operator=(const TextCodec&) = delete;

  bool ok() const noexcept;
  Encoding encoding() const noexcept;
  const std::string& error() const { return err_; }

  // Best effort: never fails, bad sequences become U+FFFD.
  DecodedText decode(std::string_view bytes);

  bool encode(std::u32string_view text, std::string& out);

  // Number of bytes at the front of `bytes` that decode to exactly `chars`
  // characters. `bytes` must start on a character boundary and decode cleanly.
  std::optional<std::size_t> prefix_bytes(std::string_view bytes, std::size_t chars);

  // Byte offset in the decoded input of character position `char_pos`.
  std::optional<std::size_t> byte_offset(std::string_view bytes,
                                         const DecodedText& d,
                                         std::size_t char_pos);

private:
  struct Impl; Impl* p_;
  std::string err_;
};

// Maps increasing character positions of one DecodedText back to byte offsets.
// A sequence of non-decreasing queries costs one pass over the input.
class OffsetMapper {
public:
  OffsetMapper(TextCodec& codec, std::string_view bytes, const DecodedText& d);

  std::optional<std::size_t> byte_at(std::size_t char_pos);

private:
  TextCodec& codec_;
  std::string_view bytes_;
  const DecodedText& d_;
  std::size_t span_{0};
  std::size_t anchor_char_{0};
  std::size_t anchor_byte_{0};
};

}
