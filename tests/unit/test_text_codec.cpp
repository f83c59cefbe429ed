#include "line_chunker/text_codec.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void expect(bool ok, const char* what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main(){
  {
    lc::TextCodec c(lc::Encoding::Utf8);
    expect(c.ok(), "utf8 codec opens");
    // "a" U+00E9 U+4E2D "\n"
    const std::string bytes = "a\xC3\xA9\xE4\xB8\xAD\n";
    auto d = c.decode(bytes);
    expect(!d.had_errors(), "valid utf8 decodes cleanly");
    expect(d.text == U"a\u00E9\u4E2D\n", "utf8 decoded text");
    expect(c.byte_offset(bytes, d, 2) == std::optional<std::size_t>(3), "offset after e-acute");
    expect(c.byte_offset(bytes, d, 3) == std::optional<std::size_t>(6), "offset after CJK char");
    expect(c.byte_offset(bytes, d, 4) == std::optional<std::size_t>(7), "offset at end");
    expect(!c.byte_offset(bytes, d, 5), "offset past end");
  }
  {
    lc::TextCodec c(lc::Encoding::Utf8);
    const std::string bytes = "ab\xFF" "cd\xE4\xB8";  // stray byte, truncated tail
    auto d = c.decode(bytes);
    expect(d.invalid_sequences == 1, "stray byte counted");
    expect(d.truncated_tail && d.had_errors(), "truncated tail flagged separately");
    expect(d.text == U"ab\uFFFDcd\uFFFD", "replacement characters");
    expect(!d.spans.back().valid && d.spans.back().byte_end == bytes.size(), "truncated tail span");
    expect(c.byte_offset(bytes, d, 3) == std::optional<std::size_t>(3), "offset after bad byte");
    expect(c.byte_offset(bytes, d, 5) == std::optional<std::size_t>(5), "offset before tail");
    expect(c.byte_offset(bytes, d, 6) == std::optional<std::size_t>(7), "offset past tail");
  }
  {
    lc::TextCodec c(lc::Encoding::Gbk);
    expect(c.ok(), "gbk codec opens");
    const std::string bytes = "\xD6\xD0\xCE\xC4\r\n";  // zhong wen CRLF
    auto d = c.decode(bytes);
    expect(!d.had_errors() && d.text == U"\u4E2D\u6587\r\n", "gbk decode");
    auto cut = c.decode(bytes.substr(0, 3));
    expect(cut.truncated_tail && cut.invalid_sequences == 0, "split double-byte char is not invalid");
    expect(c.byte_offset(bytes, d, 1) == std::optional<std::size_t>(2), "gbk double-byte offset");

    std::string enc;
    expect(c.encode(U"\u4E2D\n", enc) && enc == "\xD6\xD0\n", "gbk encode");
    expect(!c.encode(U"\U0001F600", enc), "emoji not representable in gbk");
  }
  {
    lc::TextCodec c(lc::Encoding::Utf16Le);
    const std::string bytes("\x41\x00\x0A\x00", 4);
    auto d = c.decode(bytes);
    expect(d.text == U"A\n", "utf16le decode");
    auto mapped = c.prefix_bytes(bytes, 1);
    expect(mapped && *mapped == 2, "utf16le prefix bytes");
  }
  {
    expect(lc::parse_encoding("utf8") == lc::Encoding::Utf8, "utf8 alias");
    expect(lc::parse_encoding("gbk") == lc::Encoding::Gbk, "gbk case-insensitive");
    expect(lc::parse_encoding("latin1") == lc::Encoding::Latin1, "latin1 alias");
    expect(!lc::parse_encoding("EBCDIC"), "unknown encoding");
  }

  if (failures) return 1;
  std::cout << "[PASS] text codec\n";
  return 0;
}
