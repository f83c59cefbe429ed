#include "line_chunker/text_codec.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iconv.h>

namespace lc {

namespace {

constexpr const char* kInternal = "UTF-32LE";

// iconv_open reports failure as (iconv_t)-1.
iconv_t bad_cd() { return reinterpret_cast<iconv_t>(-1); }

const char* iconv_name(Encoding e) {
  switch (e) {
    case Encoding::Utf8:    return "UTF-8";
    case Encoding::Gbk:     return "GBK";
    case Encoding::Gb18030: return "GB18030";
    case Encoding::Utf16Le: return "UTF-16LE";
    case Encoding::Utf16Be: return "UTF-16BE";
    case Encoding::Latin1:  return "ISO-8859-1";
  }
  return "UTF-8";
}

char32_t octet(const char* p, std::size_t i) {
  return static_cast<char32_t>(static_cast<unsigned char>(p[i]));
}

void append_utf32le(std::u32string& dst, const char* p, std::size_t n) {
  for (std::size_t i = 0; i + 4 <= n; i += 4) {
    dst.push_back(octet(p, i) | octet(p, i + 1) << 8 |
                  octet(p, i + 2) << 16 | octet(p, i + 3) << 24);
  }
}

std::string to_utf32le(std::u32string_view text) {
  std::string out(text.size() * 4, '\0');
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char32_t c = text[i];
    out[i * 4]     = static_cast<char>(c & 0xFF);
    out[i * 4 + 1] = static_cast<char>((c >> 8) & 0xFF);
    out[i * 4 + 2] = static_cast<char>((c >> 16) & 0xFF);
    out[i * 4 + 3] = static_cast<char>((c >> 24) & 0xFF);
  }
  return out;
}

std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

}

std::optional<Encoding> parse_encoding(std::string_view name) {
  const std::string n = upper(name);
  if (n == "UTF-8" || n == "UTF8")                          return Encoding::Utf8;
  if (n == "GBK")                                           return Encoding::Gbk;
  if (n == "GB18030")                                       return Encoding::Gb18030;
  if (n == "UTF-16LE" || n == "UTF16LE")                    return Encoding::Utf16Le;
  if (n == "UTF-16BE" || n == "UTF16BE")                    return Encoding::Utf16Be;
  if (n == "ISO-8859-1" || n == "LATIN1" || n == "LATIN-1") return Encoding::Latin1;
  return std::nullopt;
}

const char* encoding_name(Encoding e) { return iconv_name(e); }

struct TextCodec::Impl {
  Encoding enc;
  iconv_t dec{bad_cd()};
  iconv_t enc_cd{bad_cd()};

  explicit Impl(Encoding e) : enc(e) {}
  ~Impl() {
    if (dec != bad_cd())    ::iconv_close(dec);
    if (enc_cd != bad_cd()) ::iconv_close(enc_cd);
  }

  void reset_decoder() { ::iconv(dec, nullptr, nullptr, nullptr, nullptr); }
  void reset_encoder() { ::iconv(enc_cd, nullptr, nullptr, nullptr, nullptr); }
};

TextCodec::TextCodec(Encoding enc) : p_(new Impl(enc)) {
  p_->dec = ::iconv_open(kInternal, iconv_name(enc));
  if (p_->dec == bad_cd()) {
    err_ = std::string("iconv_open(") + iconv_name(enc) + " -> UTF-32LE) failed: " + std::strerror(errno);
    return;
  }
  p_->enc_cd = ::iconv_open(iconv_name(enc), kInternal);
  if (p_->enc_cd == bad_cd()) {
    err_ = std::string("iconv_open(UTF-32LE -> ") + iconv_name(enc) + ") failed: " + std::strerror(errno);
  }
}

TextCodec::~TextCodec() { delete p_; }

bool TextCodec::ok() const noexcept { return p_->dec != bad_cd() && p_->enc_cd != bad_cd(); }
Encoding TextCodec::encoding() const noexcept { return p_->enc; }

DecodedText TextCodec::decode(std::string_view bytes) {
  DecodedText d;
  if (!ok() || bytes.empty()) return d;

  p_->reset_decoder();
  // Every supported encoding spends at least one byte per character.
  std::string out(bytes.size() * 4 + 4, '\0');
  d.text.reserve(bytes.size());

  char* in = const_cast<char*>(bytes.data());
  std::size_t in_left = bytes.size();
  std::size_t run_byte = 0, run_char = 0;

  auto close_run = [&](std::size_t byte_end) {
    if (byte_end > run_byte)
      d.spans.push_back(DecodedSpan{run_byte, byte_end, run_char, d.text.size(), true});
  };

  while (in_left > 0) {
    char* o = out.data();
    std::size_t o_left = out.size();
    const std::size_t rc = ::iconv(p_->dec, &in, &in_left, &o, &o_left);
    const int e = errno;
    append_utf32le(d.text, out.data(), out.size() - o_left);
    if (rc != static_cast<std::size_t>(-1)) break;
    if (e == E2BIG) {
      if (o_left == out.size()) out.resize(out.size() * 2);
      continue;
    }

    // EILSEQ skips one byte; EINVAL (truncated tail) swallows the rest.
    const std::size_t at = bytes.size() - in_left;
    close_run(at);
    const std::size_t bad = (e == EINVAL) ? in_left : 1;
    d.spans.push_back(DecodedSpan{at, at + bad, d.text.size(), d.text.size() + 1, false});
    d.text.push_back(U'\uFFFD');
    if (e == EINVAL) d.truncated_tail = true;
    else ++d.invalid_sequences;
    in += bad;
    in_left -= bad;
    run_byte = at + bad;
    run_char = d.text.size();
    p_->reset_decoder();
  }
  close_run(bytes.size());
  return d;
}

bool TextCodec::encode(std::u32string_view text, std::string& out) {
  out.clear();
  if (!ok()) return false;
  if (text.empty()) return true;

  p_->reset_encoder();
  std::string in = to_utf32le(text);
  std::string buf(text.size() * 4 + 16, '\0');
  char* ip = in.data();
  std::size_t i_left = in.size();

  while (i_left > 0) {
    char* o = buf.data();
    std::size_t o_left = buf.size();
    const std::size_t rc = ::iconv(p_->enc_cd, &ip, &i_left, &o, &o_left);
    const int e = errno;
    out.append(buf.data(), buf.size() - o_left);
    if (rc != static_cast<std::size_t>(-1)) break;
    if (e == E2BIG) continue;
    const std::size_t at = (in.size() - i_left) / 4;
    err_ = "character #" + std::to_string(at) + " is not representable in " + iconv_name(p_->enc);
    return false;
  }

  char* o = buf.data();
  std::size_t o_left = buf.size();
  ::iconv(p_->enc_cd, nullptr, nullptr, &o, &o_left);
  out.append(buf.data(), buf.size() - o_left);
  return true;
}

std::optional<std::size_t> TextCodec::prefix_bytes(std::string_view bytes, std::size_t chars) {
  if (chars == 0) return 0;
  if (!ok()) return std::nullopt;

  p_->reset_decoder();
  // Room for exactly `chars` code points: iconv stops right after the last one.
  std::string out(chars * 4, '\0');
  char* in = const_cast<char*>(bytes.data());
  std::size_t in_left = bytes.size();
  char* o = out.data();
  std::size_t o_left = out.size();
  (void)::iconv(p_->dec, &in, &in_left, &o, &o_left);
  if (o_left != 0) return std::nullopt;
  return bytes.size() - in_left;
}

std::optional<std::size_t> TextCodec::byte_offset(std::string_view bytes,
                                                  const DecodedText& d,
                                                  std::size_t char_pos) {
  if (char_pos > d.text.size()) return std::nullopt;
  if (char_pos == 0) return 0;

  auto it = std::lower_bound(d.spans.begin(), d.spans.end(), char_pos,
                             [](const DecodedSpan& s, std::size_t c) { return s.char_end < c; });
  if (it == d.spans.end()) return std::nullopt;
  if (char_pos == it->char_end)   return it->byte_end;
  if (char_pos == it->char_begin) return it->byte_begin;

  auto n = prefix_bytes(bytes.substr(it->byte_begin, it->byte_end - it->byte_begin),
                        char_pos - it->char_begin);
  if (!n) return std::nullopt;
  return it->byte_begin + *n;
}

OffsetMapper::OffsetMapper(TextCodec& codec, std::string_view bytes, const DecodedText& d)
  : codec_(codec), bytes_(bytes), d_(d) {}

std::optional<std::size_t> OffsetMapper::byte_at(std::size_t char_pos) {
  if (char_pos > d_.text.size()) return std::nullopt;
  if (char_pos == 0) return 0;

  const auto& spans = d_.spans;
  if (span_ < spans.size() && char_pos < spans[span_].char_begin) {
    span_ = 0; anchor_char_ = 0; anchor_byte_ = 0;
  }
  while (span_ < spans.size() && spans[span_].char_end < char_pos) ++span_;
  if (span_ == spans.size()) return std::nullopt;

  const DecodedSpan& s = spans[span_];
  if (char_pos == s.char_end)   return s.byte_end;
  if (char_pos == s.char_begin) return s.byte_begin;

  if (anchor_char_ < s.char_begin || anchor_char_ > char_pos) {
    anchor_char_ = s.char_begin;
    anchor_byte_ = s.byte_begin;
  }
  auto n = codec_.prefix_bytes(bytes_.substr(anchor_byte_, s.byte_end - anchor_byte_),
                               char_pos - anchor_char_);
  if (!n) return std::nullopt;
  anchor_char_ = char_pos;
  anchor_byte_ += *n;
  return anchor_byte_;
}

}
