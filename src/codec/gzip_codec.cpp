#include "line_chunker/gzip_codec.hpp"
#include <algorithm>
#include <climits>
#include <zlib.h>

namespace lc {

namespace {

constexpr int kGzipWindow = 15 + 16; // 32K window, gzip header
constexpr int kAutoWindow = 15 + 32; // detect gzip or zlib
constexpr std::size_t kMaxStep = UINT_MAX;

// zlib takes non-const Bytef* for both directions.
Bytef* zbytes(const char* p) { return reinterpret_cast<Bytef*>(const_cast<char*>(p)); }

void set_err(std::string* err_out, const char* what, const z_stream& zs, int rc) {
  if (!err_out) return;
  *err_out = std::string(what) + " failed (" + std::to_string(rc) + ")";
  if (zs.msg) *err_out += std::string(": ") + zs.msg;
}

}

bool gzip_compress(std::string_view in, int level, std::string& out, std::string* err_out) {
  out.clear();
  z_stream zs{};
  int rc = deflateInit2(&zs, level, Z_DEFLATED, kGzipWindow, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) { set_err(err_out, "deflateInit2", zs, rc); return false; }

  out.resize(deflateBound(&zs, static_cast<uLong>(in.size())) + 64);
  std::size_t in_off = 0, out_off = 0;
  do {
    const std::size_t in_step = std::min(in.size() - in_off, kMaxStep);
    zs.next_in  = zbytes(in.data() + in_off);
    zs.avail_in = static_cast<uInt>(in_step);
    const int flush = (in_off + in_step == in.size()) ? Z_FINISH : Z_NO_FLUSH;
    do {
      if (out_off == out.size()) out.resize(out.size() * 2 + 1024);
      const std::size_t out_step = std::min(out.size() - out_off, kMaxStep);
      zs.next_out  = zbytes(&out[out_off]);
      zs.avail_out = static_cast<uInt>(out_step);
      rc = deflate(&zs, flush);
      if (rc == Z_STREAM_ERROR) { set_err(err_out, "deflate", zs, rc); deflateEnd(&zs); return false; }
      out_off += out_step - zs.avail_out;
    } while (zs.avail_out == 0);
    in_off += in_step;
  } while (rc != Z_STREAM_END);

  deflateEnd(&zs);
  out.resize(out_off);
  return true;
}

bool gzip_decompress(std::string_view in, std::string& out, std::string* err_out) {
  out.clear();
  z_stream zs{};
  int rc = inflateInit2(&zs, kAutoWindow);
  if (rc != Z_OK) { set_err(err_out, "inflateInit2", zs, rc); return false; }

  out.resize(std::max<std::size_t>(in.size() * 4, 4096));
  std::size_t in_off = 0, out_off = 0;
  while (true) {
    if (zs.avail_in == 0 && in_off < in.size()) {
      const std::size_t in_step = std::min(in.size() - in_off, kMaxStep);
      zs.next_in  = zbytes(in.data() + in_off);
      zs.avail_in = static_cast<uInt>(in_step);
      in_off += in_step;
    }
    if (out_off == out.size()) out.resize(out.size() * 2);
    const std::size_t out_step = std::min(out.size() - out_off, kMaxStep);
    zs.next_out  = zbytes(&out[out_off]);
    zs.avail_out = static_cast<uInt>(out_step);
    rc = inflate(&zs, Z_NO_FLUSH);
    out_off += out_step - zs.avail_out;
    if (rc == Z_STREAM_END) break;
    if (rc == Z_BUF_ERROR && zs.avail_in == 0 && in_off == in.size()) {
      set_err(err_out, "inflate (truncated input)", zs, rc);
      inflateEnd(&zs);
      return false;
    }
    if (rc != Z_OK && rc != Z_BUF_ERROR) {
      set_err(err_out, "inflate", zs, rc);
      inflateEnd(&zs);
      return false;
    }
  }

  inflateEnd(&zs);
  out.resize(out_off);
  return true;
}

}
