#pragma once
#include <string>
#include <string_view>

namespace lc {

// Whole-buffer gzip (RFC 1952) via zlib. `level` is 1..9.
bool gzip_compress(std::string_view in, int level, std::string& out,
                   std::string* err_out = nullptr);

// Accepts gzip or zlib framing.
bool gzip_decompress(std::string_view in, std::string& out,
                     std::string* err_out = nullptr);

}
