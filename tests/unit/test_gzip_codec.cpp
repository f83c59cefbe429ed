#include "line_chunker/gzip_codec.hpp"
#include <iostream>
#include <string>

int main(){
  std::string text;
  for (int i = 0; i < 5000; ++i) text += "line " + std::to_string(i) + " of the export\n";

  std::string z, back, err;
  if (!lc::gzip_compress(text, 6, z, &err)) { std::cerr << "[FAIL] compress: " << err << "\n"; return 1; }
  if (z.size() < 2 || static_cast<unsigned char>(z[0]) != 0x1F || static_cast<unsigned char>(z[1]) != 0x8B) {
    std::cerr << "[FAIL] missing gzip magic\n"; return 1;
  }
  if (z.size() >= text.size()) { std::cerr << "[FAIL] no size reduction\n"; return 1; }
  if (!lc::gzip_decompress(z, back, &err) || back != text) { std::cerr << "[FAIL] decompress: " << err << "\n"; return 1; }

  if (!lc::gzip_compress("", 1, z, &err) || !lc::gzip_decompress(z, back, &err) || !back.empty()) {
    std::cerr << "[FAIL] empty payload\n"; return 1;
  }

  if (lc::gzip_decompress(z.substr(0, z.size() / 2), back, &err)) {
    std::cerr << "[FAIL] truncated stream accepted\n"; return 1;
  }

  std::cout << "[PASS] gzip codec\n";
  return 0;
}
