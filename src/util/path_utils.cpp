#include "line_chunker/path_utils.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>

namespace lc {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string chunk_path(std::string_view prefix, std::uint64_t index, int width, std::string_view ext) {
  std::ostringstream o;
  o << prefix << '.' << std::setw(width) << std::setfill('0') << index << ext;
  return o.str();
}

std::string sha256_hex(std::string_view data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) return {};
  std::ostringstream o;
  for (unsigned int i = 0; i < md_len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  return o.str();
}

std::string escape_for_display(std::string_view s) {
  std::string out;
  out.reserve(s.size() * 2);
  const char* hex = "0123456789abcdef";
  for (unsigned char c : s) {
    if (c == '\n')      out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (c == '\\') out += "\\\\";
    else if (c < 0x20 || c == 0x7f) { out += "\\x"; out += hex[c >> 4]; out += hex[c & 0xF]; }
    else out.push_back(static_cast<char>(c));
  }
  return out;
}

}
