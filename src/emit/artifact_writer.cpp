#include "line_chunker/artifact_writer.hpp"
#include "line_chunker/path_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>

namespace lc {

bool write_artifact(const std::filesystem::path& path,
                    std::string_view bytes,
                    std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create directory for " + path.string();
    return false;
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "open failed: " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    if (err_out) *err_out = "write failed: " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

}
