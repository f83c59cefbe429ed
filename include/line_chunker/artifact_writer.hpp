#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace lc {

// Writes `bytes` to `path` (truncating), creating parent directories.
bool write_artifact(const std::filesystem::path& path,
                    std::string_view bytes,
                    std::string* err_out = nullptr);

}
