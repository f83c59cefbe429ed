#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace lc {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// "<prefix>.<index zero-padded to width><ext>", e.g. "logs/part.007.gz".
std::string chunk_path(std::string_view prefix, std::uint64_t index,
                       int width = 3, std::string_view ext = ".gz");

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

// Printable form of a delimiter: "\r\n" -> "\\r\\n".
std::string escape_for_display(std::string_view s);

}
