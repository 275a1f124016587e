/**
 * skymesh - File utilities
 */

#pragma once

#include "result.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace skymesh {

namespace fs = std::filesystem;

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const fs::path& path);

/**
 * Write text to file, creating parent directories.
 */
Result<void> write_text_file(const fs::path& path, std::string_view text);

/**
 * Get file extension (lowercase).
 */
std::string get_extension(const fs::path& path);

/**
 * List regular files in a directory whose extension matches (case-insensitive),
 * sorted by name.
 */
std::vector<fs::path> list_files(const fs::path& dir, std::string_view extension);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

} // namespace skymesh
