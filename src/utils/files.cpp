/**
 * skymesh - File Utilities Implementation
 */

#include "skymesh/files.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace skymesh {

Result<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error::file_not_found(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file", path.string());
    }

    file.seekg(0, std::ios::end);
    auto size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return Error::io_error("Short read", path.string());
    }
    return data;
}

Result<void> write_text_file(const fs::path& path, std::string_view text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Cannot create directory: " + ec.message(), path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::io_error("Cannot open file for writing", path.string());
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }
    return Result<void>::success();
}

std::string get_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<fs::path> list_files(const fs::path& dir, std::string_view extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && get_extension(it->path()) == extension) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

} // namespace skymesh
