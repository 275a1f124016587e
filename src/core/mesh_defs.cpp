/**
 * skymesh - Asset metadata table Implementation
 */

#include "skymesh/mesh_defs.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace skymesh {

namespace {

std::string trim(std::string_view s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return std::string(s.substr(begin, end - begin));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool param_true(const MeshDefParams& params, const char* key) {
    auto it = params.find(key);
    return it != params.end() && to_lower(it->second) == "true";
}

} // namespace

AssetHints hints_from_filename(std::string_view name) {
    static constexpr std::string_view SPECIAL_KEYWORDS[] = {
        "StripAnim", "CompOcc", "StripNorm", "StripUv13", "CopyFrameDelay"
    };

    AssetHints hints;
    hints.compress_positions = name.find("ZipPos") != std::string_view::npos;
    hints.compress_uvs = name.find("ZipUvs") != std::string_view::npos;
    for (auto keyword : SPECIAL_KEYWORDS) {
        if (name.find(keyword) != std::string_view::npos) {
            hints.special_keyword = true;
            break;
        }
    }
    return hints;
}

MeshDefs MeshDefs::parse(std::string_view text) {
    static const std::regex resource_re(R"re(resource\s+"Mesh"\s+"([^"]+)"\s*\{([^}]+)\})re");

    MeshDefs defs;
    std::string content(text);

    for (std::sregex_iterator it(content.begin(), content.end(), resource_re), end; it != end; ++it) {
        const std::string name = (*it)[1].str();
        const std::string block = (*it)[2].str();

        MeshDefParams params;
        size_t pos = 0;
        while (pos <= block.size()) {
            size_t comma = block.find(',', pos);
            if (comma == std::string::npos) comma = block.size();
            std::string_view item(block.data() + pos, comma - pos);

            size_t eq = item.find('=');
            if (eq != std::string_view::npos) {
                std::string key = trim(item.substr(0, eq));
                std::string value = trim(item.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                if (!key.empty()) {
                    params[key] = value;
                }
            }
            pos = comma + 1;
        }

        defs.entries_[name] = std::move(params);
    }

    return defs;
}

Result<MeshDefs> MeshDefs::load(const fs::path& path) {
    auto data = read_file(path);
    if (!data) {
        return data.error();
    }

    std::string_view text(reinterpret_cast<const char*>(data->data()), data->size());
    try {
        MeshDefs defs = parse(text);
        LOG_INFO("MeshDefs", "Loaded " << defs.size() << " entries from " << path.string());
        return defs;
    } catch (const std::regex_error& e) {
        // libstdc++ regex can overflow its stack on pathological input
        return Error::invalid_format(std::string("MeshDefs parse failed: ") + e.what(), path.string());
    }
}

const MeshDefParams* MeshDefs::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it != entries_.end() ? &it->second : nullptr;
}

AssetHints MeshDefs::hints_for(const fs::path& file) const {
    const std::string stem = file.stem().string();
    AssetHints hints = hints_from_filename(stem);

    if (const MeshDefParams* params = find(stem)) {
        hints.compress_positions = hints.compress_positions || param_true(*params, "compressPositions");
        hints.compress_uvs = hints.compress_uvs || param_true(*params, "compressUvs");
    }
    return hints;
}

} // namespace skymesh
