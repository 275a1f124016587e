/**
 * skymesh - Asset metadata table
 *
 * Reads the game's MeshDefs.lua, which lists per-asset export flags:
 *
 *   resource "Mesh" "<name>" { compressPositions = true, compressUvs = false, ... }
 *
 * and derives AssetHints from it and from keywords in the asset file name.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <map>
#include <string>
#include <string_view>
#include <optional>

namespace skymesh {

/**
 * Raw key = value pairs of one resource block. Values keep their Lua
 * spelling with surrounding quotes removed.
 */
using MeshDefParams = std::map<std::string, std::string>;

/**
 * Hints from file-name keywords: ZipPos, ZipUvs, StripAnim, CompOcc,
 * StripNorm, StripUv13, CopyFrameDelay.
 */
AssetHints hints_from_filename(std::string_view name);

class MeshDefs {
public:
    MeshDefs() = default;

    static MeshDefs parse(std::string_view text);
    static Result<MeshDefs> load(const fs::path& path);

    const MeshDefParams* find(const std::string& name) const;

    /**
     * Hints for an asset: table flags merged with file-name keywords.
     */
    AssetHints hints_for(const fs::path& file) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, MeshDefParams> entries_;
};

} // namespace skymesh
