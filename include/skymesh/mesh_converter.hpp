/**
 * skymesh - Mesh Converter
 *
 * Exports decoded meshes to Wavefront OBJ.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "mesh_decoder.hpp"
#include <filesystem>
#include <string>
#include <span>
#include <optional>

namespace skymesh {

/**
 * Export options for mesh conversion.
 */
struct ExportOptions {
    bool export_uvs = true;
    bool skip_degenerate = true;    // Drop faces with repeated indices
};

class MeshConverter {
public:
    /**
     * Decode raw .mesh bytes with the given options.
     */
    MeshConverter(std::span<const uint8_t> mesh_data, const std::string& name = "mesh",
                  const AssetHints& hints = {}, const DecodeOptions& options = {});
    MeshConverter(DecodedMesh mesh, const std::string& name = "mesh");

    struct Stats {
        uint32_t vertices = 0;
        uint32_t uvs = 0;
        uint32_t faces = 0;             // Faces written
        uint32_t degenerate_faces = 0;  // Faces skipped
    };

    struct Output {
        std::string obj;
        Stats stats;
    };

    /**
     * Convert mesh to OBJ text. nullopt when decoding failed.
     */
    std::optional<Output> convert(const ExportOptions& options = {}) const;

    /**
     * Write <name>.obj into output_dir and return its path.
     */
    Result<fs::path> save(const fs::path& output_dir, const ExportOptions& options = {}) const;

    const DecodedMesh* mesh() const { return mesh_ ? &*mesh_ : nullptr; }
    const std::string& strategy() const { return strategy_; }
    const Error& error() const { return error_; }

private:
    std::string generate_obj(const ExportOptions& options, Stats& stats) const;

    std::string name_;
    std::optional<DecodedMesh> mesh_;
    std::string strategy_;
    Error error_;
};

} // namespace skymesh
