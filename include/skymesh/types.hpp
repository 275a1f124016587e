/**
 * skymesh - Common types and definitions
 */

#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <filesystem>
#include <functional>

namespace skymesh {

namespace fs = std::filesystem;

using Vertex = glm::vec3;   // Model-space position
using UV = glm::vec2;       // Texture coordinate
using Face = glm::uvec3;    // Triangle, indices widened to 32-bit

/**
 * Canonical decoded mesh.
 * Accepted meshes satisfy: uvs empty or uvs.size() == vertices.size(),
 * faces non-empty, every index < vertices.size().
 */
struct DecodedMesh {
    std::vector<Vertex> vertices;
    std::vector<UV> uvs;
    std::vector<Face> faces;

    uint32_t max_index() const {
        uint32_t m = 0;
        for (const auto& f : faces) {
            m = std::max(m, std::max(f.x, std::max(f.y, f.z)));
        }
        return m;
    }
};

/**
 * Per-asset hints from MeshDefs.lua or the file name. They only bias the
 * order in which encodings are tried, never correctness.
 */
struct AssetHints {
    bool compress_positions = false;   // compressPositions / "ZipPos"
    bool compress_uvs = false;         // compressUvs / "ZipUvs"
    bool special_keyword = false;      // StripAnim, CompOcc, StripNorm, ...
};

/**
 * Index Region Locator tunables.
 */
struct LocatorConfig {
    size_t step = 4;                    // Byte step between candidate starts
    double max_zero_ratio = 0.10;       // Prefix zero-index ratio above which a start is rejected
    size_t max_iterations = 5000;       // Start positions examined before giving up
    size_t prefix_triples = 5;          // Triples checked before decoding the full run
    size_t min_face_count = 1;          // Runs shorter than this are never searched
    const std::atomic<bool>* cancel = nullptr;  // Raised by the batch driver to stop a scan
};

/**
 * Options threaded into every decode call.
 */
struct DecodeOptions {
    LocatorConfig locator;
    size_t min_vertices = 10;           // Plausibility floor
    bool strip_name_header = true;      // Remove embedded file-name prefix
    bool trace = false;                 // Per-strategy debug trace
};

/**
 * Application settings (settings.json + CLI overrides).
 */
struct AppSettings {
    DecodeOptions decode;

    // Export
    bool export_uvs = true;
    fs::path output_dir = ".";
    fs::path mesh_defs_path;            // Empty: look for MeshDefs.lua next to the inputs
    bool write_json_report = false;

    // Batch
    unsigned int jobs = 1;
    size_t batch_size = 0;              // 0 = single wave
    unsigned int batch_delay_ms = 0;

    // Logging
    std::string log_level = "info";
    fs::path log_file;
    bool verbose = false;
};

/**
 * Progress callback for batch conversion.
 */
using ProgressCallback = std::function<void(size_t done, size_t total, const std::string& file)>;

} // namespace skymesh
