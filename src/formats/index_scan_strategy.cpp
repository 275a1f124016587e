/**
 * skymesh - Index scan strategy
 *
 * Nothing about the layout is trusted: count pairs are searched over the
 * start of the buffer, positions over a handful of starts and strides, and
 * the indices with the locator. Runs on every decompressible scan_*
 * payload, then on the file body itself.
 */

#include "skymesh/strategies.hpp"
#include "skymesh/mesh_validator.hpp"
#include "skymesh/logging.hpp"
#include <array>
#include <cmath>

namespace skymesh {

namespace {

constexpr size_t COUNT_SCAN_BEGIN = 0x20;
constexpr size_t COUNT_SCAN_END = 0x100;
constexpr size_t COUNT_SCAN_STEP = 4;

constexpr uint32_t SCAN_MIN_COUNT = 5;
constexpr uint32_t SCAN_MAX_SHARED = 200000;
constexpr uint32_t SCAN_MAX_TOTAL = 600000;

constexpr std::array<size_t, 5> VERTEX_STARTS = {0xB3, 0x60, 0x70, 0x80, 0x90};
constexpr std::array<size_t, 5> VERTEX_STRIDES = {12, 16, 20, 24, 8};

constexpr float MAX_COORDINATE = 10000.0f;

// Scan payloads past this many are not decompressed
constexpr size_t MAX_SCAN_PAYLOADS = 3;

bool positions_sane(const std::vector<Vertex>& vertices) {
    for (const auto& v : vertices) {
        if (!std::isfinite(v.x) || !std::isfinite(v.y) || !std::isfinite(v.z)) return false;
        if (std::abs(v.x) > MAX_COORDINATE || std::abs(v.y) > MAX_COORDINATE ||
            std::abs(v.z) > MAX_COORDINATE) return false;
    }
    return true;
}

bool cancelled(const DecodeOptions& options) {
    return options.locator.cancel && options.locator.cancel->load(std::memory_order_relaxed);
}

} // namespace

Result<DecodedMesh> IndexScanStrategy::scan_buffer(const ByteView& buffer, const DecodeOptions& options) const {
    MeshValidator validator(options.min_vertices);
    IndexLocator locator(options.locator);
    Error last = Error::malformed_header("No plausible count pair");

    for (size_t off = COUNT_SCAN_BEGIN; off < COUNT_SCAN_END; off += COUNT_SCAN_STEP) {
        auto shared = buffer.u32(off);
        auto total = buffer.u32(off + 4);
        if (!shared || !total) break;

        if (*shared < SCAN_MIN_COUNT || *shared >= SCAN_MAX_SHARED ||
            *total < SCAN_MIN_COUNT || *total >= SCAN_MAX_TOTAL || *total % 3 != 0) {
            continue;
        }

        const size_t vertex_count = *shared;
        const size_t face_count = *total / 3;

        for (size_t start : VERTEX_STARTS) {
            for (size_t stride : VERTEX_STRIDES) {
                if (cancelled(options)) {
                    return Error::index_not_found("Index scan cancelled");
                }

                auto vertices = read_float_positions(buffer, start, vertex_count, stride);
                if (!vertices || !positions_sane(*vertices)) {
                    continue;
                }

                UvLayout uv_layout;
                uv_layout.start = start + vertex_count * stride;
                uv_layout.count = vertex_count;
                uv_layout.stride = UV_RECORD_SIZE;
                uv_layout.encoding = UvEncoding::Half;
                uv_layout.default_missing = true;

                auto uvs = read_uvs(buffer, uv_layout);
                if (!uvs) {
                    last = uvs.error();
                    continue;
                }

                const std::array<size_t, 2> anchors = {uv_layout.start + vertex_count * UV_RECORD_SIZE, 0};
                auto region = locator.locate(buffer, vertex_count, face_count, anchors);
                if (!region) {
                    last = region.error();
                    continue;
                }

                DecodedMesh mesh;
                mesh.vertices = std::move(*vertices);
                mesh.uvs = std::move(*uvs);
                mesh.faces = std::move(region->faces);

                auto plausible = validator.check(mesh);
                if (!plausible) {
                    last = plausible.error();
                    continue;
                }

                SKYMESH_TRACE(options, "IndexScan", "counts at 0x" << std::hex << off
                              << ", vertices at 0x" << start << std::dec << " stride " << stride
                              << ", indices at 0x" << std::hex << region->offset << std::dec
                              << " (" << index_width_bits(region->width) << "-bit)");
                return mesh;
            }
        }
    }

    return last;
}

Result<DecodedMesh> IndexScanStrategy::decode(const MeshFile& file, const AssetHints& /*hints*/,
                                              const DecodeOptions& options) const {
    std::vector<std::vector<uint8_t>> payloads;
    for (const auto& candidate : candidates_for(StrategyFamily::IndexScan)) {
        if (payloads.size() >= MAX_SCAN_PAYLOADS) break;
        auto payload = load_payload(file.body, candidate, options);
        if (payload) {
            payloads.push_back(std::move(*payload));
        }
    }

    Error last = Error::malformed_header("Nothing to scan");
    for (const auto& payload : payloads) {
        auto mesh = scan_buffer(ByteView(payload), options);
        if (mesh) {
            return mesh;
        }
        last = mesh.error();
    }

    // The body may not be compressed at all
    auto mesh = scan_buffer(ByteView(file.body), options);
    if (mesh) {
        return mesh;
    }
    if (payloads.empty()) {
        last = mesh.error();
    }
    return last;
}

} // namespace skymesh
