/**
 * skymesh - Compressed strategy
 *
 * Payloads written with compressPositions / compressUvs. The shared vertex
 * count and the index count sit at 0x74 / 0x78; positions are either u16
 * quantized after the range header or packed bytes at the payload tail.
 * Later exports without a range header keep their counts at 0x34 / 0x38 and
 * store raw u16 positions at 0x60. Index offsets are not recorded, the
 * locator finds them.
 */

#include "skymesh/strategies.hpp"
#include "skymesh/mesh_validator.hpp"
#include "skymesh/logging.hpp"
#include <array>
#include <optional>
#include <utility>

namespace skymesh {

namespace {

constexpr int32_t COMPRESSED_MAX_SHARED = 100000;
constexpr int32_t COMPRESSED_MAX_TOTAL = 1000000;
constexpr int32_t RAW_MAX_SHARED = 100000;
constexpr int32_t RAW_MAX_TOTAL = 300000;

enum class Encoding {
    Raw,
    Quantized,
    Normalized
};

const char* encoding_name(Encoding e) {
    switch (e) {
        case Encoding::Raw: return "raw";
        case Encoding::Quantized: return "quantized";
        case Encoding::Normalized: return "normalized";
    }
    return "unknown";
}

} // namespace

Result<DecodedMesh> CompressedStrategy::decode_raw(const ByteView& payload, const DecodeOptions& options) const {
    auto shared = payload.i32(RAW_OFF_SHARED_COUNT);
    auto total = payload.i32(RAW_OFF_INDEX_COUNT);
    if (!shared || !total || !payload.has(RAW_OFF_UV_COUNT, 4)) {
        return Error::size_mismatch("Payload too short for raw counts (" + std::to_string(payload.size()) + " bytes)");
    }
    if (*shared <= 0 || *shared >= RAW_MAX_SHARED || *total <= 0 || *total >= RAW_MAX_TOTAL || *total % 3 != 0) {
        return Error::malformed_header("No raw counts at 0x34 (shared=" + std::to_string(*shared) +
                                       " total=" + std::to_string(*total) + ")");
    }

    const size_t vertex_count = static_cast<size_t>(*shared);
    const size_t face_count = static_cast<size_t>(*total) / 3;
    SKYMESH_TRY_ASSIGN(attributes, extract_raw_u16(payload, vertex_count));

    const std::array<size_t, 1> anchors = {attributes.search_anchor};
    IndexLocator locator(options.locator);
    SKYMESH_TRY_ASSIGN(region, locator.locate(payload, vertex_count, face_count, anchors));

    SKYMESH_TRACE(options, "Compressed", "raw u16 indices at 0x" << std::hex << region.offset << std::dec
                  << " (" << index_width_bits(region.width) << "-bit, " << region.iterations << " probes)");

    DecodedMesh mesh;
    mesh.vertices = std::move(attributes.vertices);
    mesh.uvs = std::move(attributes.uvs);
    mesh.faces = std::move(region.faces);
    return mesh;
}

Result<DecodedMesh> CompressedStrategy::decode_quantized(const ByteView& payload, size_t vertex_count,
                                                         size_t face_count, const DecodeOptions& options) const {
    SKYMESH_TRY_ASSIGN(attributes, extract_quantized(payload, vertex_count));

    const std::array<size_t, 2> anchors = {attributes.search_anchor, QUANT_OFF_VERTICES};
    IndexLocator locator(options.locator);
    SKYMESH_TRY_ASSIGN(region, locator.locate(payload, vertex_count, face_count, anchors));

    SKYMESH_TRACE(options, "Compressed", "quantized indices at 0x" << std::hex << region.offset << std::dec
                  << " (" << index_width_bits(region.width) << "-bit, " << region.iterations << " probes)");

    DecodedMesh mesh;
    mesh.vertices = std::move(attributes.vertices);
    mesh.uvs = std::move(attributes.uvs);
    mesh.faces = std::move(region.faces);
    return mesh;
}

Result<DecodedMesh> CompressedStrategy::decode_normalized(const ByteView& payload, size_t vertex_count,
                                                          size_t face_count, const DecodeOptions& options) const {
    SKYMESH_TRY_ASSIGN(attributes, extract_normalized_byte(payload, vertex_count));

    // Indices precede the packed vertex block
    ByteView head(payload.slice(0, attributes.block_offset));
    const std::array<size_t, 1> anchors = {QUANT_OFF_VERTICES};
    IndexLocator locator(options.locator);
    SKYMESH_TRY_ASSIGN(region, locator.locate(head, vertex_count, face_count, anchors));

    DecodedMesh mesh;
    mesh.vertices = std::move(attributes.vertices);
    mesh.uvs = std::move(attributes.uvs);
    mesh.faces = std::move(region.faces);

    // A gap of exactly one u16 pair per vertex holds the UVs
    size_t gap = attributes.block_offset - region.end();
    if (gap == vertex_count * QUANT_UV_SIZE) {
        if (auto uvs = read_companion_uvs(payload, region.end(), vertex_count)) {
            mesh.uvs = std::move(*uvs);
            SKYMESH_TRACE(options, "Compressed", "companion UV block at 0x" << std::hex << region.end());
        }
    }

    SKYMESH_TRACE(options, "Compressed", "packed vertices at 0x" << std::hex << attributes.block_offset
                  << ", indices at 0x" << region.offset << std::dec
                  << " (" << index_width_bits(region.width) << "-bit)");
    return mesh;
}

Result<DecodedMesh> CompressedStrategy::decode(const MeshFile& file, const AssetHints& hints,
                                               const DecodeOptions& options) const {
    MeshValidator validator(options.min_vertices);
    Error last = Error::malformed_header("No compressed layout candidate");

    // Header-less payloads are probed first unless the asset packs its positions
    std::array<Encoding, 3> order = {Encoding::Raw, Encoding::Quantized, Encoding::Normalized};
    if (hints.compress_positions) {
        order = {Encoding::Normalized, Encoding::Raw, Encoding::Quantized};
    }
    if (hints.compress_uvs || hints.special_keyword) {
        SKYMESH_TRACE(options, "Compressed", "asset flagged compressUvs/special export");
    }

    for (const auto& candidate : candidates_for(StrategyFamily::Compressed)) {
        auto payload = load_payload(file.bytes, candidate, options);
        if (!payload) {
            last = payload.error();
            continue;
        }
        ByteView view(*payload);

        // Counts used by the quantized and normalized encodings
        auto shared = view.i32(QUANT_OFF_SHARED_COUNT);
        auto total = view.i32(QUANT_OFF_INDEX_COUNT);
        std::optional<Error> count_error;
        if (!shared || !total) {
            count_error = Error::size_mismatch("Payload too short for counts (" +
                                               std::to_string(view.size()) + " bytes)", candidate.name);
        } else if (*shared <= 0 || *shared > COMPRESSED_MAX_SHARED ||
                   *total <= 0 || *total > COMPRESSED_MAX_TOTAL || *total % 3 != 0) {
            SKYMESH_TRACE(options, "Compressed", candidate.name << ": counts shared=" << *shared
                          << " total=" << *total << " rejected");
            count_error = Error::malformed_header("Implausible counts shared=" + std::to_string(*shared) +
                                                  " total=" + std::to_string(*total), candidate.name);
        }

        auto attempt = [&](Encoding encoding) -> Result<DecodedMesh> {
            if (encoding == Encoding::Raw) {
                return decode_raw(view, options);
            }
            if (count_error) {
                return *count_error;
            }
            const size_t vertex_count = static_cast<size_t>(*shared);
            const size_t face_count = static_cast<size_t>(*total) / 3;
            return encoding == Encoding::Quantized
                ? decode_quantized(view, vertex_count, face_count, options)
                : decode_normalized(view, vertex_count, face_count, options);
        };

        for (Encoding encoding : order) {
            auto mesh = attempt(encoding);
            if (!mesh) {
                SKYMESH_TRACE(options, "Compressed", candidate.name << " " << encoding_name(encoding)
                              << ": " << mesh.error().message);
                last = Error(mesh.error().code, mesh.error().message,
                             std::string(candidate.name) + "/" + encoding_name(encoding));
                continue;
            }

            auto plausible = validator.check(*mesh);
            if (!plausible) {
                last = Error(plausible.error().code, plausible.error().message,
                             std::string(candidate.name) + "/" + encoding_name(encoding));
                continue;
            }

            return mesh;
        }
    }

    return last;
}

} // namespace skymesh
