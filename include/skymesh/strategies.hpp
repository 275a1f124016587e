/**
 * skymesh - Built-in parse strategies
 *
 * In decode priority order: structured, heuristic, compressed, index_scan.
 */

#pragma once

#include "parse_strategy.hpp"
#include "layout_table.hpp"
#include "field_extractors.hpp"
#include "index_locator.hpp"
#include <vector>
#include <cstdint>

namespace skymesh {

/**
 * Locate the candidate's block in file and decompress it.
 */
Result<std::vector<uint8_t>> load_payload(std::span<const uint8_t> file, const LayoutCandidate& candidate,
                                          const DecodeOptions& options);

/**
 * The 0xB3-byte flags block that opens structured payloads.
 */
struct FlagsBlock {
    uint32_t vertex_count = 0;
    uint32_t corner_count = 0;
    bool is_idx32 = false;
    uint32_t uv_count = 0;
    bool load_normals = false;
    bool skip_positions = false;
    bool skip_uvs = false;
};

Result<FlagsBlock> read_flags_block(const ByteView& payload);

/**
 * Header-driven decode (sky_v1, fmt_1f). The fmt layout reads its body
 * ZipPos style when the compress_positions hint is set.
 */
class StructuredStrategy : public ParseStrategy {
public:
    const char* name() const override { return "structured"; }

    Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                               const DecodeOptions& options) const override;

private:
    Result<DecodedMesh> read_body(const ByteView& payload, const FlagsBlock& flags,
                                  bool fmt_layout, bool has_bones) const;
    Result<DecodedMesh> read_packed_body(const ByteView& payload, const FlagsBlock& flags,
                                         bool has_bones) const;
};

/**
 * Heuristic header offsets x vertex-count sub-layouts, float32 positions at
 * 0xB3 and contiguous 16-bit faces.
 */
class HeuristicStrategy : public ParseStrategy {
public:
    const char* name() const override { return "heuristic"; }

    Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                               const DecodeOptions& options) const override;
};

/**
 * Raw u16, quantized and normalized-byte payloads, faces found by the locator.
 */
class CompressedStrategy : public ParseStrategy {
public:
    const char* name() const override { return "compressed"; }

    Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                               const DecodeOptions& options) const override;

private:
    Result<DecodedMesh> decode_raw(const ByteView& payload, const DecodeOptions& options) const;
    Result<DecodedMesh> decode_quantized(const ByteView& payload, size_t vertex_count,
                                         size_t face_count, const DecodeOptions& options) const;
    Result<DecodedMesh> decode_normalized(const ByteView& payload, size_t vertex_count,
                                          size_t face_count, const DecodeOptions& options) const;
};

/**
 * Last resort: count pairs, vertex starts and strides are all guessed.
 */
class IndexScanStrategy : public ParseStrategy {
public:
    const char* name() const override { return "index_scan"; }

    Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                               const DecodeOptions& options) const override;

private:
    Result<DecodedMesh> scan_buffer(const ByteView& buffer, const DecodeOptions& options) const;
};

} // namespace skymesh
