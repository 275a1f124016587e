/**
 * skymesh - Field Extractors
 *
 * Attribute readers for the three positional encodings found in .mesh
 * payloads: full float32, 16-bit quantized range and 8-bit normalized.
 * Each reader pairs the positions with the matching UV decoder and reports
 * where the index search should start.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "binary_reader.hpp"
#include "mesh_format.hpp"
#include <vector>
#include <cstdint>

namespace skymesh {

enum class IndexWidth : uint8_t {
    U16 = 2,
    U32 = 4
};

constexpr size_t index_width_bytes(IndexWidth width) {
    return static_cast<size_t>(width);
}

constexpr int index_width_bits(IndexWidth width) {
    return width == IndexWidth::U16 ? 16 : 32;
}

enum class UvEncoding {
    Half,       // 2 x binary16
    Float32,    // 2 x f32
    Unorm16     // 2 x u16 / 65535
};

/**
 * Positions and UVs read from a payload, plus the offsets the caller needs
 * to continue: search_anchor is the first byte after the attribute blocks,
 * block_offset the start of the position block.
 */
struct ExtractedAttributes {
    std::vector<Vertex> vertices;
    std::vector<UV> uvs;
    size_t block_offset = 0;
    size_t search_anchor = 0;
};

// ============================================================================
// Scalar decoding
// ============================================================================

inline float dequantize_unorm16(uint16_t raw, float min, float range) {
    return min + (static_cast<float>(raw) / UNORM16_DIVISOR) * range;
}

inline float dequantize_snorm8(uint8_t raw) {
    return (static_cast<float>(raw) - SNORM8_CENTER) / SNORM8_DIVISOR;
}

UV decode_uv(const uint8_t* p, UvEncoding encoding);

constexpr size_t uv_encoding_size(UvEncoding encoding) {
    return encoding == UvEncoding::Float32 ? 8 : 4;
}

// ============================================================================
// Block readers
// ============================================================================

/**
 * Read count float32 triplets starting at start, stride bytes apart.
 */
Result<std::vector<Vertex>> read_float_positions(const ByteView& payload, size_t start,
                                                 size_t count, size_t stride);

struct UvLayout {
    size_t start = 0;
    size_t count = 0;
    size_t stride = UV_RECORD_SIZE;
    size_t record_offset = 0;           // Position of the pair inside each record
    UvEncoding encoding = UvEncoding::Half;
    bool default_missing = false;       // Records past the buffer end become (0,0)
};

/**
 * Read a UV block. Without default_missing a truncated block is SizeMismatch.
 */
Result<std::vector<UV>> read_uvs(const ByteView& payload, const UvLayout& layout);

/**
 * Read face_count contiguous triples of the given width.
 */
Result<std::vector<Face>> read_faces(const ByteView& payload, size_t offset,
                                     size_t face_count, IndexWidth width);

// ============================================================================
// Direct float
// ============================================================================

struct DirectFloatLayout {
    size_t vertex_start = FLAGS_BLOCK_SIZE;
    size_t vertex_stride = POSITION_RECORD_SIZE;
    size_t uv_skip = 0;                 // Bytes between the position block and the first UV record
    size_t uv_stride = UV_RECORD_SIZE;
    size_t uv_record_offset = 0;
    UvEncoding uv_encoding = UvEncoding::Half;
    bool default_missing_uvs = false;
    size_t index_skip = 0;              // Bytes between the UV block and the index run
};

Result<ExtractedAttributes> extract_direct_float(const ByteView& payload, size_t vertex_count,
                                                 const DirectFloatLayout& layout);

// ============================================================================
// Quantized
// ============================================================================

struct QuantizationHeader {
    glm::vec3 min{0.0f};
    glm::vec3 range{0.0f};
};

/**
 * Read min xyz and range xy at 0x60. range.z repeats range.y: observed
 * assets store no separate Z range.
 */
Result<QuantizationHeader> read_quantization_header(const ByteView& payload);

/**
 * u16 triplets at 0x7C, then u16 UV pairs. UVs past the buffer end default
 * to (0,0). search_anchor = 0x7C + 10 * vertex_count.
 */
Result<ExtractedAttributes> extract_quantized(const ByteView& payload, size_t vertex_count);

/**
 * Header-less variant: u16 triplets at 0x60 taken as-is, then u16 UV pairs.
 * UVs past the buffer end default to (0,0).
 */
Result<ExtractedAttributes> extract_raw_u16(const ByteView& payload, size_t vertex_count);

// ============================================================================
// Normalized byte
// ============================================================================

/**
 * vertex_count 4-byte records anchored at the end of the payload. The first
 * byte of each record is unused. UVs default to (0,0).
 */
Result<ExtractedAttributes> extract_normalized_byte(const ByteView& payload, size_t vertex_count);

/**
 * Companion UV block of exactly vertex_count x (2 x u16) at offset, or
 * nullopt when it does not fit.
 */
std::optional<std::vector<UV>> read_companion_uvs(const ByteView& payload, size_t offset,
                                                  size_t vertex_count);

} // namespace skymesh
