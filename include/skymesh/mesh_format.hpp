/**
 * skymesh - .mesh format constants
 *
 * Offsets and sizes observed across asset export versions. File offsets
 * count from the first byte of the file, payload offsets from the first
 * byte of the decompressed block.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace skymesh {

// ============================================================================
// File header
// ============================================================================

constexpr size_t FILE_OFF_VERSION = 0x00;
constexpr size_t FILE_OFF_BONE_FLAG = 0x4C;     // u16, 1 = bone records present (fmt layout)

constexpr uint8_t FMT_MAGIC[4] = {0x1F, 0x00, 0x00, 0x00};

// Embedded file name: [1F 00 00 00][name...][00], terminator within this window
constexpr size_t NAME_HEADER_LIMIT = 0x100;

// Structural gate applied to every layout candidate
constexpr uint32_t MAX_COMPRESSED_SIZE = 10u * 1024 * 1024;
constexpr uint32_t MAX_UNCOMPRESSED_SIZE = 50u * 1024 * 1024;

// ============================================================================
// Payload flags block (structured layouts)
// ============================================================================

constexpr size_t FLAGS_OFF_VERTEX_COUNT = 0x74;
constexpr size_t FLAGS_OFF_CORNER_COUNT = 0x78;
constexpr size_t FLAGS_OFF_IS_IDX32 = 0x7C;
constexpr size_t FLAGS_OFF_UV_COUNT = 0x80;
constexpr size_t FLAGS_OFF_LOAD_NORMALS = 0x94;    // u8
constexpr size_t FLAGS_OFF_SKIP_POSITIONS = 0x97;  // u32, unaligned
constexpr size_t FLAGS_OFF_SKIP_UVS = 0x9B;        // u32, unaligned
constexpr size_t FLAGS_BLOCK_SIZE = 0xB3;

// Body record sizes following the flags block
constexpr size_t POSITION_RECORD_SIZE = 16;     // 3 x f32 + 4 padding
constexpr size_t NORMAL_RECORD_SIZE = 4;        // 3 x u8 + 1 padding
constexpr size_t UV_RECORD_SIZE = 16;           // 2 x f16 + 12 bytes of other attributes
constexpr size_t BONE_RECORD_SIZE = 8;

// ============================================================================
// Quantized payload (compressed layouts)
// ============================================================================

constexpr size_t QUANT_OFF_MIN = 0x60;          // 3 x f32
constexpr size_t QUANT_OFF_RANGE_X = 0x6C;
constexpr size_t QUANT_OFF_RANGE_Y = 0x70;      // Also used for Z, no separate field
constexpr size_t QUANT_OFF_SHARED_COUNT = 0x74; // i32
constexpr size_t QUANT_OFF_INDEX_COUNT = 0x78;  // i32
constexpr size_t QUANT_OFF_VERTICES = 0x7C;

// Later exports drop the range header: counts move to 0x34 / 0x38 and the
// u16 triplets at 0x60 are stored unscaled
constexpr size_t RAW_OFF_SHARED_COUNT = 0x34;   // i32
constexpr size_t RAW_OFF_INDEX_COUNT = 0x38;    // i32
constexpr size_t RAW_OFF_UV_COUNT = 0x3C;       // i32, informational
constexpr size_t RAW_OFF_VERTICES = 0x60;

constexpr size_t QUANT_VERTEX_SIZE = 6;         // 3 x u16
constexpr size_t QUANT_UV_SIZE = 4;             // 2 x u16
constexpr size_t PACKED_VERTEX_SIZE = 4;        // [unused][x][y][z] bytes

// ============================================================================
// Dequantization
// ============================================================================

constexpr float UNORM16_DIVISOR = 65535.0f;
constexpr float SNORM8_CENTER = 128.0f;
constexpr float SNORM8_DIVISOR = 127.5f;

} // namespace skymesh
