/**
 * skymesh - Block Codec Adapter
 *
 * Uniform decompress(bytes, expected_size) contract over LZ4 block
 * decompression, with zlib accepted as a secondary codec.
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <span>
#include <cstdint>
#include <cstddef>

namespace skymesh {

enum class CompressionType {
    None,
    Zlib,
    LZ4
};

/**
 * Compressed payload as located by a layout candidate.
 * Consumed once by decompress_block().
 */
struct CompressedBlock {
    std::span<const uint8_t> compressed_bytes;
    uint32_t declared_uncompressed_size = 0;
    bool stored = false;    // Payload kept uncompressed in the file
};

/**
 * Detect compression type from data (zlib has a header, LZ4 blocks do not).
 */
CompressionType detect_compression(const uint8_t* data, size_t size);

/**
 * Decompress an LZ4 block. Fails when LZ4 reports a non-positive length or
 * the output length differs from expected_size.
 */
Result<std::vector<uint8_t>> decompress_lz4(const uint8_t* data, size_t size, size_t expected_size);

/**
 * Inflate a zlib stream that must produce exactly expected_size bytes.
 */
Result<std::vector<uint8_t>> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size);

/**
 * Decompress a located block: LZ4 first, zlib when LZ4 fails and the data
 * carries a zlib header. Stored blocks are copied through. No retries.
 */
Result<std::vector<uint8_t>> decompress_block(const CompressedBlock& block);

/**
 * LZ4 round trip run once at startup. A failure means no strategy can
 * succeed and the whole run must stop.
 */
Result<void> verify_codec();

/**
 * Compress data with LZ4 / zlib (synthetic assets, codec self-test).
 * Throws std::runtime_error on codec failure.
 */
std::vector<uint8_t> compress_lz4(const uint8_t* data, size_t size);
std::vector<uint8_t> compress_lz4(const std::vector<uint8_t>& data);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

} // namespace skymesh
