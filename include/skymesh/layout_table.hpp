/**
 * skymesh - Layout Candidate Table
 *
 * Every known hypothesis about where the compressed size, uncompressed size
 * and payload start live in the file header, grouped by the strategy family
 * that consumes them. Candidates are tried most specific first.
 */

#pragma once

#include "compression.hpp"
#include "result.hpp"
#include <vector>
#include <span>
#include <string_view>
#include <cstdint>

namespace skymesh {

enum class StrategyFamily {
    Structured,
    Heuristic,
    Compressed,
    IndexScan
};

const char* family_name(StrategyFamily family);

enum class IndexWidthPolicy {
    Fixed16,    // Contiguous u16 triples right after the attributes
    Probe       // Located by IndexLocator, u16 then u32
};

struct LayoutCandidate {
    const char* name;
    StrategyFamily family;
    uint32_t compressed_size_off;
    uint32_t uncompressed_size_off;
    uint32_t payload_off;
    uint32_t lod_count_off;         // 0 when the layout carries none
    uint8_t size_field_width;       // 2 or 4 bytes
    IndexWidthPolicy index_width;
    bool allow_stored;              // compressed_size >= uncompressed_size means stored payload
    bool requires_magic;            // File must start with 1F 00 00 00
    bool requires_growth;           // compressed_size < uncompressed_size
};

/**
 * Full ordered table, built once.
 */
const std::vector<LayoutCandidate>& candidates();

/**
 * Candidates of one family, in table order.
 */
std::vector<LayoutCandidate> candidates_for(StrategyFamily family);

/**
 * Payload offsets where (vertex_count, index_count) pairs have been observed.
 */
std::span<const uint32_t> vertex_count_sublayouts();

/**
 * True when the buffer starts with the fmt magic 1F 00 00 00.
 */
bool has_fmt_magic(std::span<const uint8_t> file);

/**
 * Apply the structural gate and slice the compressed block out of the file.
 * Fails with MalformedHeader when the candidate's fields are out of range.
 */
Result<CompressedBlock> locate_block(std::span<const uint8_t> file, const LayoutCandidate& candidate);

} // namespace skymesh
