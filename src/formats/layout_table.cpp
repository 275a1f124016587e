/**
 * skymesh - Layout Candidate Table Implementation
 */

#include "skymesh/layout_table.hpp"
#include "skymesh/binary_reader.hpp"
#include "skymesh/mesh_format.hpp"
#include <array>
#include <cstring>
#include <string>

namespace skymesh {

namespace {

constexpr std::array<uint32_t, 4> VERTEX_COUNT_SUBLAYOUTS = {0x74, 0x70, 0x78, 0x80};
constexpr std::array<uint32_t, 6> SCAN_OFFSETS = {0x4E, 0x52, 0x56, 0x5A, 0x60, 0x74};

std::vector<LayoutCandidate> build_table() {
    using F = StrategyFamily;
    using W = IndexWidthPolicy;

    std::vector<LayoutCandidate> table = {
        // name      family         cs    us    payload lod  width index      stored magic  growth
        {"sky_v1", F::Structured, 0x4E, 0x52, 0x56, 0x44, 4, W::Fixed16, true,  false, false},
        {"fmt_1f", F::Structured, 0x52, 0x56, 0x5A, 0,    4, W::Fixed16, false, true,  false},

        {"heur_a", F::Heuristic,  0x4E, 0x52, 0x56, 0x44, 4, W::Fixed16, false, false, false},
        {"heur_b", F::Heuristic,  0x4A, 0x4E, 0x52, 0x40, 4, W::Fixed16, false, false, false},
        {"heur_c", F::Heuristic,  0x52, 0x56, 0x5A, 0x48, 4, W::Fixed16, false, false, false},

        {"comp_a", F::Compressed, 0x52, 0x56, 0x5A, 0,    4, W::Probe,   false, false, false},
        {"comp_b", F::Compressed, 0x4E, 0x51, 0x56, 0,    2, W::Probe,   false, false, false},
        {"comp_c", F::Compressed, 0x4E, 0x52, 0x56, 0,    2, W::Probe,   false, false, false},
        {"comp_d", F::Compressed, 0x4E, 0x50, 0x56, 0,    2, W::Probe,   false, false, false},
        {"comp_e", F::Compressed, 0x4C, 0x50, 0x56, 0,    2, W::Probe,   false, false, false},
    };

    // Size pair followed directly by the payload
    static const char* scan_names[] = {
        "scan_4e", "scan_52", "scan_56", "scan_5a", "scan_60", "scan_74"
    };
    for (size_t i = 0; i < SCAN_OFFSETS.size(); i++) {
        uint32_t off = SCAN_OFFSETS[i];
        table.push_back({scan_names[i], F::IndexScan, off, off + 4, off + 8, 0, 4,
                         W::Probe, false, false, true});
    }

    return table;
}

std::optional<uint32_t> read_size_field(const ByteView& file, uint32_t offset, uint8_t width) {
    if (width == 2) {
        auto v = file.u16(offset);
        if (!v) return std::nullopt;
        return *v;
    }
    // Signed in every observed writer; negative values fail the gate
    auto v = file.i32(offset);
    if (!v || *v <= 0) return std::nullopt;
    return static_cast<uint32_t>(*v);
}

} // namespace

const char* family_name(StrategyFamily family) {
    switch (family) {
        case StrategyFamily::Structured: return "structured";
        case StrategyFamily::Heuristic:  return "heuristic";
        case StrategyFamily::Compressed: return "compressed";
        case StrategyFamily::IndexScan:  return "index_scan";
        default:                         return "unknown";
    }
}

const std::vector<LayoutCandidate>& candidates() {
    static const std::vector<LayoutCandidate> table = build_table();
    return table;
}

std::vector<LayoutCandidate> candidates_for(StrategyFamily family) {
    std::vector<LayoutCandidate> result;
    for (const auto& c : candidates()) {
        if (c.family == family) {
            result.push_back(c);
        }
    }
    return result;
}

std::span<const uint32_t> vertex_count_sublayouts() {
    return VERTEX_COUNT_SUBLAYOUTS;
}

bool has_fmt_magic(std::span<const uint8_t> file) {
    return file.size() >= sizeof(FMT_MAGIC) &&
           std::memcmp(file.data(), FMT_MAGIC, sizeof(FMT_MAGIC)) == 0;
}

Result<CompressedBlock> locate_block(std::span<const uint8_t> file, const LayoutCandidate& candidate) {
    ByteView view(file);

    if (candidate.requires_magic && !has_fmt_magic(file)) {
        return Error::malformed_header("Missing 1F 00 00 00 magic", candidate.name);
    }

    auto cs = read_size_field(view, candidate.compressed_size_off, candidate.size_field_width);
    auto us = read_size_field(view, candidate.uncompressed_size_off, candidate.size_field_width);
    if (!cs || !us) {
        return Error::malformed_header("Size fields out of range", candidate.name);
    }

    if (*cs == 0 || *cs >= MAX_COMPRESSED_SIZE || *us == 0 || *us >= MAX_UNCOMPRESSED_SIZE) {
        return Error::malformed_header("Sizes fail gate (cs=" + std::to_string(*cs) +
                                       ", us=" + std::to_string(*us) + ")", candidate.name);
    }

    if (candidate.requires_growth && *cs >= *us) {
        return Error::malformed_header("Compressed size not smaller than uncompressed", candidate.name);
    }

    CompressedBlock block;
    block.declared_uncompressed_size = *us;
    block.stored = candidate.allow_stored && *cs >= *us;

    if (!view.has(candidate.payload_off, *cs)) {
        return Error::malformed_header("Payload extends past end of file (need " +
                                       std::to_string(candidate.payload_off + size_t{*cs}) +
                                       ", have " + std::to_string(file.size()) + ")",
                                       candidate.name);
    }

    // A stored payload spans the uncompressed size instead
    size_t span_size = block.stored ? *us : *cs;
    block.compressed_bytes = file.subspan(candidate.payload_off, span_size);
    return block;
}

} // namespace skymesh
