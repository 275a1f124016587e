/**
 * skymesh - Index Region Locator Implementation
 */

#include "skymesh/index_locator.hpp"
#include <algorithm>
#include <string>

namespace skymesh {

namespace {

inline uint32_t read_index(const uint8_t* p, IndexWidth width) {
    return width == IndexWidth::U16 ? read_u16_le(p) : read_u32_le(p);
}

} // namespace

IndexLocator::IndexLocator(LocatorConfig config)
    : config_(config)
{
    if (config_.step == 0) config_.step = 1;
    if (config_.prefix_triples == 0) config_.prefix_triples = 1;
}

IndexLocator::Probe IndexLocator::probe(const ByteView& payload, size_t start, size_t vertex_count,
                                        size_t face_count, IndexWidth width) const {
    const size_t w = index_width_bytes(width);
    const size_t prefix = std::min(face_count, config_.prefix_triples);

    if (!payload.has(start, prefix * 3 * w)) {
        return Probe::Rejected;
    }

    const uint8_t* p = payload.data() + start;
    size_t zeros = 0;
    for (size_t i = 0; i < prefix * 3; i++) {
        uint32_t idx = read_index(p + i * w, width);
        if (idx >= vertex_count) {
            return Probe::Rejected;
        }
        if (idx == 0) zeros++;
    }

    double zero_ratio = static_cast<double>(zeros) / static_cast<double>(prefix * 3);
    if (zero_ratio > config_.max_zero_ratio) {
        return Probe::TooManyZeros;
    }

    // Whole run must fit; a run cut short by the buffer end is not a match
    if (face_count > payload.size() / (3 * w) || !payload.has(start, face_count * 3 * w)) {
        return Probe::Rejected;
    }

    for (size_t i = prefix * 3; i < face_count * 3; i++) {
        if (read_index(p + i * w, width) >= vertex_count) {
            return Probe::Rejected;
        }
    }
    return Probe::Accepted;
}

Result<IndexRegion> IndexLocator::locate(const ByteView& payload, size_t vertex_count, size_t face_count,
                                         std::span<const size_t> anchors) const {
    if (face_count == 0 || face_count < config_.min_face_count) {
        return Error::index_not_found("Face count " + std::to_string(face_count) +
                                      " below minimum " + std::to_string(config_.min_face_count));
    }
    if (vertex_count == 0) {
        return Error::index_not_found("No vertices to index");
    }

    std::vector<size_t> unique_anchors;
    for (size_t a : anchors) {
        if (std::find(unique_anchors.begin(), unique_anchors.end(), a) == unique_anchors.end()) {
            unique_anchors.push_back(a);
        }
    }

    size_t iterations = 0;
    size_t zero_rejects = 0;
    const size_t min_triple = 3 * index_width_bytes(IndexWidth::U16);

    for (size_t anchor : unique_anchors) {
        for (size_t start = anchor; payload.has(start, min_triple); start += config_.step) {
            if (config_.cancel && config_.cancel->load(std::memory_order_relaxed)) {
                return Error::index_not_found("Index search cancelled after " +
                                              std::to_string(iterations) + " positions");
            }
            if (++iterations > config_.max_iterations) {
                return Error::index_not_found("Iteration budget of " +
                                              std::to_string(config_.max_iterations) +
                                              " exhausted (" + std::to_string(zero_rejects) +
                                              " zero-heavy rejects)");
            }

            // A 32-bit run reads as zero-heavy 16-bit data, so both widths are tried here
            for (IndexWidth width : {IndexWidth::U16, IndexWidth::U32}) {
                Probe result = probe(payload, start, vertex_count, face_count, width);
                if (result == Probe::TooManyZeros) {
                    zero_rejects++;
                    continue;
                }
                if (result != Probe::Accepted) {
                    continue;
                }

                auto faces = read_faces(payload, start, face_count, width);
                if (!faces) {
                    return faces.error();
                }

                IndexRegion region;
                region.offset = start;
                region.width = width;
                region.faces = std::move(*faces);
                region.iterations = iterations;
                return region;
            }
        }
    }

    return Error::index_not_found("Search space exhausted after " + std::to_string(iterations) +
                                  " positions (" + std::to_string(zero_rejects) + " zero-heavy rejects)");
}

} // namespace skymesh
