/**
 * skymesh - Index Region Locator
 *
 * Finds a run of triangle indices whose start offset and width are not
 * recorded anywhere in the payload. Candidate starts are scanned from each
 * anchor at a fixed byte step; a short prefix is checked for bounds and for
 * too many zero indices before the whole run is decoded.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "binary_reader.hpp"
#include "field_extractors.hpp"
#include <vector>
#include <span>

namespace skymesh {

struct IndexRegion {
    size_t offset = 0;
    IndexWidth width = IndexWidth::U16;
    std::vector<Face> faces;
    size_t iterations = 0;      // Start positions examined

    size_t end() const { return offset + faces.size() * 3 * index_width_bytes(width); }
};

class IndexLocator {
public:
    explicit IndexLocator(LocatorConfig config = {});

    /**
     * Locate face_count triples with every index < vertex_count.
     *
     * Each start position is probed with 16-bit indices, then with 32-bit
     * indices, and counts once against the iteration budget. Duplicate
     * anchors are visited once.
     */
    Result<IndexRegion> locate(const ByteView& payload, size_t vertex_count, size_t face_count,
                               std::span<const size_t> anchors) const;

    const LocatorConfig& config() const { return config_; }

private:
    enum class Probe {
        Rejected,       // Out of bounds or truncated at this start
        TooManyZeros,
        Accepted
    };

    Probe probe(const ByteView& payload, size_t start, size_t vertex_count,
                size_t face_count, IndexWidth width) const;

    LocatorConfig config_;
};

} // namespace skymesh
