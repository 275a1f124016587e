/**
 * skymesh - Mesh Plausibility Validator
 *
 * Accept/reject gate applied to every complete decode before the
 * orchestrator keeps it.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"

namespace skymesh {

class MeshValidator {
public:
    explicit MeshValidator(size_t min_vertices = 10) : min_vertices_(min_vertices) {}

    bool validate(const DecodedMesh& mesh) const { return check(mesh).ok(); }

    /**
     * Same decision as validate(), with the rejection reason as
     * an ImplausibleResult error.
     */
    Result<void> check(const DecodedMesh& mesh) const;

    size_t min_vertices() const { return min_vertices_; }

private:
    size_t min_vertices_;
};

} // namespace skymesh
