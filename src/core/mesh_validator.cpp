/**
 * skymesh - Mesh Plausibility Validator Implementation
 */

#include "skymesh/mesh_validator.hpp"
#include <string>

namespace skymesh {

Result<void> MeshValidator::check(const DecodedMesh& mesh) const {
    const size_t vertex_count = mesh.vertices.size();

    if (vertex_count < min_vertices_) {
        return Error::implausible("Only " + std::to_string(vertex_count) +
                                  " vertices (minimum " + std::to_string(min_vertices_) + ")");
    }

    if (mesh.faces.empty()) {
        return Error::implausible("No faces");
    }

    if (mesh.max_index() >= vertex_count) {
        return Error::implausible("Index " + std::to_string(mesh.max_index()) +
                                  " out of range for " + std::to_string(vertex_count) + " vertices");
    }

    if (!mesh.uvs.empty() && mesh.uvs.size() != vertex_count) {
        return Error::implausible(std::to_string(mesh.uvs.size()) + " UVs for " +
                                  std::to_string(vertex_count) + " vertices");
    }

    return Result<void>::success();
}

} // namespace skymesh
