/**
 * skymesh - Mesh Converter Implementation
 */

#include "skymesh/mesh_converter.hpp"
#include "skymesh/files.hpp"
#include "skymesh/logging.hpp"
#include <sstream>
#include <iomanip>

namespace skymesh {

namespace {

bool is_degenerate(const Face& f) {
    return f.x == f.y || f.y == f.z || f.x == f.z;
}

} // namespace

MeshConverter::MeshConverter(std::span<const uint8_t> mesh_data, const std::string& name,
                             const AssetHints& hints, const DecodeOptions& options)
    : name_(name) {

    MeshDecoder decoder(options);
    auto outcome = decoder.decode(mesh_data, hints, name);
    if (outcome) {
        mesh_ = std::move(outcome->mesh);
        strategy_ = std::move(outcome->strategy);
    } else {
        error_ = outcome.error();
    }
}

MeshConverter::MeshConverter(DecodedMesh mesh, const std::string& name)
    : name_(name) {
    mesh_ = std::move(mesh);
}

std::optional<MeshConverter::Output> MeshConverter::convert(const ExportOptions& options) const {
    if (!mesh_) return std::nullopt;

    Output output;
    output.obj = generate_obj(options, output.stats);
    return output;
}

Result<fs::path> MeshConverter::save(const fs::path& output_dir, const ExportOptions& options) const {
    auto output = convert(options);
    if (!output) {
        return error_.ok() ? Error::invalid_format("Nothing to export", name_) : error_;
    }

    fs::path obj_path = output_dir / (name_ + ".obj");
    auto written = write_text_file(obj_path, output->obj);
    if (!written) {
        return written.error();
    }

    LOG_DEBUG("Export", obj_path.string() << ": " << output->stats.faces << " faces written, "
              << output->stats.degenerate_faces << " degenerate skipped");
    return obj_path;
}

std::string MeshConverter::generate_obj(const ExportOptions& options, Stats& stats) const {
    std::ostringstream obj;
    obj << std::fixed << std::setprecision(6);

    const bool with_uvs = options.export_uvs && !mesh_->uvs.empty();

    // Header
    obj << "# skymesh - OBJ Export\n";
    obj << "# Source: " << name_ << "\n";
    if (!strategy_.empty()) {
        obj << "# Strategy: " << strategy_ << "\n";
    }
    obj << "# Vertices: " << mesh_->vertices.size() << "\n";
    obj << "# Triangles: " << mesh_->faces.size() << "\n";
    obj << "\n";

    for (const auto& v : mesh_->vertices) {
        obj << "v " << v.x << " " << v.y << " " << v.z << "\n";
    }
    stats.vertices = static_cast<uint32_t>(mesh_->vertices.size());

    if (with_uvs) {
        for (const auto& uv : mesh_->uvs) {
            obj << "vt " << uv.x << " " << uv.y << "\n";
        }
        stats.uvs = static_cast<uint32_t>(mesh_->uvs.size());
    }

    // OBJ indices are 1-based; UVs share the vertex index
    for (const auto& f : mesh_->faces) {
        if (options.skip_degenerate && is_degenerate(f)) {
            stats.degenerate_faces++;
            continue;
        }
        const uint32_t a = f.x + 1, b = f.y + 1, c = f.z + 1;
        if (with_uvs) {
            obj << "f " << a << "/" << a << " " << b << "/" << b << " " << c << "/" << c << "\n";
        } else {
            obj << "f " << a << " " << b << " " << c << "\n";
        }
        stats.faces++;
    }

    return obj.str();
}

} // namespace skymesh
