/**
 * skymesh - Structured strategy
 *
 * Payload layout after decompression:
 *   [flags block 0xB3]
 *   [positions   N x 16]   3 x f32 + pad         (unless skip_positions)
 *   [normals     N x 4]    3 x u8 + pad          (load_normals; always on fmt)
 *   [uvs         N x 16]   2 x f16 at +0         (unless skip_uvs)
 *   [bones       N x 8]                          (fmt with bone flag)
 *   [indices     corner_count x u16|u32]
 *
 * ZipPos fmt assets drop the float blocks: indices directly after the
 * flags block (and bones), packed positions at the payload tail.
 */

#include "skymesh/strategies.hpp"
#include "skymesh/mesh_validator.hpp"
#include "skymesh/logging.hpp"

namespace skymesh {

namespace {

Result<void> check_counts(const ByteView& payload, const FlagsBlock& flags) {
    if (flags.vertex_count == 0 || flags.vertex_count > payload.size()) {
        return Error::malformed_header("Vertex count " + std::to_string(flags.vertex_count) +
                                       " impossible for " + std::to_string(payload.size()) + " byte payload");
    }
    if (flags.corner_count == 0 || flags.corner_count % 3 != 0 || flags.corner_count > payload.size()) {
        return Error::malformed_header("Corner count " + std::to_string(flags.corner_count) +
                                       " is not a triangle list");
    }
    return Result<void>::success();
}

} // namespace

Result<DecodedMesh> StructuredStrategy::read_body(const ByteView& payload, const FlagsBlock& flags,
                                                  bool fmt_layout, bool has_bones) const {
    if (flags.skip_positions && !fmt_layout) {
        return Error::implausible("Positions stripped from payload");
    }

    const size_t n = flags.vertex_count;
    size_t pos = FLAGS_BLOCK_SIZE;
    DecodedMesh mesh;

    SKYMESH_TRY_ASSIGN(vertices, read_float_positions(payload, pos, n, POSITION_RECORD_SIZE));
    mesh.vertices = std::move(vertices);
    pos += n * POSITION_RECORD_SIZE;

    if (fmt_layout || flags.load_normals) {
        pos += n * NORMAL_RECORD_SIZE;
    }

    if (fmt_layout || !flags.skip_uvs) {
        UvLayout uv_layout;
        uv_layout.start = pos;
        uv_layout.count = n;
        uv_layout.stride = UV_RECORD_SIZE;
        uv_layout.encoding = UvEncoding::Half;

        SKYMESH_TRY_ASSIGN(uvs, read_uvs(payload, uv_layout));
        mesh.uvs = std::move(uvs);
        pos += n * UV_RECORD_SIZE;
    }

    if (has_bones) {
        pos += n * BONE_RECORD_SIZE;
    }

    IndexWidth width = flags.is_idx32 ? IndexWidth::U32 : IndexWidth::U16;
    SKYMESH_TRY_ASSIGN(faces, read_faces(payload, pos, flags.corner_count / 3, width));
    mesh.faces = std::move(faces);
    return mesh;
}

Result<DecodedMesh> StructuredStrategy::read_packed_body(const ByteView& payload, const FlagsBlock& flags,
                                                         bool has_bones) const {
    const size_t n = flags.vertex_count;
    size_t pos = FLAGS_BLOCK_SIZE;
    if (has_bones) {
        pos += n * BONE_RECORD_SIZE;
    }

    IndexWidth width = flags.is_idx32 ? IndexWidth::U32 : IndexWidth::U16;
    SKYMESH_TRY_ASSIGN(faces, read_faces(payload, pos, flags.corner_count / 3, width));
    SKYMESH_TRY_ASSIGN(attributes, extract_normalized_byte(payload, n));

    DecodedMesh mesh;
    mesh.vertices = std::move(attributes.vertices);
    mesh.uvs = std::move(attributes.uvs);
    mesh.faces = std::move(faces);
    return mesh;
}

Result<DecodedMesh> StructuredStrategy::decode(const MeshFile& file, const AssetHints& hints,
                                               const DecodeOptions& options) const {
    MeshValidator validator(options.min_vertices);
    Error last = Error::malformed_header("No structured layout candidate");

    for (const auto& candidate : candidates_for(StrategyFamily::Structured)) {
        const bool fmt_layout = candidate.requires_magic;
        auto source = fmt_layout ? file.bytes : file.body;

        auto payload = load_payload(source, candidate, options);
        if (!payload) {
            last = payload.error();
            continue;
        }
        ByteView view(*payload);

        auto flags = read_flags_block(view);
        if (!flags) {
            last = Error(flags.error().code, flags.error().message, candidate.name);
            continue;
        }

        auto counts = check_counts(view, *flags);
        if (!counts) {
            SKYMESH_TRACE(options, "Structured", candidate.name << ": " << counts.error().message);
            last = Error(counts.error().code, counts.error().message, candidate.name);
            continue;
        }

        bool has_bones = false;
        if (fmt_layout) {
            auto bone_flag = ByteView(source).u16(FILE_OFF_BONE_FLAG);
            has_bones = bone_flag && *bone_flag == 1;
        }

        SKYMESH_TRACE(options, "Structured", candidate.name << ": version=" << int(source[FILE_OFF_VERSION])
                      << " vertices=" << flags->vertex_count << " corners=" << flags->corner_count
                      << " idx32=" << flags->is_idx32 << " normals=" << flags->load_normals
                      << " bones=" << has_bones);

        auto mesh = (fmt_layout && hints.compress_positions)
            ? read_packed_body(view, *flags, has_bones)
            : read_body(view, *flags, fmt_layout, has_bones);
        if (!mesh) {
            SKYMESH_TRACE(options, "Structured", candidate.name << ": " << mesh.error().message);
            last = Error(mesh.error().code, mesh.error().message, candidate.name);
            continue;
        }

        auto plausible = validator.check(*mesh);
        if (!plausible) {
            SKYMESH_TRACE(options, "Structured", candidate.name << ": " << plausible.error().message);
            last = Error(plausible.error().code, plausible.error().message, candidate.name);
            continue;
        }

        return mesh;
    }

    return last;
}

} // namespace skymesh
