/**
 * skymesh - Heuristic strategy
 *
 * Older exporters wrote the counts at one of several payload offsets and
 * packed UV records in one of two ways, so every (header candidate,
 * count sub-layout, body layout) combination is tried in turn.
 */

#include "skymesh/strategies.hpp"
#include "skymesh/mesh_validator.hpp"
#include "skymesh/logging.hpp"
#include <array>

namespace skymesh {

namespace {

constexpr int32_t HEURISTIC_MAX_SHARED = 100000;
constexpr int32_t HEURISTIC_MAX_TOTAL = 300000;

struct BodyLayout {
    const char* name;
    bool uv_header;             // uv_count * 4 - 4 bytes precede the UV records
    size_t uv_record_offset;
};

constexpr std::array<BodyLayout, 2> BODY_LAYOUTS = {{
    {"uv_header", true, 4},
    {"packed", false, 0},
}};

DirectFloatLayout make_layout(const BodyLayout& body, size_t shared) {
    DirectFloatLayout layout;
    layout.vertex_start = FLAGS_BLOCK_SIZE;
    layout.vertex_stride = POSITION_RECORD_SIZE;
    layout.uv_skip = (body.uv_header && shared > 1) ? shared * 4 - 4 : 0;
    layout.uv_stride = UV_RECORD_SIZE;
    layout.uv_record_offset = body.uv_record_offset;
    layout.uv_encoding = UvEncoding::Half;
    layout.index_skip = 4;
    return layout;
}

} // namespace

Result<DecodedMesh> HeuristicStrategy::decode(const MeshFile& file, const AssetHints& /*hints*/,
                                              const DecodeOptions& options) const {
    MeshValidator validator(options.min_vertices);
    Error last = Error::malformed_header("No heuristic layout candidate");

    for (const auto& candidate : candidates_for(StrategyFamily::Heuristic)) {
        auto payload = load_payload(file.bytes, candidate, options);
        if (!payload) {
            last = payload.error();
            continue;
        }
        ByteView view(*payload);

        if (candidate.lod_count_off != 0) {
            auto lods = ByteView(file.bytes).i32(candidate.lod_count_off);
            SKYMESH_TRACE(options, "Heuristic", candidate.name << ": lods=" << lods.value_or(-1));
        }

        for (uint32_t count_off : vertex_count_sublayouts()) {
            auto shared = view.i32(count_off);
            auto total = view.i32(count_off + 4);
            if (!shared || !total) {
                last = Error::size_mismatch("Payload too short for counts", candidate.name);
                continue;
            }
            if (*shared < 0 || *shared >= HEURISTIC_MAX_SHARED ||
                *total < 0 || *total >= HEURISTIC_MAX_TOTAL || *total % 3 != 0) {
                last = Error::malformed_header("Implausible counts at payload offset " +
                                               std::to_string(count_off), candidate.name);
                continue;
            }

            const size_t vertex_count = static_cast<size_t>(*shared);
            const size_t face_count = static_cast<size_t>(*total) / 3;

            for (const auto& body : BODY_LAYOUTS) {
                auto attributes = extract_direct_float(view, vertex_count, make_layout(body, vertex_count));
                if (!attributes) {
                    last = Error(attributes.error().code, attributes.error().message, candidate.name);
                    continue;
                }

                auto faces = read_faces(view, attributes->search_anchor, face_count, IndexWidth::U16);
                if (!faces) {
                    last = Error(faces.error().code, faces.error().message, candidate.name);
                    continue;
                }

                DecodedMesh mesh;
                mesh.vertices = std::move(attributes->vertices);
                mesh.uvs = std::move(attributes->uvs);
                mesh.faces = std::move(*faces);

                auto plausible = validator.check(mesh);
                if (!plausible) {
                    last = Error(plausible.error().code, plausible.error().message, candidate.name);
                    continue;
                }

                SKYMESH_TRACE(options, "Heuristic", candidate.name << ": counts at 0x" << std::hex
                              << count_off << std::dec << ", body " << body.name);
                return mesh;
            }
        }
    }

    return last;
}

} // namespace skymesh
