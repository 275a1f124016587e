/**
 * skymesh - Strategy support shared by the built-in strategies
 */

#include "skymesh/strategies.hpp"
#include "skymesh/logging.hpp"
#include "skymesh/mesh_format.hpp"
#include <algorithm>

namespace skymesh {

std::span<const uint8_t> strip_name_header(std::span<const uint8_t> data) {
    if (!has_fmt_magic(data) || data.size() <= sizeof(FMT_MAGIC)) {
        return data;
    }

    uint8_t first = data[sizeof(FMT_MAGIC)];
    if (first < 0x20 || first > 0x7E) {
        return data;
    }

    auto limit = data.begin() + static_cast<std::ptrdiff_t>(std::min(data.size(), NAME_HEADER_LIMIT));
    auto terminator = std::find(data.begin() + sizeof(FMT_MAGIC), limit, uint8_t{0});
    if (terminator == limit) {
        return data;
    }

    size_t body_start = static_cast<size_t>(terminator - data.begin()) + 1;
    return data.subspan(body_start);
}

MeshFile make_mesh_file(std::span<const uint8_t> data, bool strip_name, std::string name) {
    MeshFile file;
    file.bytes = data;
    file.body = strip_name ? strip_name_header(data) : data;
    file.name = std::move(name);
    return file;
}

Result<std::vector<uint8_t>> load_payload(std::span<const uint8_t> file, const LayoutCandidate& candidate,
                                          const DecodeOptions& options) {
    auto block = locate_block(file, candidate);
    if (!block) {
        SKYMESH_TRACE(options, "Layout", candidate.name << ": " << block.error().message);
        return block.error();
    }

    auto payload = decompress_block(*block);
    if (!payload) {
        SKYMESH_TRACE(options, "Layout", candidate.name << ": " << payload.error().message);
        return Error(payload.error().code, payload.error().message, candidate.name);
    }

    SKYMESH_TRACE(options, "Layout", candidate.name << ": " << block->compressed_bytes.size()
                  << (block->stored ? " stored" : " compressed") << " -> "
                  << payload->size() << " bytes");
    return payload;
}

Result<FlagsBlock> read_flags_block(const ByteView& payload) {
    if (!payload.has(0, FLAGS_BLOCK_SIZE)) {
        return Error::size_mismatch("Payload shorter than flags block (" +
                                    std::to_string(payload.size()) + " bytes)");
    }

    FlagsBlock flags;
    flags.vertex_count = *payload.u32(FLAGS_OFF_VERTEX_COUNT);
    flags.corner_count = *payload.u32(FLAGS_OFF_CORNER_COUNT);
    flags.is_idx32 = *payload.u32(FLAGS_OFF_IS_IDX32) != 0;
    flags.uv_count = *payload.u32(FLAGS_OFF_UV_COUNT);
    flags.load_normals = *payload.u8(FLAGS_OFF_LOAD_NORMALS) != 0;
    flags.skip_positions = *payload.u32(FLAGS_OFF_SKIP_POSITIONS) != 0;
    flags.skip_uvs = *payload.u32(FLAGS_OFF_SKIP_UVS) != 0;
    return flags;
}

} // namespace skymesh
