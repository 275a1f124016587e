#include "skymesh/strategies.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>

using namespace skymesh;
using namespace skymesh::test;

namespace {

std::vector<Face> local_faces() {
    return {{0, 1, 2}, {3, 4, 5}, {6, 7, 8}, {9, 10, 11}};
}

Bytes flags_block(uint32_t vertex_count, uint32_t corner_count, bool idx32) {
    Bytes block(FLAGS_BLOCK_SIZE, 0);
    put_u32(block, FLAGS_OFF_VERTEX_COUNT, vertex_count);
    put_u32(block, FLAGS_OFF_CORNER_COUNT, corner_count);
    put_u32(block, FLAGS_OFF_IS_IDX32, idx32 ? 1 : 0);
    block.resize(FLAGS_BLOCK_SIZE);
    return block;
}

void append_positions(Bytes& payload, uint32_t count, size_t stride) {
    for (uint32_t i = 0; i < count; i++) {
        size_t off = payload.size();
        put_f32(payload, off, static_cast<float>(i));
        put_f32(payload, off + 4, 2.0f);
        put_f32(payload, off + 8, 3.0f);
        payload.resize(off + stride, 0);
    }
}

void append_half_uvs(Bytes& payload, uint32_t count, size_t stride, size_t record_offset) {
    for (uint32_t i = 0; i < count; i++) {
        size_t off = payload.size();
        payload.resize(off + stride, 0);
        put_u16(payload, off + record_offset, 0x3800);      // 0.5
        put_u16(payload, off + record_offset + 2, 0x3C00);  // 1.0
    }
}

// fmt file: magic, optional bone flag, LZ4 payload at 0x5A
Bytes wrap_fmt_lz4(const Bytes& payload, bool bones) {
    Bytes compressed = compress_lz4(payload);
    Bytes file(0x5A, 0);
    file[0] = 0x1F;
    put_u16(file, FILE_OFF_BONE_FLAG, bones ? 1 : 0);
    put_u32(file, 0x52, static_cast<uint32_t>(compressed.size()));
    put_u32(file, 0x56, static_cast<uint32_t>(payload.size()));
    append(file, compressed);
    return file;
}

// sky_v1 / heur_a offsets, LZ4 payload at 0x56
Bytes wrap_0x4e_lz4(const Bytes& payload) {
    Bytes compressed = compress_lz4(payload);
    Bytes file(0x56, 0);
    put_u32(file, 0x4E, static_cast<uint32_t>(compressed.size()));
    put_u32(file, 0x52, static_cast<uint32_t>(payload.size()));
    append(file, compressed);
    return file;
}

} // namespace

// ============================================================================
// Name header
// ============================================================================

TEST(NameHeader, StripsEmbeddedName) {
    Bytes file = name_header("rock_01.mesh");
    Bytes body = {0xAA, 0xBB};
    append(file, body);

    auto stripped = strip_name_header(file);
    ASSERT_EQ(stripped.size(), 2u);
    EXPECT_EQ(stripped[0], 0xAA);
}

TEST(NameHeader, KeepsDataWithoutPattern) {
    Bytes no_magic = {0x00, 0x00, 0x00, 0x00, 'a', 0x00};
    EXPECT_EQ(strip_name_header(no_magic).size(), no_magic.size());

    Bytes unprintable = {0x1F, 0x00, 0x00, 0x00, 0x01, 0x00};
    EXPECT_EQ(strip_name_header(unprintable).size(), unprintable.size());

    Bytes unterminated = {0x1F, 0x00, 0x00, 0x00};
    unterminated.resize(NAME_HEADER_LIMIT + 8, 'x');
    EXPECT_EQ(strip_name_header(unterminated).size(), unterminated.size());
}

TEST(NameHeader, MeshFileKeepsBothViews) {
    Bytes file = name_header("a");
    file.push_back(0x42);

    MeshFile stripped = make_mesh_file(file, true, "a");
    EXPECT_EQ(stripped.bytes.size(), file.size());
    EXPECT_EQ(stripped.body.size(), 1u);

    MeshFile raw = make_mesh_file(file, false, "a");
    EXPECT_EQ(raw.body.size(), file.size());
}

// ============================================================================
// Structured
// ============================================================================

TEST(StructuredStrategy, SkyV1StoredPayload) {
    Bytes file = wrap_sky_v1_stored(make_structured_payload(12, local_faces()));

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(file, true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();

    ASSERT_EQ(mesh->vertices.size(), 12u);
    EXPECT_EQ(mesh->vertices[5], Vertex(5.0f, 1.0f, -2.0f));
    ASSERT_EQ(mesh->uvs.size(), 12u);
    EXPECT_EQ(mesh->uvs[0], UV(1.0f, 0.5f));
    EXPECT_EQ(mesh->faces, local_faces());
}

TEST(StructuredStrategy, SkyV1BehindNameHeader) {
    Bytes file = name_header("crate_small.mesh");
    append(file, wrap_sky_v1_stored(make_structured_payload(12, local_faces())));

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(file, true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->faces.size(), 4u);

    // Without stripping the size fields are read from the wrong place
    auto raw = strategy.decode(make_mesh_file(file, false), {}, {});
    EXPECT_FALSE(raw.ok());
}

TEST(StructuredStrategy, SkyV1WideIndicesAndNormals) {
    Bytes payload = flags_block(12, 12, true);
    payload[FLAGS_OFF_LOAD_NORMALS] = 1;
    append_positions(payload, 12, POSITION_RECORD_SIZE);
    payload.resize(payload.size() + 12 * NORMAL_RECORD_SIZE, 0x7F);
    append_half_uvs(payload, 12, UV_RECORD_SIZE, 0);
    append(payload, encode_faces(local_faces(), true));

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_0x4e_lz4(payload), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->faces, local_faces());
    EXPECT_EQ(mesh->uvs[11], UV(0.5f, 1.0f));
}

TEST(StructuredStrategy, FmtWithBones) {
    Bytes payload = flags_block(12, 12, false);
    append_positions(payload, 12, POSITION_RECORD_SIZE);
    payload.resize(payload.size() + 12 * NORMAL_RECORD_SIZE, 0);
    append_half_uvs(payload, 12, UV_RECORD_SIZE, 0);
    payload.resize(payload.size() + 12 * BONE_RECORD_SIZE, 0xCD);
    append(payload, encode_faces(local_faces(), false));

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_fmt_lz4(payload, true), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->vertices[11], Vertex(11.0f, 2.0f, 3.0f));
    EXPECT_EQ(mesh->faces, local_faces());
}

TEST(StructuredStrategy, FmtPackedPositions) {
    Bytes payload = flags_block(12, 12, false);
    append(payload, encode_faces(local_faces(), false));
    for (int i = 0; i < 12; i++) {
        Bytes record = {0x00, 128, 255, 0};
        append(payload, record);
    }

    AssetHints hints;
    hints.compress_positions = true;

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_fmt_lz4(payload, false), true), hints, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    ASSERT_EQ(mesh->vertices.size(), 12u);
    EXPECT_FLOAT_EQ(mesh->vertices[0].x, 0.0f);
    EXPECT_FLOAT_EQ(mesh->vertices[0].z, -128.0f / 127.5f);
    EXPECT_EQ(mesh->faces, local_faces());
}

TEST(StructuredStrategy, CornerCountNotTriangleList) {
    Bytes payload = make_structured_payload(12, local_faces());
    put_u32(payload, FLAGS_OFF_CORNER_COUNT, 13);

    StructuredStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_sky_v1_stored(payload), true), {}, {});
    ASSERT_FALSE(mesh.ok());
    EXPECT_EQ(mesh.error().code, Error::Code::MalformedHeader);
}

TEST(StructuredStrategy, FlagsBlockFields) {
    Bytes payload = flags_block(40, 90, true);
    payload[FLAGS_OFF_LOAD_NORMALS] = 1;
    put_u32(payload, FLAGS_OFF_SKIP_UVS, 1);
    put_u32(payload, FLAGS_OFF_UV_COUNT, 2);

    auto flags = read_flags_block(ByteView(payload));
    ASSERT_TRUE(flags.ok());
    EXPECT_EQ(flags->vertex_count, 40u);
    EXPECT_EQ(flags->corner_count, 90u);
    EXPECT_TRUE(flags->is_idx32);
    EXPECT_TRUE(flags->load_normals);
    EXPECT_TRUE(flags->skip_uvs);
    EXPECT_FALSE(flags->skip_positions);
    EXPECT_EQ(flags->uv_count, 2u);

    payload.resize(FLAGS_BLOCK_SIZE - 1);
    EXPECT_FALSE(read_flags_block(ByteView(payload)).ok());
}

// ============================================================================
// Heuristic
// ============================================================================

TEST(HeuristicStrategy, PackedUvLayout) {
    Bytes payload(FLAGS_BLOCK_SIZE, 0);
    put_u32(payload, 0x74, 12);
    put_u32(payload, 0x78, 12);
    payload.resize(FLAGS_BLOCK_SIZE);
    append_positions(payload, 12, POSITION_RECORD_SIZE);
    append_half_uvs(payload, 12, UV_RECORD_SIZE, 0);
    payload.resize(payload.size() + 4, 0);
    append(payload, encode_faces(local_faces(), false));

    HeuristicStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_0x4e_lz4(payload), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->vertices[3], Vertex(3.0f, 2.0f, 3.0f));
    EXPECT_EQ(mesh->uvs[3], UV(0.5f, 1.0f));
    EXPECT_EQ(mesh->faces, local_faces());
}

TEST(HeuristicStrategy, UvHeaderLayout) {
    const uint32_t n = 12;
    Bytes payload(FLAGS_BLOCK_SIZE, 0);
    put_u32(payload, 0x74, n);
    put_u32(payload, 0x78, 12);
    payload.resize(FLAGS_BLOCK_SIZE);
    append_positions(payload, n, POSITION_RECORD_SIZE);
    // n * 4 - 4 header bytes, then records carrying the half pair at +4
    payload.resize(payload.size() + n * 4 - 4, 0xEE);
    append_half_uvs(payload, n, UV_RECORD_SIZE, 4);
    payload.resize(payload.size() + 4, 0);
    append(payload, encode_faces(local_faces(), false));

    HeuristicStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_0x4e_lz4(payload), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    ASSERT_EQ(mesh->vertices.size(), n);
    EXPECT_EQ(mesh->vertices[0], Vertex(0.0f, 2.0f, 3.0f));
    EXPECT_EQ(mesh->vertices[11], Vertex(11.0f, 2.0f, 3.0f));
    ASSERT_EQ(mesh->uvs.size(), n);
    for (const auto& uv : mesh->uvs) {
        EXPECT_EQ(uv, UV(0.5f, 1.0f));
    }
    EXPECT_EQ(mesh->faces, local_faces());
}

TEST(HeuristicStrategy, NoCandidateFits) {
    Bytes file(0x300, 0);
    HeuristicStrategy strategy;
    EXPECT_FALSE(strategy.decode(make_mesh_file(file, true), {}, {}).ok());
}

// ============================================================================
// Compressed
// ============================================================================

TEST(CompressedStrategy, QuantizedPayload) {
    auto faces = sequential_faces(6);
    Bytes file = wrap_comp_a_lz4(make_quantized_payload(20, faces));

    CompressedStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(file, true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->vertices.size(), 20u);
    EXPECT_EQ(mesh->faces, faces);
}

TEST(CompressedStrategy, NormalizedPayloadWithCompanionUvs) {
    const uint32_t n = 12;
    auto faces = sequential_faces(3);

    Bytes payload(QUANT_OFF_VERTICES, 0);
    put_u32(payload, QUANT_OFF_SHARED_COUNT, n);
    put_u32(payload, QUANT_OFF_INDEX_COUNT, static_cast<uint32_t>(faces.size() * 3));
    append(payload, encode_faces(faces, false));
    for (uint32_t i = 0; i < n; i++) {
        put_u16(payload, payload.size(), 65535);
        put_u16(payload, payload.size(), 0);
    }
    for (uint32_t i = 0; i < n; i++) {
        Bytes record = {0x00, 128, 128, 255};
        append(payload, record);
    }

    AssetHints hints;
    hints.compress_positions = true;

    CompressedStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_comp_a_lz4(payload), true), hints, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    ASSERT_EQ(mesh->vertices.size(), n);
    EXPECT_FLOAT_EQ(mesh->vertices[0].z, 127.0f / 127.5f);
    ASSERT_EQ(mesh->uvs.size(), n);
    EXPECT_EQ(mesh->uvs[0], UV(1.0f, 0.0f));
    EXPECT_EQ(mesh->faces, faces);
}

TEST(CompressedStrategy, RawU16Payload) {
    const uint32_t n = 12;
    auto faces = sequential_faces(3);

    Bytes payload(RAW_OFF_VERTICES, 0);
    put_u32(payload, RAW_OFF_SHARED_COUNT, n);
    put_u32(payload, RAW_OFF_INDEX_COUNT, static_cast<uint32_t>(faces.size() * 3));
    put_u32(payload, RAW_OFF_UV_COUNT, n);
    for (uint32_t i = 0; i < n; i++) {
        size_t off = payload.size();
        put_u16(payload, off, static_cast<uint16_t>(i));
        put_u16(payload, off + 2, static_cast<uint16_t>(2 * i));
        put_u16(payload, off + 4, 100);
    }
    for (uint32_t i = 0; i < n; i++) {
        put_u16(payload, payload.size(), 65535);
        put_u16(payload, payload.size(), 0);
    }
    const size_t face_offset = payload.size();
    append(payload, encode_faces(faces, false));

    CompressedStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_comp_a_lz4(payload), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    ASSERT_EQ(mesh->vertices.size(), n);
    EXPECT_EQ(mesh->vertices[5], Vertex(5.0f, 10.0f, 100.0f));
    ASSERT_EQ(mesh->uvs.size(), n);
    EXPECT_EQ(mesh->uvs[7], UV(1.0f, 0.0f));
    EXPECT_EQ(mesh->faces, faces);
    EXPECT_EQ(face_offset, RAW_OFF_VERTICES + n * (QUANT_VERTEX_SIZE + QUANT_UV_SIZE));
}

TEST(CompressedStrategy, RawCountsOutOfRangeFallBackToQuantized) {
    auto faces = sequential_faces(6);
    Bytes payload = make_quantized_payload(20, faces);
    // Total not a multiple of three: the header-less reading is skipped
    put_u32(payload, RAW_OFF_SHARED_COUNT, 20);
    put_u32(payload, RAW_OFF_INDEX_COUNT, 19);

    CompressedStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_comp_a_lz4(payload), true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_NEAR(mesh->vertices[0].x, 5.0f, 1e-3f);
    EXPECT_EQ(mesh->faces, faces);
}

TEST(CompressedStrategy, ImplausibleCountsRejected) {
    Bytes payload = make_quantized_payload(20, sequential_faces(6));
    put_u32(payload, QUANT_OFF_INDEX_COUNT, 19);

    CompressedStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(wrap_comp_a_lz4(payload), true), {}, {});
    EXPECT_FALSE(mesh.ok());
}

// ============================================================================
// Index scan
// ============================================================================

TEST(IndexScanStrategy, UncompressedBody) {
    const uint32_t n = 12;
    auto faces = sequential_faces(3);

    Bytes file(0xB3, 0);
    put_u32(file, 0x20, n);
    put_u32(file, 0x24, static_cast<uint32_t>(faces.size() * 3));
    file.resize(0xB3);
    append_positions(file, n, 12);
    file.resize(file.size() + n * UV_RECORD_SIZE, 0);
    append(file, encode_faces(faces, false));

    IndexScanStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(file, true), {}, {});
    ASSERT_TRUE(mesh.ok()) << mesh.error().full_message();
    EXPECT_EQ(mesh->vertices.size(), n);
    EXPECT_EQ(mesh->vertices[4], Vertex(4.0f, 2.0f, 3.0f));
    EXPECT_EQ(mesh->faces, faces);
}

TEST(IndexScanStrategy, CancelStopsScan) {
    const uint32_t n = 12;
    Bytes file(0xB3, 0);
    put_u32(file, 0x20, n);
    put_u32(file, 0x24, 9);
    file.resize(0x400, 0);

    std::atomic<bool> cancel{true};
    DecodeOptions options;
    options.locator.cancel = &cancel;

    IndexScanStrategy strategy;
    auto mesh = strategy.decode(make_mesh_file(file, true), {}, options);
    ASSERT_FALSE(mesh.ok());
    EXPECT_EQ(mesh.error().code, Error::Code::IndexRegionNotFound);
}
