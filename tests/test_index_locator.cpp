#include "skymesh/index_locator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <array>
#include <atomic>

using namespace skymesh;
using namespace skymesh::test;

namespace {

constexpr size_t ANCHOR = 0x40;
constexpr size_t VERTEX_COUNT = 20;

// 0xFF filler never decodes to an index below VERTEX_COUNT
Bytes garbage(size_t size) {
    return Bytes(size, 0xFF);
}

Bytes embed(Bytes buffer, size_t offset, const Bytes& run) {
    if (buffer.size() < offset + run.size()) {
        buffer.resize(offset + run.size(), 0xFF);
    }
    std::copy(run.begin(), run.end(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
    return buffer;
}

// Indices cycle through 1..vertex_count-1, so no prefix is zero-heavy
std::vector<Face> wrapping_faces(size_t count, size_t vertex_count) {
    std::vector<Face> faces;
    const size_t span = vertex_count - 1;
    for (size_t i = 0; i < count; i++) {
        faces.emplace_back(static_cast<uint32_t>((3 * i) % span + 1),
                           static_cast<uint32_t>((3 * i + 1) % span + 1),
                           static_cast<uint32_t>((3 * i + 2) % span + 1));
    }
    return faces;
}

} // namespace

class IndexLocatorStep : public ::testing::TestWithParam<size_t> {};

TEST_P(IndexLocatorStep, Finds16BitRunAtExactOffset) {
    auto faces = sequential_faces(6);
    Bytes payload = embed(garbage(0x200), ANCHOR + 24, encode_faces(faces, false));

    LocatorConfig config;
    config.step = GetParam();
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, ANCHOR + 24);
    EXPECT_EQ(region->width, IndexWidth::U16);
    EXPECT_EQ(region->faces, faces);
    EXPECT_EQ(region->end(), ANCHOR + 24 + faces.size() * 6);
}

TEST_P(IndexLocatorStep, Finds32BitRunAtExactOffset) {
    auto faces = sequential_faces(6);
    Bytes payload = embed(garbage(0x200), ANCHOR + 24, encode_faces(faces, true));

    LocatorConfig config;
    config.step = GetParam();
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, ANCHOR + 24);
    EXPECT_EQ(region->width, IndexWidth::U32);
    EXPECT_EQ(region->faces, faces);
}

TEST_P(IndexLocatorStep, FindsLong32BitRunAtAnchor) {
    constexpr size_t large_vertex_count = 3000;
    auto faces = wrapping_faces(2000, large_vertex_count);
    Bytes payload = embed(garbage(ANCHOR), ANCHOR, encode_faces(faces, true));
    payload.resize(payload.size() + 0x40, 0xFF);

    LocatorConfig config;
    config.step = GetParam();
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), large_vertex_count, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, ANCHOR);
    EXPECT_EQ(region->width, IndexWidth::U32);
    EXPECT_EQ(region->faces, faces);
    EXPECT_EQ(region->iterations, 1u);
}

TEST_P(IndexLocatorStep, FindsLong32BitRunAfterFiller) {
    // Read as 16-bit, this run is zero-heavy at every start; it spans far more starts than the budget
    constexpr size_t large_vertex_count = 3000;
    auto faces = wrapping_faces(500, large_vertex_count);
    Bytes payload = embed(garbage(ANCHOR + 48), ANCHOR + 48, encode_faces(faces, true));

    LocatorConfig config;
    config.step = GetParam();
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), large_vertex_count, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, ANCHOR + 48);
    EXPECT_EQ(region->width, IndexWidth::U32);
    EXPECT_EQ(region->iterations, 48 / GetParam() + 1);
}

INSTANTIATE_TEST_SUITE_P(Steps, IndexLocatorStep, ::testing::Values(1, 2, 4));

TEST(IndexLocator, RejectsZeroHeavyRun) {
    // Valid bounds but half the indices are zero
    std::vector<Face> decoy;
    for (int i = 0; i < 6; i++) {
        decoy.emplace_back(0, 1, 0);
    }
    auto faces = sequential_faces(6);

    Bytes payload = embed(garbage(0x200), ANCHOR, encode_faces(decoy, false));
    payload = embed(std::move(payload), ANCHOR + 64, encode_faces(faces, false));

    const std::array<size_t, 1> anchors = {ANCHOR};

    IndexLocator strict;
    auto region = strict.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, ANCHOR + 64);
    EXPECT_EQ(region->faces, faces);

    LocatorConfig lenient_config;
    lenient_config.max_zero_ratio = 1.0;
    IndexLocator lenient(lenient_config);
    auto decoy_region = lenient.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(decoy_region.ok());
    EXPECT_EQ(decoy_region->offset, ANCHOR);
}

TEST(IndexLocator, RunCutByBufferEndIsRejected) {
    auto faces = sequential_faces(6);
    Bytes run = encode_faces(faces, false);
    Bytes payload = embed(garbage(ANCHOR), ANCHOR, run);
    payload.resize(payload.size() - 6);

    IndexLocator locator;
    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_FALSE(region.ok());
    EXPECT_EQ(region.error().code, Error::Code::IndexRegionNotFound);
}

TEST(IndexLocator, FallbackAnchor) {
    auto faces = sequential_faces(4);
    Bytes payload = embed(garbage(0x100), 0x10, encode_faces(faces, false));

    IndexLocator locator;
    // First anchor lies past the run, the second precedes it
    const std::array<size_t, 2> anchors = {0x80, 0x08};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(region.ok()) << region.error().full_message();
    EXPECT_EQ(region->offset, 0x10u);
}

TEST(IndexLocator, DuplicateAnchorsVisitedOnce) {
    auto faces = sequential_faces(6);
    Bytes payload = embed(garbage(0x200), ANCHOR + 24, encode_faces(faces, false));

    IndexLocator locator;
    const std::array<size_t, 2> anchors = {ANCHOR, ANCHOR};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_TRUE(region.ok());
    // Starts ANCHOR, +4, ..., +24
    EXPECT_EQ(region->iterations, 7u);
}

TEST(IndexLocator, IterationBudget) {
    Bytes payload = garbage(0x400);

    LocatorConfig config;
    config.max_iterations = 3;
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {0};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, 4, anchors);
    ASSERT_FALSE(region.ok());
    EXPECT_EQ(region.error().code, Error::Code::IndexRegionNotFound);
    EXPECT_NE(region.error().message.find("budget"), std::string::npos);
}

TEST(IndexLocator, ExhaustedSearchSpace) {
    Bytes payload = garbage(0x40);

    IndexLocator locator;
    const std::array<size_t, 1> anchors = {0};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, 2, anchors);
    ASSERT_FALSE(region.ok());
    EXPECT_EQ(region.error().code, Error::Code::IndexRegionNotFound);
}

TEST(IndexLocator, Cancelled) {
    auto faces = sequential_faces(6);
    Bytes payload = embed(garbage(0x200), ANCHOR + 24, encode_faces(faces, false));

    std::atomic<bool> cancel{true};
    LocatorConfig config;
    config.cancel = &cancel;
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    auto region = locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors);
    ASSERT_FALSE(region.ok());
    EXPECT_EQ(region.error().code, Error::Code::IndexRegionNotFound);
}

TEST(IndexLocator, MinimumFaceCount) {
    auto faces = sequential_faces(2);
    Bytes payload = embed(garbage(0x100), ANCHOR, encode_faces(faces, false));

    LocatorConfig config;
    config.min_face_count = 3;
    IndexLocator locator(config);

    const std::array<size_t, 1> anchors = {ANCHOR};
    EXPECT_FALSE(locator.locate(ByteView(payload), VERTEX_COUNT, faces.size(), anchors).ok());
}

TEST(IndexLocator, ZeroStepIsClamped) {
    LocatorConfig config;
    config.step = 0;
    IndexLocator locator(config);
    EXPECT_EQ(locator.config().step, 1u);
}
