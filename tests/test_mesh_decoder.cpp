#include "skymesh/mesh_decoder.hpp"
#include "skymesh/mesh_converter.hpp"
#include "skymesh/strategies.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

using namespace skymesh;
using namespace skymesh::test;

namespace {

// Records calls, then delegates or fails
class SpyStrategy : public ParseStrategy {
public:
    SpyStrategy(const char* name, std::atomic<int>& calls, std::unique_ptr<ParseStrategy> inner = nullptr)
        : name_(name), calls_(calls), inner_(std::move(inner)) {}

    const char* name() const override { return name_; }

    Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                               const DecodeOptions& options) const override {
        calls_++;
        if (inner_) {
            return inner_->decode(file, hints, options);
        }
        return Error::malformed_header("spy");
    }

private:
    const char* name_;
    std::atomic<int>& calls_;
    std::unique_ptr<ParseStrategy> inner_;
};

class ThrowingStrategy : public ParseStrategy {
public:
    const char* name() const override { return "throwing"; }

    Result<DecodedMesh> decode(const MeshFile&, const AssetHints&, const DecodeOptions&) const override {
        throw std::length_error("vector too long");
    }
};

// Returns a complete mesh the validator must refuse
class ImplausibleStrategy : public ParseStrategy {
public:
    const char* name() const override { return "implausible"; }

    Result<DecodedMesh> decode(const MeshFile&, const AssetHints&, const DecodeOptions&) const override {
        DecodedMesh mesh;
        mesh.vertices.assign(3, Vertex(0.0f));
        mesh.faces.emplace_back(0, 1, 2);
        return mesh;
    }
};

Bytes quantized_asset() {
    return wrap_comp_a_lz4(make_quantized_payload(20, sequential_faces(6)));
}

} // namespace

TEST(MeshDecoder, DefaultStrategyOrder) {
    auto list = MeshDecoder::default_strategies();
    ASSERT_EQ(list.size(), 4u);
    EXPECT_STREQ(list[0]->name(), "structured");
    EXPECT_STREQ(list[1]->name(), "heuristic");
    EXPECT_STREQ(list[2]->name(), "compressed");
    EXPECT_STREQ(list[3]->name(), "index_scan");
}

TEST(MeshDecoder, StructuredFileAcceptedFirst) {
    Bytes file = wrap_sky_v1_stored(make_structured_payload(12, {{0, 1, 2}, {3, 4, 5}, {9, 10, 11}, {6, 7, 8}}));

    MeshDecoder decoder;
    auto outcome = decoder.decode(file, {}, "crate");
    ASSERT_TRUE(outcome.ok()) << outcome.error().full_message();
    EXPECT_EQ(outcome->strategy, "structured");
    EXPECT_EQ(outcome->mesh.faces.size(), 4u);
}

TEST(MeshDecoder, FallsBackToCompressedWithoutLastResort) {
    std::atomic<int> structured_calls{0}, heuristic_calls{0}, compressed_calls{0}, scan_calls{0};

    StrategyList list;
    list.push_back(std::make_unique<SpyStrategy>("structured", structured_calls,
                                                 std::make_unique<StructuredStrategy>()));
    list.push_back(std::make_unique<SpyStrategy>("heuristic", heuristic_calls,
                                                 std::make_unique<HeuristicStrategy>()));
    list.push_back(std::make_unique<SpyStrategy>("compressed", compressed_calls,
                                                 std::make_unique<CompressedStrategy>()));
    list.push_back(std::make_unique<SpyStrategy>("index_scan", scan_calls,
                                                 std::make_unique<IndexScanStrategy>()));

    MeshDecoder decoder(DecodeOptions{}, std::move(list));
    auto outcome = decoder.decode(quantized_asset(), {}, "rock");
    ASSERT_TRUE(outcome.ok()) << outcome.error().full_message();

    EXPECT_EQ(outcome->strategy, "compressed");
    EXPECT_EQ(structured_calls.load(), 1);
    EXPECT_EQ(heuristic_calls.load(), 1);
    EXPECT_EQ(compressed_calls.load(), 1);
    EXPECT_EQ(scan_calls.load(), 0);
}

TEST(MeshDecoder, EndToEndQuantizedMidScale) {
    MeshDecoder decoder;
    auto outcome = decoder.decode(quantized_asset(), {}, "rock");
    ASSERT_TRUE(outcome.ok()) << outcome.error().full_message();

    const auto& mesh = outcome->mesh;
    ASSERT_EQ(mesh.vertices.size(), 20u);
    for (const auto& v : mesh.vertices) {
        EXPECT_NEAR(v.x, 5.0f, 1e-3f);
        EXPECT_NEAR(v.y, 5.0f, 1e-3f);
        EXPECT_NEAR(v.z, 5.0f, 1e-3f);
    }
    EXPECT_EQ(mesh.faces, sequential_faces(6));

    MeshConverter converter(mesh, "rock");
    auto output = converter.convert();
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(count_lines_with_prefix(output->obj, "v "), 20u);
    EXPECT_EQ(count_lines_with_prefix(output->obj, "f "), 6u);
    EXPECT_NE(output->obj.find("\nf 2/2 3/3 4/4\n"), std::string::npos);
    EXPECT_NE(output->obj.find("\nf 17/17 18/18 19/19\n"), std::string::npos);
}

TEST(MeshDecoder, AllStrategiesFailReportsLastReason) {
    Bytes garbage(0x400, 0);

    MeshDecoder decoder;
    auto outcome = decoder.decode(garbage, {}, "empty.mesh");
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, Error::Code::AllStrategiesFailed);
    EXPECT_EQ(outcome.error().context, "empty.mesh");
    EXPECT_NE(outcome.error().message.find("index_scan"), std::string::npos);
}

TEST(MeshDecoder, ExceptionsAreContained) {
    StrategyList list;
    list.push_back(std::make_unique<ThrowingStrategy>());
    list.push_back(std::make_unique<CompressedStrategy>());

    MeshDecoder decoder(DecodeOptions{}, std::move(list));
    auto outcome = decoder.decode(quantized_asset());
    ASSERT_TRUE(outcome.ok()) << outcome.error().full_message();
    EXPECT_EQ(outcome->strategy, "compressed");
}

TEST(MeshDecoder, ImplausibleResultFallsThrough) {
    std::atomic<int> next_calls{0};

    StrategyList list;
    list.push_back(std::make_unique<ImplausibleStrategy>());
    list.push_back(std::make_unique<SpyStrategy>("next", next_calls));

    MeshDecoder decoder(DecodeOptions{}, std::move(list));
    auto outcome = decoder.decode(quantized_asset());
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(next_calls.load(), 1);
    EXPECT_EQ(outcome.error().code, Error::Code::AllStrategiesFailed);
}

TEST(MeshDecoder, EmptyStrategyList) {
    MeshDecoder decoder(DecodeOptions{}, StrategyList{});
    EXPECT_EQ(decoder.strategy_count(), 0u);
    auto outcome = decoder.decode(quantized_asset());
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, Error::Code::AllStrategiesFailed);
}

TEST(MeshDecoder, StateNames) {
    EXPECT_STREQ(decode_state_string(DecodeState::NotStarted), "NotStarted");
    EXPECT_STREQ(decode_state_string(DecodeState::Exhausted), "Exhausted");
}
