/**
 * skymesh - Mesh Decoder Implementation
 */

#include "skymesh/mesh_decoder.hpp"
#include "skymesh/strategies.hpp"
#include "skymesh/logging.hpp"
#include <exception>

namespace skymesh {

const char* decode_state_string(DecodeState state) {
    switch (state) {
        case DecodeState::NotStarted:     return "NotStarted";
        case DecodeState::TryingStrategy: return "TryingStrategy";
        case DecodeState::Accepted:       return "Accepted";
        case DecodeState::Exhausted:      return "Exhausted";
        default:                          return "Unknown";
    }
}

MeshDecoder::MeshDecoder(DecodeOptions options)
    : MeshDecoder(options, default_strategies())
{
}

MeshDecoder::MeshDecoder(DecodeOptions options, StrategyList strategies)
    : options_(options)
    , strategies_(std::move(strategies))
    , validator_(options.min_vertices)
{
}

StrategyList MeshDecoder::default_strategies() {
    StrategyList list;
    list.push_back(std::make_unique<StructuredStrategy>());
    list.push_back(std::make_unique<HeuristicStrategy>());
    list.push_back(std::make_unique<CompressedStrategy>());
    list.push_back(std::make_unique<IndexScanStrategy>());
    return list;
}

ParseOutcome MeshDecoder::decode(std::span<const uint8_t> data, const AssetHints& hints,
                                 const std::string& name) const {
    MeshFile file = make_mesh_file(data, options_.strip_name_header, name);
    if (file.body.size() != file.bytes.size()) {
        SKYMESH_TRACE(options_, "Decoder", name << ": stripped " << (file.bytes.size() - file.body.size())
                      << "-byte embedded name");
    }

    DecodeState state = DecodeState::NotStarted;
    std::string last_strategy = "none";
    Error last_error = Error::malformed_header("No strategies configured");

    for (size_t i = 0; i < strategies_.size(); i++) {
        const ParseStrategy& strategy = *strategies_[i];
        state = DecodeState::TryingStrategy;
        last_strategy = strategy.name();
        SKYMESH_TRACE(options_, "Decoder", name << ": " << decode_state_string(state)
                      << "(" << i << ") " << strategy.name());

        Result<DecodedMesh> result = Error::malformed_header("Strategy produced nothing");
        try {
            result = strategy.decode(file, hints, options_);
        } catch (const std::exception& e) {
            // Allocation failures on absurd counts end up here
            LOG_WARNING("Decoder", name << ": strategy " << strategy.name() << " threw: " << e.what());
            result = Error::invalid_format(std::string("Exception: ") + e.what());
        }

        if (!result) {
            last_error = result.error();
            SKYMESH_TRACE(options_, "Decoder", name << ": " << strategy.name() << " failed: "
                          << result.error().full_message());
            continue;
        }

        auto plausible = validator_.check(*result);
        if (!plausible) {
            last_error = plausible.error();
            SKYMESH_TRACE(options_, "Decoder", name << ": " << strategy.name() << " rejected: "
                          << plausible.error().message);
            continue;
        }

        state = DecodeState::Accepted;
        SKYMESH_TRACE(options_, "Decoder", name << ": " << decode_state_string(state) << " "
                      << strategy.name() << " (" << result->vertices.size() << " vertices, "
                      << result->faces.size() << " faces)");
        return DecodeSuccess{std::move(*result), strategy.name()};
    }

    state = DecodeState::Exhausted;
    SKYMESH_TRACE(options_, "Decoder", name << ": " << decode_state_string(state));

    return Error(Error::Code::AllStrategiesFailed,
                 "All strategies failed; last (" + last_strategy + "): " + last_error.full_message(),
                 name);
}

} // namespace skymesh
