/**
 * skymesh - Mesh Decoder
 *
 * Runs the parse strategies in fixed priority order and keeps the first
 * result the plausibility validator accepts.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include "parse_strategy.hpp"
#include "mesh_validator.hpp"
#include <memory>
#include <vector>
#include <span>
#include <string>

namespace skymesh {

enum class DecodeState {
    NotStarted,
    TryingStrategy,
    Accepted,
    Exhausted
};

const char* decode_state_string(DecodeState state);

struct DecodeSuccess {
    DecodedMesh mesh;
    std::string strategy;
};

using ParseOutcome = Result<DecodeSuccess>;

using StrategyList = std::vector<std::unique_ptr<ParseStrategy>>;

class MeshDecoder {
public:
    explicit MeshDecoder(DecodeOptions options = {});
    MeshDecoder(DecodeOptions options, StrategyList strategies);

    /**
     * structured, heuristic, compressed, index_scan.
     */
    static StrategyList default_strategies();

    /**
     * Decode one file. Per-strategy failures are logged and skipped; the
     * only error returned is AllStrategiesFailed carrying the last reason.
     */
    ParseOutcome decode(std::span<const uint8_t> data, const AssetHints& hints = {},
                        const std::string& name = {}) const;

    const DecodeOptions& options() const { return options_; }
    size_t strategy_count() const { return strategies_.size(); }

private:
    DecodeOptions options_;
    StrategyList strategies_;
    MeshValidator validator_;
};

} // namespace skymesh
