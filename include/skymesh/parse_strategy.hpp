/**
 * skymesh - Parse Strategy interface
 *
 * A strategy is one complete hypothesis about header layout plus encoding
 * family. It either produces a plausible DecodedMesh or an error saying
 * why this hypothesis does not hold for the file.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <span>
#include <string>
#include <cstdint>

namespace skymesh {

/**
 * One input file for a decode call. body is bytes with an embedded file
 * name removed (identical to bytes when there is none). Layouts that the
 * writer addresses from the true file start read bytes, the rest read body.
 */
struct MeshFile {
    std::span<const uint8_t> bytes;
    std::span<const uint8_t> body;
    std::string name;
};

/**
 * Detect [1F 00 00 00][printable name...][00] and return the data after the
 * terminator. Returns data unchanged when the pattern is absent or the
 * terminator lies beyond 0x100.
 */
std::span<const uint8_t> strip_name_header(std::span<const uint8_t> data);

MeshFile make_mesh_file(std::span<const uint8_t> data, bool strip_name, std::string name = {});

class ParseStrategy {
public:
    virtual ~ParseStrategy() = default;

    virtual const char* name() const = 0;

    virtual Result<DecodedMesh> decode(const MeshFile& file, const AssetHints& hints,
                                       const DecodeOptions& options) const = 0;
};

} // namespace skymesh
