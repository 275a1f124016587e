/**
 * skymesh - Settings
 *
 * settings.json persistence for AppSettings. Missing keys keep their
 * defaults; CLI flags are applied on top by the caller.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <string_view>

namespace skymesh {

/**
 * Parse settings JSON text over the given defaults.
 */
Result<AppSettings> parse_settings(std::string_view json_text, const AppSettings& defaults = {});

/**
 * Serialize settings to JSON text (2-space indent).
 */
std::string dump_settings(const AppSettings& settings);

/**
 * Load settings.json. A missing file yields defaults.
 */
Result<AppSettings> load_settings(const fs::path& path, const AppSettings& defaults = {});

Result<void> save_settings(const fs::path& path, const AppSettings& settings);

} // namespace skymesh
