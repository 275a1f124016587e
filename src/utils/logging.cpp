/**
 * skymesh - Logging helpers
 */

#include "skymesh/logging.hpp"
#include <algorithm>
#include <cctype>

namespace skymesh {

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug" || lower == "trace") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none" || lower == "off") return LogLevel::None;
    return LogLevel::Info;
}

} // namespace skymesh
