#pragma once

#include "listen_along/core/models.hpp"
#include <string>

namespace listen_along::utils {

/**
 * @brief Replace placeholders in a format string with values from a TrackSnapshot
 *
 * Supported placeholders: {title}, {artist}, {album}, {source}, {duration}.
 * Missing optional values expand to an empty string.
 *
 * @param format The format string containing placeholders
 * @param track The snapshot providing the values
 * @return The formatted string with surrounding whitespace trimmed
 */
std::string replace_placeholders(const std::string& format, const core::TrackSnapshot& track);

/**
 * @brief Format a duration in milliseconds as M:SS or H:MM:SS
 */
std::string format_duration(std::int64_t milliseconds);

// Cuts at a UTF-8 code point boundary so multi-byte characters are never split.
std::string truncate_utf8(const std::string& text, std::size_t max_bytes);

} // namespace listen_along::utils
