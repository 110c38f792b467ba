#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace huddle::utils {

// Longest duration accepted from configuration
inline constexpr std::chrono::hours MAX_DURATION{24};

/**
 * @brief Parse a duration such as "250ms", "30s", "5m" or "1h"
 *
 * A bare integer is taken as seconds. Whitespace around the value is ignored.
 * Values above MAX_DURATION are rejected.
 *
 * @param text The duration text
 * @return Milliseconds, or an error message naming the offending text
 */
std::expected<std::chrono::milliseconds, std::string> parse_duration(std::string_view text);

/**
 * @brief Format milliseconds using the largest unit that divides evenly
 *
 * 300000 -> "5m", 30000 -> "30s", 1500 -> "1500ms". Output round-trips
 * through parse_duration.
 */
std::string format_duration(std::chrono::milliseconds duration);

} // namespace huddle::utils
