#include "huddle/utils/format_utils.hpp"

#include <charconv>

namespace huddle::utils {

namespace {

// Compared before converting so large counts cannot overflow
template <typename Unit>
std::expected<std::chrono::milliseconds, std::string> bounded(long long value, std::string_view text) {
    if (value > std::chrono::duration_cast<Unit>(MAX_DURATION).count()) {
        return std::unexpected("Duration '" + std::string(text) + "' exceeds " + format_duration(MAX_DURATION));
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(Unit{value});
}

}

std::expected<std::chrono::milliseconds, std::string> parse_duration(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return std::unexpected("Empty duration");
    }
    const auto last = text.find_last_not_of(" \t");
    const auto trimmed = text.substr(first, last - first + 1);

    long long value = 0;
    const auto* begin = trimmed.data();
    const auto* end = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::unexpected("Invalid duration '" + std::string(trimmed) + "'");
    }
    if (value < 0) {
        return std::unexpected("Negative duration '" + std::string(trimmed) + "'");
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    if (unit.empty() || unit == "s") {
        return bounded<std::chrono::seconds>(value, trimmed);
    }
    if (unit == "ms") {
        return bounded<std::chrono::milliseconds>(value, trimmed);
    }
    if (unit == "m") {
        return bounded<std::chrono::minutes>(value, trimmed);
    }
    if (unit == "h") {
        return bounded<std::chrono::hours>(value, trimmed);
    }
    return std::unexpected("Unknown duration unit '" + std::string(unit) + "' in '" + std::string(trimmed) + "'");
}

std::string format_duration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms != 0 && ms % 3'600'000 == 0) return std::to_string(ms / 3'600'000) + "h";
    if (ms != 0 && ms % 60'000 == 0) return std::to_string(ms / 60'000) + "m";
    if (ms % 1'000 == 0) return std::to_string(ms / 1'000) + "s";
    return std::to_string(ms) + "ms";
}

} // namespace huddle::utils
