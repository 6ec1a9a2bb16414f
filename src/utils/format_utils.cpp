#include "listen_along/utils/format_utils.hpp"
#include <iomanip>
#include <sstream>

namespace listen_along::utils {

std::string format_duration(std::int64_t milliseconds) {
    const auto total_seconds = milliseconds < 0 ? 0 : milliseconds / 1000;
    const auto hours = total_seconds / 3600;
    const auto minutes = (total_seconds % 3600) / 60;
    const auto secs = total_seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setfill('0') << std::setw(2) << minutes
            << ":" << std::setw(2) << secs;
    } else {
        oss << minutes << ":" << std::setfill('0') << std::setw(2) << secs;
    }
    return oss.str();
}

std::string replace_placeholders(const std::string& format, const core::TrackSnapshot& track) {
    std::string result = format;

    auto replace = [&result](const std::string& placeholder, const std::string& value) {
        size_t pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.length(), value);
            pos += value.length();
        }
    };

    replace("{title}", track.title);
    replace("{artist}", track.artist);
    replace("{album}", track.album.value_or(""));
    replace("{source}", core::to_string(track.source_id));
    replace("{duration}", track.duration_ms ? format_duration(*track.duration_ms) : "");

    const auto first = result.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = result.find_last_not_of(" \t");
    return result.substr(first, last - first + 1);
}

std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    auto cut = max_bytes;
    // Step back over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace listen_along::utils
