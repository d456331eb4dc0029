#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>

std::string format_hms(long long seconds) {
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;
    return fmt::format("{:02}:{:02}:{:02}", hours, mins, secs);
}

std::optional<long long> parse_hms(const std::string& hms) {
    auto c1 = hms.find(':');
    if (c1 == std::string::npos) return std::nullopt;
    auto c2 = hms.find(':', c1 + 1);
    if (c2 == std::string::npos) return std::nullopt;

    std::string h = hms.substr(0, c1);
    std::string m = hms.substr(c1 + 1, c2 - c1 - 1);
    std::string s = hms.substr(c2 + 1);
    if (!is_all_digits(h) || !is_all_digits(m) || !is_all_digits(s)) return std::nullopt;
    if (m.size() != 2 || s.size() != 2 || h.size() > 12) return std::nullopt;

    long long mins = std::stoll(m);
    long long secs = std::stoll(s);
    if (mins > 59 || secs > 59) return std::nullopt;
    return std::stoll(h) * 3600 + mins * 60 + secs;
}

std::string format_duration(long long seconds) {
    if (seconds < 0) return "-";

    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
