#pragma once

#include <string>
#include <optional>

// Format a number of seconds as "HH:MM:SS". Hours are zero-padded to two
// digits but not truncated (360000s -> "100:00:00").
std::string format_hms(long long seconds);

// Parse "H+:MM:SS" back to seconds. std::nullopt on malformed input.
std::optional<long long> parse_hms(const std::string& hms);

// Human-readable elapsed time: "2h35m", "14m22s", "8s". Negative -> "-".
std::string format_duration(long long seconds);
