#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>

// True if s is non-empty and every character is an ASCII digit.
bool is_all_digits(const std::string& s);

// Split on runs of spaces/tabs, dropping empty fields.
std::vector<std::string> split_whitespace(const std::string& line);

// Whole-file read. std::nullopt if the file cannot be opened.
std::optional<std::string> read_file(const std::filesystem::path& path);

// Write (truncate) a file. Returns false on failure.
bool write_file(const std::filesystem::path& path, const std::string& content);

// Quote a string for safe use as one word in a POSIX shell script.
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
