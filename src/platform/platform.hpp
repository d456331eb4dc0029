#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Absolute path of the running executable (/proc/self/exe). Empty if unknown.
std::filesystem::path self_executable();

// Random lowercase hex token of the given length, seeded from std::random_device.
std::string random_hex(std::size_t length);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
