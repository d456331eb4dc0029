#pragma once

#include <string>
#include <filesystem>
#include <yaml-cpp/yaml.h>

// Result artifact layout:
//   task: <name>
//   result: <any YAML value>

// Write the artifact. Throws SgerunError on I/O failure.
void write_result_file(const std::filesystem::path& path, const std::string& task_name,
                       const YAML::Node& result);

// Read the artifact and return the `result` value re-emitted as YAML text.
// Throws ResultCorrupt if the file is missing, unparsable, or has no result.
std::string read_result_file(const std::filesystem::path& path);

// Parse a payload returned by read_result_file.
YAML::Node decode_payload(const std::string& payload);
