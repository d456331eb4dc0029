#include "result_codec.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

void write_result_file(const std::filesystem::path& path, const std::string& task_name,
                       const YAML::Node& result) {
    YAML::Node root;
    root["task"] = task_name;
    root["result"] = result;

    // Write next to the target and rename, so a reader never sees half a file
    std::filesystem::path tmp = path;
    tmp += ".partial";
    if (!write_file(tmp, YAML::Dump(root) + "\n")) {
        throw SgerunError(fmt::format("Failed to write {}", tmp.string()));
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw SgerunError(fmt::format("Failed to move result into {}: {}", path.string(), ec.message()));
    }
}

std::string read_result_file(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (!text) {
        throw ResultCorrupt(fmt::format("Result file missing: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::Load(*text);
    } catch (const YAML::Exception& e) {
        throw ResultCorrupt(fmt::format("Result file unreadable: {} ({})", path.string(), e.what()));
    }
    if (!root.IsMap() || !root["result"]) {
        throw ResultCorrupt(fmt::format("Result file has no 'result' entry: {}", path.string()));
    }
    return YAML::Dump(root["result"]);
}

YAML::Node decode_payload(const std::string& payload) {
    return YAML::Load(payload);
}
