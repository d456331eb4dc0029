#pragma once

#include <functional>
#include <string>
#include <system_error>
#include <filesystem>

namespace fs = std::filesystem;

// Worker-private scratch directory holding every artifact of one job:
// parameter file, executor + submission scripts, stdout/stderr, result.
// The directory is created eagerly and removed at most once.
class Workspace {
public:
    // Removes a directory tree, reporting failure through the error_code.
    using RemoveFn = std::function<void(const fs::path&, std::error_code&)>;

    // Create a fresh uniquely named subdirectory of base_dir.
    // Throws std::filesystem::filesystem_error if it cannot be created.
    static Workspace create(const fs::path& base_dir);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::string& id() const { return id_; }
    const fs::path& root() const { return root_; }
    bool removed() const { return removed_; }

    fs::path params_file() const;
    fs::path exec_script() const;
    fs::path submit_script() const;
    fs::path results_file() const;
    fs::path stdout_file() const;
    fs::path stderr_file() const;

    // Remove the directory tree unless keep is true. Idempotent. On failure
    // retries once after retry_delay_ms, then logs a warning and gives up;
    // never throws.
    void cleanup(bool keep, int retry_delay_ms);

    // Override how cleanup() removes the tree (default: remove_all).
    void set_remover(RemoveFn remover) { remover_ = std::move(remover); }

private:
    Workspace(fs::path root, std::string id);

    fs::path root_;
    std::string id_;
    bool removed_ = false;
    RemoveFn remover_;
};
