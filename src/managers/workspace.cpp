#include "workspace.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>

// 128 random bits; create_directory refusing an existing name covers the rest
static constexpr std::size_t WORKSPACE_ID_LEN = 32;
static constexpr int WORKSPACE_CREATE_TRIES = 8;

Workspace::Workspace(fs::path root, std::string id)
    : root_(std::move(root)), id_(std::move(id)) {}

// A moved-from workspace owns nothing and never removes anything
Workspace::Workspace(Workspace&& other) noexcept
    : root_(std::move(other.root_)), id_(std::move(other.id_)), removed_(other.removed_),
      remover_(std::move(other.remover_)) {
    other.root_.clear();
    other.removed_ = true;
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        root_ = std::move(other.root_);
        id_ = std::move(other.id_);
        removed_ = other.removed_;
        remover_ = std::move(other.remover_);
        other.root_.clear();
        other.removed_ = true;
    }
    return *this;
}

Workspace Workspace::create(const fs::path& base_dir) {
    fs::create_directories(base_dir);

    for (int i = 0; i < WORKSPACE_CREATE_TRIES; i++) {
        std::string id = platform::random_hex(WORKSPACE_ID_LEN);
        fs::path dir = base_dir / id;
        // create_directory returns false if the path already existed
        if (fs::create_directory(dir)) {
            sgerun_log(fmt::format("workspace: created {}", dir.string()));
            return Workspace(dir, id);
        }
    }
    throw fs::filesystem_error("could not allocate a unique workspace", base_dir,
                               std::make_error_code(std::errc::file_exists));
}

fs::path Workspace::params_file() const { return root_ / PARAMS_FILE; }
fs::path Workspace::exec_script() const { return root_ / EXEC_SCRIPT_FILE; }
fs::path Workspace::submit_script() const { return root_ / SUBMIT_SCRIPT_FILE; }
fs::path Workspace::results_file() const { return root_ / RESULTS_FILE; }
fs::path Workspace::stdout_file() const { return root_ / STDOUT_FILE; }
fs::path Workspace::stderr_file() const { return root_ / STDERR_FILE; }

void Workspace::cleanup(bool keep, int retry_delay_ms) {
    if (keep || removed_ || root_.empty()) return;

    auto remove = [this](std::error_code& ec) {
        if (remover_) {
            remover_(root_, ec);
        } else {
            fs::remove_all(root_, ec);
        }
    };

    std::error_code ec;
    remove(ec);
    if (ec) {
        sgerun_log(fmt::format("workspace: remove {} failed ({}), retrying",
                               root_.string(), ec.message()));
        platform::sleep_ms(retry_delay_ms);
        ec.clear();
        remove(ec);
    }

    if (ec) {
        sgerun_warn(fmt::format("Could not remove tmp dir: {} ({})", root_.string(), ec.message()));
    } else {
        sgerun_log(fmt::format("workspace: removed {}", root_.string()));
    }
    // Never attempted again, even after a failed removal
    removed_ = true;
}
