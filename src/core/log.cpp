#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "sgerun_debug.log").string();
    return path;
}

std::atomic<bool> g_verbose{false};

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

void write_line(const std::string& line, bool echo) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_storage(), std::ios::app);
    if (out) {
        out << line << "\n";
    }
    if (echo) {
        std::cerr << line << "\n";
    }
}

std::string shorten(const std::string& s) {
    if (s.size() <= LOG_OUTPUT_TRUNCATE) return s;
    return s.substr(0, LOG_OUTPUT_TRUNCATE) + "...";
}

} // namespace

std::string sgerun_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_storage();
}

void set_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose);
}

bool log_verbose() {
    return g_verbose.load();
}

void sgerun_log(const std::string& msg) {
    write_line(fmt::format("[{}] {}", timestamp(), msg), g_verbose.load());
}

void sgerun_warn(const std::string& msg) {
    write_line(fmt::format("[{}] WARNING: {}", timestamp(), msg), true);
}

void sgerun_log_command(const std::string& label, const std::string& program,
                        const std::vector<std::string>& args, const CommandResult& r) {
    std::string cmd = program;
    for (const auto& a : args) cmd += " " + a;
    sgerun_log(fmt::format("{} CMD: {}", label, cmd));
    sgerun_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), shorten(r.stdout_data)));
    if (!r.stderr_data.empty())
        sgerun_log(fmt::format("{} stderr={}", label, shorten(r.stderr_data)));
}
