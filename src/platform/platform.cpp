#include "platform.hpp"
#include <cstdlib>
#include <mutex>
#include <random>
#include <system_error>
#include <thread>
#include <chrono>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

fs::path self_executable() {
    std::error_code ec;
    fs::path p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return p;
}

std::string random_hex(std::size_t length) {
    static const char HEX[] = "0123456789abcdef";
    // One engine per process; random_device alone may be slow or deterministic
    static std::mutex rng_mutex;
    static std::mt19937_64 rng([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(),
                          static_cast<unsigned>(getpid())};
        return std::mt19937_64(seq);
    }());

    std::string out;
    out.reserve(length);
    std::lock_guard<std::mutex> lock(rng_mutex);
    std::uniform_int_distribution<int> dist(0, 15);
    for (std::size_t i = 0; i < length; i++) {
        out += HEX[dist(rng)];
    }
    return out;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
