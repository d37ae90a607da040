#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

static bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_executable(const std::string& program) {
    if (program.empty()) return std::nullopt;

    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) return fs::path(program);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        // Empty PATH entries mean the current directory
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

std::optional<std::uintmax_t> available_disk_bytes(const fs::path& path) {
    std::error_code ec;
    auto info = fs::space(path, ec);
    if (ec) return std::nullopt;
    return info.available;
}

} // namespace platform
