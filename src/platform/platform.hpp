#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Resolve a program the way execvp would: names containing '/' are checked
// directly, bare names are searched in PATH. Only executable regular files match.
std::optional<std::filesystem::path> find_executable(const std::string& program);

// Bytes available to an unprivileged user on the filesystem holding `path`.
std::optional<std::uintmax_t> available_disk_bytes(const std::filesystem::path& path);

} // namespace platform
