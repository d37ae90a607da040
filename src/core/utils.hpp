#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~" to the user's home directory.
std::filesystem::path expand_home(const std::string& path);

// Random 128-bit identifier formatted as a UUID (8-4-4-4-12 hex).
std::string generate_id();

// Replace characters that are unsafe in file names with '_'.
std::string sanitize_filename(const std::string& name);

// Split text into lines (no trailing empty line for a final '\n').
std::vector<std::string> split_lines(const std::string& text);

// Read an entire file. Returns false if it cannot be opened.
bool read_file(const std::filesystem::path& path, std::string& out);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
