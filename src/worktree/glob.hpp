#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>

namespace fs = std::filesystem;

// Translate a shell glob into an anchored ECMAScript regex.
//   *      any run of characters, '/' included
//   ?      one character
//   [...]  character class, [!...] negated; an unterminated '[' is literal
std::string glob_to_regex(const std::string& glob);

// One-shot match of `text` against `pattern`.
bool glob_match(const std::string& pattern, const std::string& text);

// A compiled set of exclusion globs applied to directory paths.
class ExcludeMatcher {
public:
    explicit ExcludeMatcher(const std::vector<std::string>& patterns);

    // A directory is tested both as "path" and "path/" so a pattern such as
    // "*/node_modules/*" prunes the node_modules directory itself.
    bool excludes(const fs::path& dir) const;

    bool empty() const { return patterns_.empty(); }

private:
    std::vector<std::pair<std::string, std::regex>> patterns_;
};
