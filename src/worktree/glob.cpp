#include "glob.hpp"
#include <core/log.hpp>
#include <cstring>

std::string glob_to_regex(const std::string& glob) {
    std::string regex = "^";

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (c == '*') {
            // Collapse runs of '*'; "**" means the same as "*" here
            while (i + 1 < glob.length() && glob[i + 1] == '*') i++;
            regex += ".*";
        } else if (c == '?') {
            regex += ".";
        } else if (c == '[') {
            // Find the closing bracket; a ']' right after '[' or '[!' is literal
            size_t j = i + 1;
            if (j < glob.length() && glob[j] == '!') j++;
            if (j < glob.length() && glob[j] == ']') j++;
            while (j < glob.length() && glob[j] != ']') j++;

            if (j >= glob.length()) {
                regex += "\\[";
                continue;
            }

            regex += '[';
            size_t k = i + 1;
            if (glob[k] == '!') {
                regex += '^';
                k++;
            }
            for (; k < j; ++k) {
                char cc = glob[k];
                if (cc == '\\' || cc == '^' || cc == '[' || cc == ']') regex += '\\';
                regex += cc;
            }
            regex += ']';
            i = j;
        } else if (c == '\\' && i + 1 < glob.length()) {
            // Escaped literal
            char next = glob[++i];
            if (std::strchr(".^$|()[]{}*+?\\/", next)) regex += '\\';
            regex += next;
        } else if (std::strchr(".^$|()[]{}+\\", c)) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    regex += "$";
    return regex;
}

bool glob_match(const std::string& pattern, const std::string& text) {
    try {
        std::regex re(glob_to_regex(pattern));
        return std::regex_match(text, re);
    } catch (const std::regex_error& e) {
        par_log("GLOB: bad pattern '" + pattern + "': " + e.what());
        return false;
    }
}

ExcludeMatcher::ExcludeMatcher(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (p.empty()) continue;
        try {
            patterns_.emplace_back(p, std::regex(glob_to_regex(p)));
        } catch (const std::regex_error& e) {
            par_log("GLOB: skipping exclude pattern '" + p + "': " + e.what());
        }
    }
}

bool ExcludeMatcher::excludes(const fs::path& dir) const {
    std::string path = dir.generic_string();
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    std::string with_slash = path + "/";

    for (const auto& [pattern, re] : patterns_) {
        if (std::regex_match(path, re) || std::regex_match(with_slash, re)) {
            return true;
        }
    }
    return false;
}
