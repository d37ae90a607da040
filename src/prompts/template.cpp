#include "template.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>
#include <algorithm>

static const std::regex& placeholder_regex() {
    static const std::regex re(R"(\{\{\s*\.([A-Za-z_][A-Za-z0-9_]*)\s*\}\})");
    return re;
}

Result<std::string> expand_template(const std::string& text, const TemplateVars& vars) {
    std::string out;
    out.reserve(text.size());

    auto begin = std::sregex_iterator(text.begin(), text.end(), placeholder_regex());
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const auto& m = *it;
        std::string name = m[1].str();
        auto var = vars.find(name);
        if (var == vars.end()) {
            return Result<std::string>::Err(fmt::format("undefined template variable: {}", name));
        }
        out.append(text, last, static_cast<size_t>(m.position(0)) - last);
        out += var->second;
        last = static_cast<size_t>(m.position(0) + m.length(0));
    }
    out.append(text, last, std::string::npos);
    return Result<std::string>::Ok(out);
}

std::vector<std::string> template_placeholders(const std::string& text) {
    std::vector<std::string> names;
    auto begin = std::sregex_iterator(text.begin(), text.end(), placeholder_regex());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string name = (*it)[1].str();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

Result<TemplateVars> parse_template_vars(const std::vector<std::string>& pairs) {
    TemplateVars vars;
    for (const auto& pair : pairs) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            return Result<TemplateVars>::Err(
                fmt::format("invalid template variable '{}' (expected key=value)", pair));
        }
        std::string key = pair.substr(0, eq);
        std::string value = pair.substr(eq + 1);
        trim(key);
        trim(value);
        if (key.empty()) {
            return Result<TemplateVars>::Err(fmt::format("empty variable name in '{}'", pair));
        }
        vars[key] = value;
    }
    return Result<TemplateVars>::Ok(vars);
}
