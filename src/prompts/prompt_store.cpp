#include "prompt_store.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

Result<std::string> render_prompt(const Prompt& prompt, const TemplateVars& vars) {
    if (!prompt.is_template) {
        return Result<std::string>::Ok(prompt.content);
    }
    TemplateVars merged = prompt.variables;
    for (const auto& [k, v] : vars) merged[k] = v;
    return expand_template(prompt.content, merged);
}

Result<void> validate_prompt_name(const std::string& name) {
    if (name.size() < 2 || name.size() > 50) {
        return Result<void>::Err("prompt name must be 2-50 characters");
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == ' ';
        if (!ok) {
            return Result<void>::Err(
                fmt::format("invalid character '{}' in prompt name (use letters, digits, '-', '_' or space)", c));
        }
    }
    return Result<void>::Ok();
}

Result<void> validate_prompt_content(const std::string& content) {
    std::string text = content;
    trim(text);
    if (text.empty()) {
        return Result<void>::Err("prompt content is empty");
    }
    std::string stripped;
    for (char c : text) {
        if (c != '#' && c != '-' && c != '*' && c != '`') stripped += c;
    }
    trim(stripped);
    if (stripped.empty()) {
        return Result<void>::Err("prompt content contains only markdown markup");
    }
    return Result<void>::Ok();
}

PromptStore::PromptStore(fs::path storage_dir) : storage_dir_(std::move(storage_dir)) {}

fs::path PromptStore::path_for(const std::string& name) const {
    return storage_dir_ / (name + ".yaml");
}

bool PromptStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(path_for(name), ec);
}

static Prompt parse_prompt(const YAML::Node& root, const std::string& fallback_name) {
    Prompt p;
    p.name = root["name"].as<std::string>(fallback_name);
    p.description = root["description"].as<std::string>("");
    p.content = root["content"].as<std::string>("");
    p.is_template = root["is_template"].as<bool>(false);
    p.created_at = root["created_at"].as<std::string>("");
    p.modified_at = root["modified_at"].as<std::string>("");

    if (root["variables"] && root["variables"].IsMap()) {
        for (const auto& kv : root["variables"]) {
            p.variables[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return p;
}

Result<Prompt> PromptStore::load(const std::string& name) const {
    fs::path path = path_for(name);
    if (!exists(name)) {
        return Result<Prompt>::Err(fmt::format("prompt '{}' not found in {}", name, storage_dir_.string()));
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return Result<Prompt>::Ok(parse_prompt(root, name));
    } catch (const std::exception& e) {
        return Result<Prompt>::Err(fmt::format("failed to parse prompt {}: {}", path.string(), e.what()));
    }
}

Result<void> PromptStore::save(Prompt& prompt) const {
    auto valid = validate_prompt_name(prompt.name);
    if (valid.is_err()) return valid;

    std::string now = now_iso();
    if (prompt.created_at.empty()) prompt.created_at = now;
    prompt.modified_at = now;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << prompt.name;
    out << YAML::Key << "description" << YAML::Value << prompt.description;
    out << YAML::Key << "content" << YAML::Value << YAML::Literal << prompt.content;
    out << YAML::Key << "is_template" << YAML::Value << prompt.is_template;
    if (!prompt.variables.empty()) {
        out << YAML::Key << "variables" << YAML::Value << YAML::BeginMap;
        for (const auto& [k, v] : prompt.variables) {
            out << YAML::Key << k << YAML::Value << v;
        }
        out << YAML::EndMap;
    }
    out << YAML::Key << "created_at" << YAML::Value << prompt.created_at;
    out << YAML::Key << "modified_at" << YAML::Value << prompt.modified_at;
    out << YAML::EndMap;

    try {
        fs::create_directories(storage_dir_);
        std::ofstream fout(path_for(prompt.name));
        if (!fout) {
            return Result<void>::Err("cannot write " + path_for(prompt.name).string());
        }
        fout << out.c_str() << "\n";
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("failed to save prompt: ") + e.what());
    }
}

Result<std::vector<Prompt>> PromptStore::list() const {
    std::vector<Prompt> prompts;
    std::error_code ec;
    if (!fs::is_directory(storage_dir_, ec)) {
        return Result<std::vector<Prompt>>::Ok(prompts);
    }

    for (const auto& entry : fs::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".yaml") continue;
        auto p = load(entry.path().stem().string());
        if (p.is_err()) {
            return Result<std::vector<Prompt>>::Err(p.error);
        }
        prompts.push_back(p.value);
    }
    if (ec) {
        return Result<std::vector<Prompt>>::Err("cannot list " + storage_dir_.string() + ": " + ec.message());
    }

    std::sort(prompts.begin(), prompts.end(),
              [](const Prompt& a, const Prompt& b) { return a.name < b.name; });
    return Result<std::vector<Prompt>>::Ok(prompts);
}

Result<void> PromptStore::remove(const std::string& name) const {
    std::error_code ec;
    if (!fs::remove(path_for(name), ec)) {
        if (ec) return Result<void>::Err(fmt::format("cannot delete prompt '{}': {}", name, ec.message()));
        return Result<void>::Err(fmt::format("prompt '{}' not found", name));
    }
    return Result<void>::Ok();
}
