#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "template.hpp"

namespace fs = std::filesystem;

struct Prompt {
    std::string name;
    std::string description;
    std::string content;
    bool is_template = false;
    TemplateVars variables;       // name -> default value
    std::string created_at;       // ISO 8601, set on first save
    std::string modified_at;
};

// Prompt text with template variables applied. Non-templates are returned
// unchanged. Defaults from the prompt are overridden by `vars`.
Result<std::string> render_prompt(const Prompt& prompt, const TemplateVars& vars);

// Names: 2-50 characters of letters, digits, '-', '_' or space.
Result<void> validate_prompt_name(const std::string& name);

// Content must not be blank and must say something beyond markdown markup.
Result<void> validate_prompt_content(const std::string& content);

// Prompts stored as <storage_dir>/<name>.yaml
class PromptStore {
public:
    explicit PromptStore(fs::path storage_dir);

    Result<Prompt> load(const std::string& name) const;
    Result<void> save(Prompt& prompt) const;
    Result<std::vector<Prompt>> list() const;   // sorted by name
    Result<void> remove(const std::string& name) const;
    bool exists(const std::string& name) const;

    const fs::path& storage_dir() const { return storage_dir_; }

private:
    fs::path storage_dir_;

    fs::path path_for(const std::string& name) const;
};
