#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

using TemplateVars = std::map<std::string, std::string>;

// Replace {{.Name}} / {{ .Name }} placeholders. A placeholder without a
// value in `vars` is an error naming the variable.
Result<std::string> expand_template(const std::string& text, const TemplateVars& vars);

// Names referenced by the placeholders in `text`, in order of first use.
std::vector<std::string> template_placeholders(const std::string& text);

// Parse "key=value" pairs. Keys and values are trimmed; the first '=' splits.
Result<TemplateVars> parse_template_vars(const std::vector<std::string>& pairs);
