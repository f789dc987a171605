#pragma once
#include "dataset.hpp"
#include "provider.hpp"
#include <map>
#include <string>
#include <vector>

namespace sciclaw {

// Built-in analyst instructions, or custom_prompt when non-empty.
// Tool names are listed so the model knows what it may call.
std::string build_system_prompt(const std::vector<ToolSpec>& tools,
                                const std::string& custom_prompt = "");

// One sanitized line per dataset: name, shape, first 10 columns with dtypes.
// Empty when there are no datasets.
std::string build_dataset_context(const std::map<std::string, Dataset>& datasets);

// "Reference only" assistant message combining dataset metadata and retrieved
// knowledge. Empty when both parts are empty.
std::string build_runtime_context(const std::string& dataset_context,
                                  const std::string& knowledge_text,
                                  size_t knowledge_max_chars);

// Assistant message carrying the compressed-history summary
std::string build_compressed_context_message(const std::string& summary);

} // namespace sciclaw
