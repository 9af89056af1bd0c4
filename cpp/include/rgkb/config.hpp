#pragma once

#include "rgkb/types.hpp"

#include <filesystem>
#include <optional>

namespace rgkb {

// Defaults, then the JSON file when given, then RGKB_* / OPENAI_API_KEY environment overrides.
KnowledgeConfig LoadKnowledgeConfig(const std::optional<std::filesystem::path>& json_path = std::nullopt);

void ValidateKnowledgeConfig(const KnowledgeConfig& config);

}  // namespace rgkb
