#pragma once

#include "rgkb/knowledge_orchestrator.hpp"
#include "rgkb/retriever.hpp"
#include "rgkb/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace rgkb {

// UTC, ISO 8601 with microseconds: "2024-05-01T12:00:00.000000Z".
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json ToJson(const SearchHit& hit);
nlohmann::json ToJson(const IndexStats& stats);
nlohmann::json ToJson(const RetrieverStats& stats);
nlohmann::json ToJson(const RetrievalTestReport& report);
nlohmann::json ToJson(const HealthReport& report);
nlohmann::json ToJson(const KnowledgeStats& stats);

}  // namespace rgkb
