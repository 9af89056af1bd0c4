#pragma once

#include "rgkb/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rgkb {

// Indices into `candidates` picked by maximal marginal relevance, in selection order.
// Candidates are expected in descending similarity order; ties keep the earlier candidate.
std::vector<std::size_t> SelectMaximalMarginalRelevance(const std::vector<float>& query,
                                                        const std::vector<std::vector<float>>& candidates,
                                                        int k,
                                                        float lambda_mult);

// String value of a metadata field by key; nullopt for unknown keys and for "keywords".
std::optional<std::string> MetadataField(const ChunkMetadata& metadata, const std::string& key);

// Every key must match: Equals compares for equality, AnyOf for membership. On "keywords"
// a condition matches when any of the chunk's keywords satisfies it. Unknown keys never match.
bool MatchesFilter(const ChunkMetadata& metadata, const MetadataFilter& filter);

// "risk_methodology" -> "Risk Methodology".
std::string TitleCase(const std::string& snake_case);

// Empty string for no hits.
std::string FormatContextForPrompt(const std::vector<SearchHit>& hits);

struct CitedContext {
  std::string text;
  std::vector<Citation> citations;
};

CitedContext FormatContextWithCitations(const std::vector<SearchHit>& hits);

}  // namespace rgkb
