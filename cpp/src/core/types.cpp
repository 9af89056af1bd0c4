#include "rgkb/types.hpp"

#include <array>
#include <string>
#include <utility>

namespace rgkb {
namespace {

constexpr std::array<std::pair<DocumentType, const char*>, 6> kDocumentTypeNames = {{
    {DocumentType::kRiskMethodology, "risk_methodology"},
    {DocumentType::kSecurityPrinciples, "security_principles"},
    {DocumentType::kItRiskManagement, "it_risk_management"},
    {DocumentType::kRegulatoryFramework, "regulatory_framework"},
    {DocumentType::kCompliance, "compliance"},
    {DocumentType::kGeneral, "general"},
}};

constexpr std::array<std::pair<ChunkType, const char*>, 6> kChunkTypeNames = {{
    {ChunkType::kVulnerability, "vulnerability"},
    {ChunkType::kControl, "control"},
    {ChunkType::kImpact, "impact"},
    {ChunkType::kMethodology, "methodology"},
    {ChunkType::kFrameworkReference, "framework_reference"},
    {ChunkType::kConceptual, "conceptual"},
}};

constexpr std::array<std::pair<SearchType, const char*>, 3> kSearchTypeNames = {{
    {SearchType::kSimilarity, "similarity"},
    {SearchType::kSimilarityScoreThreshold, "similarity_score_threshold"},
    {SearchType::kMmr, "mmr"},
}};

template <typename Enum, std::size_t N>
const char* LookupName(const std::array<std::pair<Enum, const char*>, N>& table, Enum value) {
  for (const auto& [candidate, name] : table) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> LookupValue(const std::array<std::pair<Enum, const char*>, N>& table,
                                const std::string& name) {
  for (const auto& [candidate, candidate_name] : table) {
    if (name == candidate_name) {
      return candidate;
    }
  }
  return std::nullopt;
}

}  // namespace

const char* DocumentTypeName(DocumentType type) {
  return LookupName(kDocumentTypeNames, type);
}

std::optional<DocumentType> ParseDocumentType(const std::string& name) {
  return LookupValue(kDocumentTypeNames, name);
}

const char* ChunkTypeName(ChunkType type) {
  return LookupName(kChunkTypeNames, type);
}

std::optional<ChunkType> ParseChunkType(const std::string& name) {
  return LookupValue(kChunkTypeNames, name);
}

const char* SearchTypeName(SearchType type) {
  return LookupName(kSearchTypeNames, type);
}

std::optional<SearchType> ParseSearchType(const std::string& name) {
  return LookupValue(kSearchTypeNames, name);
}

}  // namespace rgkb
