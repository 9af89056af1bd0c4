#include "rgkb/search.hpp"

#include "rgkb/vector_engine.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace rgkb {
namespace {

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::string StripTxtSuffix(const std::string& filename) {
  constexpr std::string_view kSuffix = ".txt";
  std::string out = filename;
  for (auto pos = out.find(kSuffix); pos != std::string::npos; pos = out.find(kSuffix, pos)) {
    out.erase(pos, kSuffix.size());
  }
  return out;
}

bool ConditionMatches(const FilterCondition& condition, const std::string& value) {
  if (const auto* equals = std::get_if<Equals>(&condition); equals != nullptr) {
    return equals->value == value;
  }
  const auto& any_of = std::get<AnyOf>(condition);
  return std::find(any_of.values.begin(), any_of.values.end(), value) != any_of.values.end();
}

}  // namespace

std::vector<std::size_t> SelectMaximalMarginalRelevance(const std::vector<float>& query,
                                                        const std::vector<std::vector<float>>& candidates,
                                                        int k,
                                                        float lambda_mult) {
  if (k <= 0 || candidates.empty()) {
    return {};
  }
  const float lambda = std::max(0.0F, std::min(1.0F, lambda_mult));
  const auto target = std::min(candidates.size(), static_cast<std::size_t>(k));

  std::vector<float> relevance{};
  relevance.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    relevance.push_back(CosineSimilarity(query, candidate));
  }

  std::vector<std::size_t> selected{};
  selected.reserve(target);
  std::vector<bool> taken(candidates.size(), false);
  // Largest similarity of each candidate to anything already selected.
  std::vector<float> redundancy(candidates.size(), -std::numeric_limits<float>::infinity());

  std::size_t first = 0;
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    if (relevance[i] > relevance[first]) {
      first = i;
    }
  }
  selected.push_back(first);
  taken[first] = true;

  while (selected.size() < target) {
    const auto& last = candidates[selected.back()];
    std::size_t best = candidates.size();
    float best_score = -std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (taken[i]) {
        continue;
      }
      redundancy[i] = std::max(redundancy[i], CosineSimilarity(candidates[i], last));
      const float score = lambda * relevance[i] - (1.0F - lambda) * redundancy[i];
      if (best == candidates.size() || score > best_score) {
        best = i;
        best_score = score;
      }
    }
    selected.push_back(best);
    taken[best] = true;
  }
  return selected;
}

std::optional<std::string> MetadataField(const ChunkMetadata& metadata, const std::string& key) {
  if (key == "filename") {
    return metadata.filename;
  }
  if (key == "source_path" || key == "source") {
    return metadata.source_path;
  }
  if (key == "document_type") {
    return std::string(DocumentTypeName(metadata.document_type));
  }
  if (key == "chunk_type") {
    return std::string(ChunkTypeName(metadata.chunk_type));
  }
  if (key == "language") {
    return metadata.language;
  }
  if (key == "domain") {
    return metadata.domain;
  }
  if (key == "chunk_index") {
    return std::to_string(metadata.chunk_index);
  }
  if (key == "total_chunks") {
    return std::to_string(metadata.total_chunks);
  }
  if (key == "start_offset") {
    return std::to_string(metadata.start_offset);
  }
  if (key == "chunk_id") {
    return metadata.filename + "_" + std::to_string(metadata.chunk_index);
  }
  return std::nullopt;
}

bool MatchesFilter(const ChunkMetadata& metadata, const MetadataFilter& filter) {
  for (const auto& [key, condition] : filter) {
    if (key == "keywords") {
      const bool any = std::any_of(metadata.keywords.begin(), metadata.keywords.end(),
                                   [&](const std::string& keyword) { return ConditionMatches(condition, keyword); });
      if (!any) {
        return false;
      }
      continue;
    }
    const auto value = MetadataField(metadata, key);
    if (!value.has_value() || !ConditionMatches(condition, *value)) {
      return false;
    }
  }
  return true;
}

std::string TitleCase(const std::string& snake_case) {
  std::string out{};
  out.reserve(snake_case.size());
  bool start_of_word = true;
  for (const char raw : snake_case) {
    const char ch = raw == '_' ? ' ' : raw;
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalpha(uch) != 0) {
      out.push_back(static_cast<char>(start_of_word ? std::toupper(uch) : std::tolower(uch)));
      start_of_word = false;
    } else {
      out.push_back(ch);
      start_of_word = true;
    }
  }
  return out;
}

std::string FormatContextForPrompt(const std::vector<SearchHit>& hits) {
  if (hits.empty()) {
    return {};
  }
  std::string out = "=== BEGIN KNOWLEDGE ===\n";
  for (std::size_t i = 0; i < hits.size(); ++i) {
    const auto& hit = hits[i];
    out += "\n--- Source " + std::to_string(i + 1) + ": " + TitleCase(DocumentTypeName(hit.metadata.document_type)) +
           " (" + StripTxtSuffix(hit.metadata.filename) + ") ---\n";
    if (!hit.metadata.keywords.empty()) {
      out += "Keywords: ";
      const auto count = std::min<std::size_t>(hit.metadata.keywords.size(), 5);
      for (std::size_t k = 0; k < count; ++k) {
        if (k > 0) {
          out += ", ";
        }
        out += hit.metadata.keywords[k];
      }
      out += "\n";
    }
    out += Trim(hit.content);
    out += "\n";
  }
  out += "\n=== END KNOWLEDGE ===\n";
  return out;
}

CitedContext FormatContextWithCitations(const std::vector<SearchHit>& hits) {
  CitedContext context{};
  if (hits.empty()) {
    return context;
  }
  std::string& out = context.text;
  out = "=== BEGIN KNOWLEDGE ===\n";
  for (std::size_t i = 0; i < hits.size(); ++i) {
    const auto& hit = hits[i];
    Citation citation{};
    citation.id = "ref_" + std::to_string(i + 1);
    citation.source = hit.metadata.filename.empty() ? std::string("unknown") : hit.metadata.filename;
    citation.document_type = DocumentTypeName(hit.metadata.document_type);
    citation.chunk_id = hit.id;
    citation.relevance_rank = hit.relevance_rank > 0 ? hit.relevance_rank : static_cast<int>(i + 1);

    out += "\n--- [" + citation.id + "] " + TitleCase(citation.document_type) + " (" + StripTxtSuffix(citation.source) +
           ") ---\n";
    out += Trim(hit.content);
    out += "\n";
    context.citations.push_back(std::move(citation));
  }
  out += "\n=== END KNOWLEDGE ===\n\nReferences:\n";
  for (const auto& citation : context.citations) {
    out += "[" + citation.id + "] " + citation.source + " - " + citation.document_type + "\n";
  }
  return context;
}

}  // namespace rgkb
