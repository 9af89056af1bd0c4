#include "rgkb/vector_engine.hpp"

#include "rgkb/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace rgkb {

float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs) {
  if (lhs.size() != rhs.size()) {
    throw KnowledgeError("cosine similarity of vectors with " + std::to_string(lhs.size()) + " and " +
                         std::to_string(rhs.size()) + " dimensions");
  }
  float dot = 0.0F;
  float lhs_sq = 0.0F;
  float rhs_sq = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
    lhs_sq += lhs[i] * lhs[i];
    rhs_sq += rhs[i] * rhs[i];
  }
  if (lhs_sq <= 0.0F || rhs_sq <= 0.0F) {
    return 0.0F;
  }
  return dot / (std::sqrt(lhs_sq) * std::sqrt(rhs_sq));
}

FlatVectorEngine::FlatVectorEngine(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw ConfigError("vector dimensions must be positive, got " + std::to_string(dimensions_));
  }
}

void FlatVectorEngine::RequireDimensions(const std::vector<float>& vector, const char* operation) const {
  if (vector.size() != static_cast<std::size_t>(dimensions_)) {
    throw KnowledgeError(std::string(operation) + ": expected " + std::to_string(dimensions_) +
                         " dimensions, got " + std::to_string(vector.size()));
  }
}

std::vector<std::pair<std::uint64_t, float>> FlatVectorEngine::Search(const std::vector<float>& query,
                                                                       int top_k) const {
  RequireDimensions(query, "vector search");
  std::vector<std::pair<std::uint64_t, float>> scored{};
  if (top_k <= 0) {
    return scored;
  }
  scored.reserve(vectors_.size());
  for (const auto& [ordinal, stored] : vectors_) {
    scored.emplace_back(ordinal, CosineSimilarity(query, stored));
  }

  const auto keep = std::min(scored.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep), scored.end(),
                    [](const auto& lhs, const auto& rhs) {
                      return lhs.second > rhs.second || (lhs.second == rhs.second && lhs.first < rhs.first);
                    });
  scored.resize(keep);
  return scored;
}

void FlatVectorEngine::AddBatch(const std::vector<std::uint64_t>& ordinals,
                                const std::vector<std::vector<float>>& vectors) {
  if (ordinals.size() != vectors.size()) {
    throw KnowledgeError("vector batch has " + std::to_string(ordinals.size()) + " ordinals for " +
                         std::to_string(vectors.size()) + " vectors");
  }
  for (const auto& vector : vectors) {
    RequireDimensions(vector, "vector batch");
  }
  for (std::size_t i = 0; i < ordinals.size(); ++i) {
    staged_.emplace_back(ordinals[i], vectors[i]);
  }
  CommitStaged();
}

void FlatVectorEngine::StageAdd(std::uint64_t ordinal, const std::vector<float>& vector) {
  RequireDimensions(vector, "staged add");
  staged_.emplace_back(ordinal, vector);
}

void FlatVectorEngine::StageRemove(std::uint64_t ordinal) {
  staged_.emplace_back(ordinal, std::nullopt);
}

void FlatVectorEngine::CommitStaged() {
  for (auto& [ordinal, vector] : staged_) {
    if (vector.has_value()) {
      vectors_.insert_or_assign(ordinal, std::move(*vector));
    } else {
      vectors_.erase(ordinal);
    }
  }
  staged_.clear();
}

}  // namespace rgkb
