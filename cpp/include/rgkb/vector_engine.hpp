#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rgkb {

// Exact cosine search over every stored vector, keyed by record ordinal.
// Mutations are staged and become visible together on CommitStaged().
class FlatVectorEngine {
 public:
  explicit FlatVectorEngine(int dimensions);

  int dimensions() const { return dimensions_; }
  std::size_t size() const { return vectors_.size(); }

  // Best top_k (ordinal, cosine) pairs; equal scores keep the lower ordinal first.
  std::vector<std::pair<std::uint64_t, float>> Search(const std::vector<float>& query, int top_k) const;

  void AddBatch(const std::vector<std::uint64_t>& ordinals, const std::vector<std::vector<float>>& vectors);
  void StageAdd(std::uint64_t ordinal, const std::vector<float>& vector);
  void StageRemove(std::uint64_t ordinal);
  void CommitStaged();

 private:
  void RequireDimensions(const std::vector<float>& vector, const char* operation) const;

  int dimensions_;
  std::unordered_map<std::uint64_t, std::vector<float>> vectors_;
  // nullopt marks a removal.
  std::vector<std::pair<std::uint64_t, std::optional<std::vector<float>>>> staged_;
};

// Cosine similarity of two equally sized vectors; 0 when either has zero norm.
// Throws KnowledgeError on a size mismatch.
float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs);

}  // namespace rgkb
