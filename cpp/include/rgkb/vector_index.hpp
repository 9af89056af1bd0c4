#pragma once

#include "rgkb/embeddings.hpp"
#include "rgkb/snapshot_store.hpp"
#include "rgkb/types.hpp"
#include "rgkb/vector_engine.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rgkb {

struct VectorIndexOptions {
  std::filesystem::path persist_directory = "vectorstore";
  std::string collection_name = "security_knowledge";
  int build_concurrency = 4;
  int max_retries = 3;
  std::chrono::milliseconds retry_backoff{500};
};

struct ScoredRecord {
  EmbeddingRecord record;
  float score = 0.0F;
};

// Embedding records of one collection, held in memory for search and persisted through a
// SnapshotStore. Mutations (Build, Add, Update, Remove, Cleanup) are serialized per collection
// across all VectorIndex instances in the process; searches run concurrently with each other
// and with an in-progress mutation, which publishes its result only once persisted.
class VectorIndex {
 public:
  explicit VectorIndex(VectorIndexOptions options);
  explicit VectorIndex(const KnowledgeConfig& config);

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  void InitializeEmbedder(std::shared_ptr<BatchEmbeddingProvider> provider);
  // Creates an OpenAIEmbedder. Throws ConfigError when no credential is configured.
  void InitializeEmbedder(const EmbeddingConfig& config);
  [[nodiscard]] bool embedder_initialized() const;
  [[nodiscard]] std::shared_ptr<BatchEmbeddingProvider> embedder() const;

  // Embeds every chunk and replaces the persisted snapshot. Throws EmptyInputError on no chunks.
  SnapshotInfo Build(const std::vector<Chunk>& chunks);

  // Loads the persisted snapshot. Returns nullopt when none exists, it holds zero records,
  // it cannot be decoded, or it was built for a different embedding model.
  std::optional<SnapshotInfo> Load();

  // True when no snapshot exists or any file under source_dir was modified after the
  // snapshot's build time. Compares modification timestamps only.
  [[nodiscard]] bool ShouldRebuild(const std::filesystem::path& source_dir) const;

  // In-place mutations of a loaded index; each re-persists before returning.
  SnapshotInfo Add(const std::vector<Chunk>& chunks);
  SnapshotInfo Update(const std::string& id, const Chunk& chunk);
  SnapshotInfo Remove(const std::vector<std::string>& ids);

  // Throws RetrievalUnavailableError when the provider fails, NotReadyError without an embedder.
  std::vector<float> EmbedQuery(const std::string& query) const;

  // Nearest records by cosine similarity, best first. Throws NotReadyError when not loaded.
  std::vector<ScoredRecord> SimilaritySearch(const std::vector<float>& query, int top_k) const;

  [[nodiscard]] std::optional<EmbeddingRecord> Get(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> RecordIds() const;
  [[nodiscard]] bool loaded() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::optional<SnapshotInfo> snapshot_info() const;
  [[nodiscard]] bool SnapshotExists() const;
  [[nodiscard]] IndexStats Stats() const;
  [[nodiscard]] const std::filesystem::path& snapshot_path() const { return store_.path(); }
  [[nodiscard]] const std::string& collection_name() const { return options_.collection_name; }

  // Drops in-memory state; the snapshot stays on disk.
  void Unload();
  // Drops in-memory state and deletes the snapshot.
  void Cleanup();

 private:
  struct State {
    std::unique_ptr<FlatVectorEngine> engine;
    std::unordered_map<std::uint64_t, EmbeddingRecord> records;
    std::unordered_map<std::string, std::uint64_t> ordinals;
    std::uint64_t next_ordinal = 0;
    std::optional<SnapshotInfo> info;
  };

  std::vector<std::vector<float>> EmbedTexts(BatchEmbeddingProvider& provider,
                                             const std::vector<std::string>& texts) const;
  std::vector<std::vector<float>> EmbedBatchWithRetry(BatchEmbeddingProvider& provider,
                                                      const std::vector<std::string>& texts) const;
  std::vector<EmbeddingRecord> EmbedChunks(const std::vector<Chunk>& chunks) const;
  std::shared_ptr<BatchEmbeddingProvider> RequireEmbedder() const;
  SnapshotHeader MakeHeader(const BatchEmbeddingProvider& provider) const;
  static std::unique_ptr<State> MakeState(int dimensions,
                                          std::vector<EmbeddingRecord> records,
                                          std::optional<SnapshotInfo> info);

  VectorIndexOptions options_;
  SnapshotStore store_;
  mutable std::shared_mutex mutex_{};
  std::shared_ptr<BatchEmbeddingProvider> embedder_{};
  std::unique_ptr<State> state_{};
};

}  // namespace rgkb
