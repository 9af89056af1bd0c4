#pragma once

#include "rgkb/document_ingestor.hpp"
#include "rgkb/embeddings.hpp"
#include "rgkb/retriever.hpp"
#include "rgkb/search.hpp"
#include "rgkb/types.hpp"
#include "rgkb/vector_index.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rgkb {

enum class OrchestratorState {
  kUninitialized,
  kInitializing,
  kReady,
  kDegraded,
};

const char* OrchestratorStateName(OrchestratorState state);

enum class HealthStatus {
  kHealthy,
  kDegraded,
  kUnhealthy,
};

const char* HealthStatusName(HealthStatus status);

struct HealthComponents {
  bool initialized = false;
  bool docs_accessible = false;
  bool embedder = false;
  bool vector_index = false;
  bool snapshot_persisted = false;
  bool retriever = false;

  [[nodiscard]] bool all() const {
    return initialized && docs_accessible && embedder && vector_index && snapshot_persisted && retriever;
  }
};

struct HealthReport {
  HealthStatus status = HealthStatus::kHealthy;
  std::chrono::system_clock::time_point timestamp{};
  HealthComponents components{};
  bool test_search_successful = false;
  std::optional<std::string> error;
};

struct LastSearch {
  std::string query;
  std::size_t results_count = 0;
  std::chrono::system_clock::time_point timestamp{};
};

struct KnowledgeStats {
  OrchestratorState state = OrchestratorState::kUninitialized;
  std::size_t documents_loaded = 0;
  std::size_t chunks_created = 0;
  std::optional<double> initialization_seconds;
  std::uint64_t retrieval_calls = 0;
  std::optional<LastSearch> last_search;
  std::string docs_path;
  std::string persist_directory;
  IndexStats index{};
  std::optional<RetrieverStats> retriever;
};

// Owns the ingestor, vector index and retriever of one knowledge base and drives them through
// Uninitialized -> Initializing -> Ready (<-> Degraded). Queries never wait on initialization:
// outside Ready and Degraded they throw NotReadyError.
class KnowledgeOrchestrator {
 public:
  // Without an injected embedder, initialization creates an OpenAIEmbedder from config.embedding.
  explicit KnowledgeOrchestrator(KnowledgeConfig config, std::shared_ptr<BatchEmbeddingProvider> embedder = nullptr);
  // Blocks until every search started by SearchRelevantContextAsync has finished.
  ~KnowledgeOrchestrator();

  KnowledgeOrchestrator(const KnowledgeOrchestrator&) = delete;
  KnowledgeOrchestrator& operator=(const KnowledgeOrchestrator&) = delete;

  // Initializes the embedder, loads the snapshot or rebuilds it from the documents, then binds
  // the retriever. On failure the orchestrator is left Uninitialized and the error rethrown.
  void Initialize();
  void Reinitialize(bool force_reindex = false);
  // Back to Uninitialized; the snapshot and the search statistics are kept.
  void Shutdown();
  // Back to Uninitialized; deletes the snapshot and resets statistics.
  void Cleanup();

  [[nodiscard]] OrchestratorState state() const;
  [[nodiscard]] std::optional<std::string> last_error() const;

  RetrievalOutcome SearchRelevantContext(const std::string& query,
                                         int max_chunks = 5,
                                         const std::vector<std::string>& document_types = {},
                                         const CancellationToken& cancel = CancellationToken());

  // Runs SearchRelevantContext on its own thread. The returned future may outlive the
  // orchestrator; destruction waits for the search to complete.
  std::future<RetrievalOutcome> SearchRelevantContextAsync(std::string query,
                                                           int max_chunks = 5,
                                                           std::vector<std::string> document_types = {},
                                                           CancellationToken cancel = CancellationToken());

  RetrievalOutcome SearchByMethodology(const std::string& query, const std::string& methodology, int max_results = 5);

  [[nodiscard]] std::string FormatForPrompt(const std::vector<SearchHit>& hits) const;
  [[nodiscard]] CitedContext FormatWithCitations(const std::vector<SearchHit>& hits) const;

  [[nodiscard]] std::vector<std::string> DocumentTypesAvailable() const;
  RetrievalTestReport TestRetrieval(const std::vector<std::string>& queries = Retriever::DefaultTestQueries());

  HealthReport HealthCheck();
  [[nodiscard]] KnowledgeStats GetStats() const;

  [[nodiscard]] const KnowledgeConfig& config() const { return config_; }

  static std::vector<std::string> MethodologyKeywords(const std::string& methodology);

 private:
  std::shared_ptr<Retriever> RequireRetriever() const;
  void SetupIndex();
  void ResetLocked();
  void FinishAsyncSearch();

  KnowledgeConfig config_;
  DocumentIngestor ingestor_;
  std::shared_ptr<BatchEmbeddingProvider> injected_embedder_;
  std::shared_ptr<VectorIndex> index_;

  std::mutex lifecycle_mutex_{};
  mutable std::mutex mutex_{};
  OrchestratorState state_ = OrchestratorState::kUninitialized;
  std::shared_ptr<Retriever> retriever_{};
  std::optional<std::string> last_error_{};
  std::size_t documents_loaded_ = 0;
  std::size_t chunks_created_ = 0;
  std::optional<double> initialization_seconds_{};
  std::uint64_t retrieval_calls_ = 0;
  std::optional<LastSearch> last_search_{};

  std::mutex async_mutex_{};
  std::condition_variable async_idle_{};
  std::size_t async_in_flight_ = 0;
};

}  // namespace rgkb
