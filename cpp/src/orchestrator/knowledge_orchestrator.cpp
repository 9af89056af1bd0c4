#include "rgkb/knowledge_orchestrator.hpp"

#include "rgkb/config.hpp"
#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"
#include "rgkb/utf8_text.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <string_view>
#include <utility>

namespace rgkb {
namespace {

constexpr std::size_t kLastSearchQueryBytes = 50;

struct MethodologyEntry {
  std::string_view name;
  std::vector<std::string> keywords;
};

const std::vector<MethodologyEntry>& MethodologyTable() {
  static const std::vector<MethodologyEntry> table = {
      {"MAGERIT", {"magerit", "activo", "amenaza", "vulnerabilidad", "impacto", "riesgo"}},
      {"OCTAVE", {"octave", "asset", "threat", "vulnerability"}},
      {"ISO27001", {"iso", "27001", "sgsi", "control", "anexo"}},
      {"NIST", {"nist", "framework", "cybersecurity", "function"}},
  };
  return table;
}

std::string ToUpper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return out;
}

}  // namespace

const char* OrchestratorStateName(OrchestratorState state) {
  switch (state) {
    case OrchestratorState::kUninitialized:
      return "uninitialized";
    case OrchestratorState::kInitializing:
      return "initializing";
    case OrchestratorState::kReady:
      return "ready";
    case OrchestratorState::kDegraded:
      return "degraded";
  }
  return "unknown";
}

const char* HealthStatusName(HealthStatus status) {
  switch (status) {
    case HealthStatus::kHealthy:
      return "healthy";
    case HealthStatus::kDegraded:
      return "degraded";
    case HealthStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

KnowledgeOrchestrator::KnowledgeOrchestrator(KnowledgeConfig config, std::shared_ptr<BatchEmbeddingProvider> embedder)
    : config_(std::move(config)),
      ingestor_(config_.docs_path, config_.document_extensions),
      injected_embedder_(std::move(embedder)) {
  ValidateKnowledgeConfig(config_);
  index_ = std::make_shared<VectorIndex>(config_);
  Logger()->info("knowledge orchestrator created: docs={} persist={} collection={}", config_.docs_path,
                 config_.persist_directory, config_.collection_name);
}

KnowledgeOrchestrator::~KnowledgeOrchestrator() {
  std::unique_lock<std::mutex> lock(async_mutex_);
  async_idle_.wait(lock, [this]() { return async_in_flight_ == 0; });
}

void KnowledgeOrchestrator::Initialize() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == OrchestratorState::kReady || state_ == OrchestratorState::kDegraded) {
      return;
    }
    state_ = OrchestratorState::kInitializing;
    last_error_.reset();
  }

  Logger()->info("initializing knowledge base");
  const auto started = std::chrono::steady_clock::now();
  try {
    if (injected_embedder_ != nullptr) {
      index_->InitializeEmbedder(injected_embedder_);
    } else {
      index_->InitializeEmbedder(config_.embedding);
    }
    SetupIndex();
    std::shared_ptr<Retriever> retriever{};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      retriever = retriever_;
    }
    // A retriever kept from before Shutdown carries its statistics forward.
    if (retriever == nullptr) {
      retriever = std::make_shared<Retriever>(index_, config_.retriever);
    } else {
      retriever->Configure(config_.retriever);
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    std::lock_guard<std::mutex> lock(mutex_);
    retriever_ = std::move(retriever);
    initialization_seconds_ = elapsed;
    state_ = OrchestratorState::kReady;
    Logger()->info("knowledge base ready in {:.2f}s: {} documents, {} chunks", elapsed, documents_loaded_,
                   chunks_created_);
  } catch (const std::exception& ex) {
    Logger()->error("knowledge base initialization failed: {}", ex.what());
    index_->Unload();
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = OrchestratorState::kUninitialized;
    last_error_ = ex.what();
    throw;
  }
}

void KnowledgeOrchestrator::SetupIndex() {
  const auto loaded = index_->Load();
  if (loaded.has_value() && !index_->ShouldRebuild(config_.docs_path)) {
    Logger()->info("using persisted snapshot ({} records)", loaded->record_count);
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_created_ = loaded->record_count;
    return;
  }

  Logger()->info("building a new vector index");
  const auto documents = ingestor_.LoadAllDocuments();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_loaded_ = documents.size();
  }
  if (documents.empty()) {
    throw EmptyInputError("no documents found under " + config_.docs_path);
  }
  const auto chunks =
      ingestor_.SplitDocuments(documents, config_.chunking.chunk_size, config_.chunking.chunk_overlap);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_created_ = chunks.size();
  }
  index_->Build(chunks);
}

void KnowledgeOrchestrator::ResetLocked() {
  state_ = OrchestratorState::kUninitialized;
  initialization_seconds_.reset();
}

void KnowledgeOrchestrator::Reinitialize(bool force_reindex) {
  Logger()->info("reinitializing knowledge base (force_reindex={})", force_reindex);
  if (force_reindex) {
    Cleanup();
  } else {
    Shutdown();
  }
  Initialize();
}

void KnowledgeOrchestrator::Shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ResetLocked();
  }
  index_->Unload();
  Logger()->info("knowledge base shut down");
}

void KnowledgeOrchestrator::Cleanup() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ResetLocked();
    retriever_.reset();
    documents_loaded_ = 0;
    chunks_created_ = 0;
    retrieval_calls_ = 0;
    last_search_.reset();
    last_error_.reset();
  }
  index_->Cleanup();
  Logger()->info("knowledge base resources cleaned up");
}

OrchestratorState KnowledgeOrchestrator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<std::string> KnowledgeOrchestrator::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::shared_ptr<Retriever> KnowledgeOrchestrator::RequireRetriever() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if ((state_ != OrchestratorState::kReady && state_ != OrchestratorState::kDegraded) || retriever_ == nullptr) {
    throw NotReadyError(std::string("knowledge base is not ready (state: ") + OrchestratorStateName(state_) + ")");
  }
  return retriever_;
}

RetrievalOutcome KnowledgeOrchestrator::SearchRelevantContext(const std::string& query,
                                                              int max_chunks,
                                                              const std::vector<std::string>& document_types,
                                                              const CancellationToken& cancel) {
  auto retriever = RequireRetriever();
  auto outcome = document_types.empty() ? retriever->Search(query, max_chunks, {}, cancel)
                                        : retriever->SearchByDocumentType(query, document_types, max_chunks, cancel);
  if (outcome.status == RetrievalStatus::kCancelled) {
    outcome.hits.clear();
    return outcome;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++retrieval_calls_;
  last_search_ = LastSearch{
      .query = std::string(ClipUtf8(ScrubUtf8(query), kLastSearchQueryBytes)),
      .results_count = outcome.hits.size(),
      .timestamp = std::chrono::system_clock::now(),
  };
  return outcome;
}

std::future<RetrievalOutcome> KnowledgeOrchestrator::SearchRelevantContextAsync(std::string query,
                                                                                int max_chunks,
                                                                                std::vector<std::string> document_types,
                                                                                CancellationToken cancel) {
  {
    std::lock_guard<std::mutex> lock(async_mutex_);
    ++async_in_flight_;
  }
  try {
    return std::async(std::launch::async,
                      [this, query = std::move(query), max_chunks, document_types = std::move(document_types),
                       cancel = std::move(cancel)]() {
                        try {
                          auto outcome = SearchRelevantContext(query, max_chunks, document_types, cancel);
                          FinishAsyncSearch();
                          return outcome;
                        } catch (const std::exception&) {
                          FinishAsyncSearch();
                          throw;
                        }
                      });
  } catch (const std::exception&) {
    FinishAsyncSearch();
    throw;
  }
}

void KnowledgeOrchestrator::FinishAsyncSearch() {
  std::lock_guard<std::mutex> lock(async_mutex_);
  --async_in_flight_;
  async_idle_.notify_all();
}

std::vector<std::string> KnowledgeOrchestrator::MethodologyKeywords(const std::string& methodology) {
  const auto upper = ToUpper(methodology);
  for (const auto& entry : MethodologyTable()) {
    if (entry.name == upper) {
      return entry.keywords;
    }
  }
  return {FoldCase(methodology)};
}

RetrievalOutcome KnowledgeOrchestrator::SearchByMethodology(const std::string& query,
                                                            const std::string& methodology,
                                                            int max_results) {
  auto retriever = RequireRetriever();
  return retriever->SearchByKeywords(query + " " + methodology, MethodologyKeywords(methodology), max_results);
}

std::string KnowledgeOrchestrator::FormatForPrompt(const std::vector<SearchHit>& hits) const {
  return FormatContextForPrompt(hits);
}

CitedContext KnowledgeOrchestrator::FormatWithCitations(const std::vector<SearchHit>& hits) const {
  return FormatContextWithCitations(hits);
}

std::vector<std::string> KnowledgeOrchestrator::DocumentTypesAvailable() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != OrchestratorState::kReady && state_ != OrchestratorState::kDegraded) {
      return {};
    }
  }
  std::vector<std::string> types{};
  for (const auto& [type, count] : index_->Stats().document_types) {
    types.push_back(type);
  }
  return types;
}

RetrievalTestReport KnowledgeOrchestrator::TestRetrieval(const std::vector<std::string>& queries) {
  return RequireRetriever()->TestRetrieval(queries);
}

HealthReport KnowledgeOrchestrator::HealthCheck() {
  HealthReport report{};
  report.timestamp = std::chrono::system_clock::now();
  try {
    std::shared_ptr<Retriever> retriever{};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      report.components.initialized =
          state_ == OrchestratorState::kReady || state_ == OrchestratorState::kDegraded;
      retriever = retriever_;
    }
    report.components.docs_accessible = std::filesystem::exists(config_.docs_path);
    report.components.embedder = index_->embedder_initialized();
    report.components.vector_index = index_->loaded();
    report.components.snapshot_persisted = index_->SnapshotExists();
    report.components.retriever = retriever != nullptr && report.components.initialized;

    if (retriever != nullptr && report.components.initialized) {
      try {
        const auto outcome = retriever->Search("test", 1);
        report.test_search_successful = outcome.ok() && !outcome.hits.empty();
      } catch (const KnowledgeError& ex) {
        Logger()->warn("health check search failed: {}", ex.what());
        report.test_search_successful = false;
      }
    }

    const bool healthy = report.components.all() && report.test_search_successful;
    report.status = healthy ? HealthStatus::kHealthy : HealthStatus::kDegraded;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!healthy && state_ == OrchestratorState::kReady) {
      state_ = OrchestratorState::kDegraded;
      Logger()->warn("knowledge base degraded");
    } else if (healthy && state_ == OrchestratorState::kDegraded) {
      state_ = OrchestratorState::kReady;
      Logger()->info("knowledge base recovered");
    }
  } catch (const std::exception& ex) {
    Logger()->error("health check failed: {}", ex.what());
    report.status = HealthStatus::kUnhealthy;
    report.error = ex.what();
  }
  return report;
}

KnowledgeStats KnowledgeOrchestrator::GetStats() const {
  KnowledgeStats stats{};
  std::shared_ptr<Retriever> retriever{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.state = state_;
    stats.documents_loaded = documents_loaded_;
    stats.chunks_created = chunks_created_;
    stats.initialization_seconds = initialization_seconds_;
    stats.retrieval_calls = retrieval_calls_;
    stats.last_search = last_search_;
    retriever = retriever_;
  }
  stats.docs_path = config_.docs_path;
  stats.persist_directory = config_.persist_directory;
  stats.index = index_->Stats();
  if (retriever != nullptr) {
    stats.retriever = retriever->Stats();
  }
  return stats;
}

}  // namespace rgkb
