#include "rgkb/errors.hpp"
#include "rgkb/knowledge_orchestrator.hpp"
#include "rgkb/report_json.hpp"

#include "../test_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// 1500 characters: a 100-character paragraph followed by fourteen 98-character ones.
std::string Document(const std::string& sentence) {
  auto paragraph = [&](std::size_t length) {
    std::string text{};
    while (text.size() < length) {
      text += sentence;
    }
    text.resize(length);
    return text;
  };
  std::string out = paragraph(100);
  for (int i = 0; i < 14; ++i) {
    out += "\n\n";
    out += paragraph(98);
  }
  return out;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

void WriteCorpus(const std::filesystem::path& docs) {
  WriteFile(docs / "marco_magerit.txt",
            Document("MAGERIT analisis de riesgos identifica activos amenazas y salvaguardas. "));
  WriteFile(docs / "principios_seguridad.txt",
            Document("confidencialidad integridad y disponibilidad son principios de seguridad. "));
  WriteFile(docs / "cumplimiento_iso27001.txt",
            Document("ISO 27001 define controles del anexo A para el cumplimiento del SGSI. "));
}

rgkb::KnowledgeConfig TestConfig(const std::filesystem::path& root) {
  rgkb::KnowledgeConfig config{};
  config.docs_path = (root / "docs").string();
  config.persist_directory = (root / "vectorstore").string();
  config.collection_name = "security_knowledge";
  config.build_concurrency = 2;
  config.embedding.retry_backoff_ms = 1;
  return config;
}

std::shared_ptr<rgkb::BatchEmbeddingProvider> Embedder() {
  return std::make_shared<rgkb::HashingEmbedder>(256);
}

// Hashing embedder whose query embeddings take a fixed delay.
class SlowQueryEmbedder final : public rgkb::BatchEmbeddingProvider {
 public:
  explicit SlowQueryEmbedder(std::chrono::milliseconds delay) : inner_(256), delay_(delay) {}

  int dimensions() const override { return inner_.dimensions(); }
  bool normalize() const override { return inner_.normalize(); }
  std::optional<rgkb::EmbeddingIdentity> identity() const override { return inner_.identity(); }
  std::vector<float> Embed(const std::string& text) override {
    std::this_thread::sleep_for(delay_);
    auto vector = inner_.Embed(text);
    ++queries_;
    return vector;
  }
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override {
    return inner_.EmbedBatch(texts);
  }
  std::size_t max_batch_size() const override { return inner_.max_batch_size(); }

  [[nodiscard]] int queries() const { return queries_.load(); }

 private:
  rgkb::HashingEmbedder inner_;
  std::chrono::milliseconds delay_;
  std::atomic<int> queries_{0};
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void ScenarioNotReadyBeforeInitialize(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: not ready before initialize");
  rgkb::KnowledgeOrchestrator orchestrator(TestConfig(root), Embedder());
  Require(orchestrator.state() == rgkb::OrchestratorState::kUninitialized, "initial state");
  Require(Throws<rgkb::NotReadyError>([&]() { (void)orchestrator.SearchRelevantContext("MAGERIT"); }),
          "search before initialize must throw NotReadyError");
  Require(Throws<rgkb::NotReadyError>([&]() { (void)orchestrator.SearchByMethodology("riesgo", "MAGERIT"); }),
          "methodology search before initialize must throw NotReadyError");
  Require(orchestrator.DocumentTypesAvailable().empty(), "no document types before initialize");

  const auto health = orchestrator.HealthCheck();
  Require(health.status == rgkb::HealthStatus::kDegraded && !health.components.initialized,
          "uninitialized health must be degraded");
  Require(!health.test_search_successful, "no test search before initialize");
}

void ScenarioInitializeAndSearch(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: initialize and search");
  rgkb::KnowledgeOrchestrator orchestrator(TestConfig(root), Embedder());
  orchestrator.Initialize();
  Require(orchestrator.state() == rgkb::OrchestratorState::kReady, "initialize must reach Ready");
  orchestrator.Initialize();
  Require(orchestrator.state() == rgkb::OrchestratorState::kReady, "second initialize must be a no-op");

  auto stats = orchestrator.GetStats();
  Require(stats.documents_loaded == 3 && stats.chunks_created == 6, "three documents must yield six chunks");
  Require(stats.index.record_count == 6 && stats.index.snapshot_exists, "index stats mismatch");
  Require(stats.initialization_seconds.has_value(), "initialization time must be recorded");

  const auto outcome = orchestrator.SearchRelevantContext("MAGERIT analisis de riesgos", 2);
  Require(outcome.ok() && outcome.hits.size() == 2, "search must return two hits");
  Require(outcome.hits[0].relevance_rank == 1 && outcome.hits[1].relevance_rank == 2, "ranks must be 1 and 2");
  Require(*outcome.hits[0].score >= *outcome.hits[1].score, "first hit must be the most similar");
  Require(outcome.hits[0].metadata.document_type == rgkb::DocumentType::kRiskMethodology, "best hit type");

  const auto principles =
      orchestrator.SearchRelevantContext("principios de seguridad", 4, {"security_principles"});
  Require(!principles.hits.empty(), "document type search must find principles");
  for (const auto& hit : principles.hits) {
    Require(hit.metadata.document_type == rgkb::DocumentType::kSecurityPrinciples, "document type filter leaked");
  }

  const std::string long_query(80, 'q');
  (void)orchestrator.SearchRelevantContext(long_query, 1);
  stats = orchestrator.GetStats();
  Require(stats.retrieval_calls == 3, "every search must be counted");
  Require(stats.last_search.has_value() && stats.last_search->query.size() == 50, "query must be clipped to 50");
  Require(stats.last_search->results_count == 1, "last search result count");
  Require(stats.retriever.has_value() && stats.retriever->total_searches == 3, "retriever stats mismatch");

  // The 50th byte falls inside "á"; the stored query must end before it.
  (void)orchestrator.SearchRelevantContext(std::string(49, 'a') + "ánalisis", 1);
  stats = orchestrator.GetStats();
  Require(stats.last_search->query == std::string(49, 'a'), "query must be clipped on a character boundary");
  Require(!rgkb::ToJson(stats).dump().empty(), "stats with a clipped accented query must serialize");
  (void)orchestrator.SearchRelevantContext("incidente en el \xE1rea de sistemas", 1);
  stats = orchestrator.GetStats();
  Require(stats.last_search->query == "incidente en el ?rea de sistemas", "invalid bytes must be replaced");
  Require(!rgkb::ToJson(stats).dump().empty(), "stats with a latin-1 query must serialize");

  const auto types = orchestrator.DocumentTypesAvailable();
  Require(types == std::vector<std::string>({"compliance", "risk_methodology", "security_principles"}),
          "available document types mismatch");

  const auto methodology = orchestrator.SearchByMethodology("analisis de riesgos", "magerit", 3);
  Require(methodology.ok() && !methodology.hits.empty() && methodology.hits.size() <= 3, "methodology hit count");
  for (const auto& hit : methodology.hits) {
    Require(!hit.matched_keywords.empty(), "methodology hits must record matched keywords");
  }

  const auto prompt = orchestrator.FormatForPrompt(outcome.hits);
  Require(prompt.rfind("=== BEGIN KNOWLEDGE ===\n", 0) == 0, "prompt header");
  Require(prompt.find("Risk Methodology (marco_magerit)") != std::string::npos, "prompt source line");
  const auto cited = orchestrator.FormatWithCitations(outcome.hits);
  Require(cited.citations.size() == 2 && cited.citations[0].id == "ref_1", "citations");

  const auto report = orchestrator.TestRetrieval();
  Require(report.queries_tested == 5 && report.successful_searches == 5, "test queries must succeed");
}

void ScenarioAsyncAndCancellation(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: async and cancellation");
  rgkb::KnowledgeOrchestrator orchestrator(TestConfig(root), Embedder());
  orchestrator.Initialize();
  Require(orchestrator.GetStats().documents_loaded == 0, "persisted snapshot must be reused without reloading");
  Require(orchestrator.GetStats().chunks_created == 6, "reused snapshot must report its records");

  auto first = orchestrator.SearchRelevantContextAsync("controles del anexo A", 3);
  auto second = orchestrator.SearchRelevantContextAsync("integridad disponibilidad", 3);
  const auto first_outcome = first.get();
  const auto second_outcome = second.get();
  Require(first_outcome.ok() && first_outcome.hits.size() == 3, "first async search");
  Require(second_outcome.ok() && second_outcome.hits.size() == 3, "second async search");

  rgkb::CancellationToken cancel;
  cancel.Cancel();
  const auto cancelled = orchestrator.SearchRelevantContextAsync("MAGERIT", 3, {}, cancel).get();
  Require(cancelled.status == rgkb::RetrievalStatus::kCancelled && cancelled.hits.empty(), "cancelled search");
  Require(orchestrator.GetStats().retrieval_calls == 2, "cancelled searches must not be counted");
}

void ScenarioAsyncOutlivesOrchestrator(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: async search outlives the orchestrator handle");
  auto embedder = std::make_shared<SlowQueryEmbedder>(std::chrono::milliseconds(100));
  auto orchestrator = std::make_unique<rgkb::KnowledgeOrchestrator>(TestConfig(root), embedder);
  orchestrator->Initialize();

  auto pending = orchestrator->SearchRelevantContextAsync("MAGERIT analisis de riesgos", 2);
  orchestrator.reset();
  Require(embedder->queries() == 1, "destruction must wait for the running search");
  const auto outcome = pending.get();
  Require(outcome.ok() && outcome.hits.size() == 2, "search must complete after the orchestrator is gone");
}

void ScenarioHealthTransitions(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: health transitions");
  rgkb::KnowledgeOrchestrator orchestrator(TestConfig(root), Embedder());
  orchestrator.Initialize();

  auto health = orchestrator.HealthCheck();
  Require(health.status == rgkb::HealthStatus::kHealthy, "initialized orchestrator must be healthy");
  Require(health.components.all() && health.test_search_successful, "every component must be up");
  Require(orchestrator.GetStats().retrieval_calls == 0, "health check search must not count as a retrieval call");
  Require(orchestrator.GetStats().retriever->total_searches == 1, "health check search runs through the retriever");

  const auto json = rgkb::ToJson(health);
  Require(json.at("status") == "healthy" && json.at("components").at("vector_store") == true, "health json");

  std::filesystem::remove(std::filesystem::path(orchestrator.config().persist_directory) /
                          "security_knowledge.sqlite3");
  health = orchestrator.HealthCheck();
  Require(health.status == rgkb::HealthStatus::kDegraded && !health.components.snapshot_persisted,
          "missing snapshot must degrade health");
  Require(orchestrator.state() == rgkb::OrchestratorState::kDegraded, "degraded health must move state");
  Require(orchestrator.SearchRelevantContext("MAGERIT", 1).ok(), "degraded orchestrator still serves queries");

  orchestrator.Reinitialize();
  Require(orchestrator.state() == rgkb::OrchestratorState::kReady, "reinitialize must rebuild and reach Ready");
  Require(orchestrator.GetStats().documents_loaded == 3, "rebuild must reload the documents");
  Require(orchestrator.HealthCheck().status == rgkb::HealthStatus::kHealthy, "rebuilt orchestrator is healthy");

  const auto stats_json = rgkb::ToJson(orchestrator.GetStats());
  Require(stats_json.at("state") == "ready" && stats_json.at("is_initialized") == true, "stats json");
  Require(rgkb::FormatTimestamp(std::chrono::system_clock::time_point{}) == "1970-01-01T00:00:00.000000Z",
          "timestamp format");

  // Two health checks, one query, then the health check after the rebuild.
  Require(orchestrator.GetStats().retriever->total_searches == 4, "reinitialize keeps retriever statistics");

  orchestrator.Shutdown();
  Require(orchestrator.state() == rgkb::OrchestratorState::kUninitialized, "shutdown state");
  Require(orchestrator.GetStats().retrieval_calls == 1, "shutdown keeps statistics");
  Require(orchestrator.GetStats().index.snapshot_exists, "shutdown keeps the snapshot");
  auto retriever_stats = orchestrator.GetStats().retriever;
  Require(retriever_stats.has_value() && retriever_stats->total_searches == 4,
          "shutdown keeps retriever statistics");
  Require(!orchestrator.HealthCheck().components.retriever, "retriever is not reported up after shutdown");

  orchestrator.Initialize();
  Require(orchestrator.state() == rgkb::OrchestratorState::kReady, "initialize after shutdown");
  retriever_stats = orchestrator.GetStats().retriever;
  Require(retriever_stats->total_searches == 4 && retriever_stats->term_frequencies.at("magerit") == 1,
          "initialize after shutdown continues the retriever statistics");

  orchestrator.Reinitialize(true);
  Require(orchestrator.state() == rgkb::OrchestratorState::kReady, "forced reinitialize");
  Require(orchestrator.GetStats().retrieval_calls == 0, "forced reinitialize resets statistics");
  Require(orchestrator.GetStats().retriever->total_searches == 0, "forced reinitialize resets retriever statistics");

  orchestrator.Cleanup();
  const auto cleaned = orchestrator.GetStats();
  Require(cleaned.state == rgkb::OrchestratorState::kUninitialized, "cleanup state");
  Require(!cleaned.index.snapshot_exists && cleaned.chunks_created == 0, "cleanup must delete the snapshot");
}

void ScenarioFailedInitialization(const std::filesystem::path& root) {
  rgkb::tests::Log("scenario: failed initialization");
  {
    auto config = TestConfig(root / "missing");
    rgkb::KnowledgeOrchestrator orchestrator(config, Embedder());
    Require(Throws<rgkb::NotFoundError>([&]() { orchestrator.Initialize(); }), "missing docs must fail");
    Require(orchestrator.state() == rgkb::OrchestratorState::kUninitialized, "failed init stays Uninitialized");
    Require(orchestrator.last_error().has_value(), "failed init must record the error");
  }
  {
    auto config = TestConfig(root / "empty");
    std::filesystem::create_directories(config.docs_path);
    rgkb::KnowledgeOrchestrator orchestrator(config, Embedder());
    Require(Throws<rgkb::EmptyInputError>([&]() { orchestrator.Initialize(); }), "empty corpus must fail");
    Require(orchestrator.state() == rgkb::OrchestratorState::kUninitialized, "empty corpus state");
  }
  {
    auto config = TestConfig(root);
    config.embedding.api_key.clear();
    rgkb::KnowledgeOrchestrator orchestrator(config);
    Require(Throws<rgkb::ConfigError>([&]() { orchestrator.Initialize(); }), "missing credential must fail");
    Require(orchestrator.last_error().has_value(), "credential error must be recorded");
  }
  {
    auto config = TestConfig(root);
    config.chunking.chunk_overlap = config.chunking.chunk_size;
    Require(Throws<rgkb::ConfigError>([&]() { rgkb::KnowledgeOrchestrator invalid(config, Embedder()); }),
            "invalid configuration must be rejected at construction");
  }
}

void ScenarioMethodologyKeywords() {
  rgkb::tests::Log("scenario: methodology keywords");
  const auto magerit = rgkb::KnowledgeOrchestrator::MethodologyKeywords("magerit");
  Require(!magerit.empty() && magerit.front() == "magerit", "MAGERIT keywords");
  Require(rgkb::KnowledgeOrchestrator::MethodologyKeywords("NIST").front() == "nist", "NIST keywords");
  Require(rgkb::KnowledgeOrchestrator::MethodologyKeywords("Cobit") == std::vector<std::string>({"cobit"}),
          "unknown methodology falls back to its lowercase name");
}

}  // namespace

int main() {
  try {
    rgkb::tests::Log("knowledge_orchestrator_test: start");
    const rgkb::tests::TempDir temp("rgkb_orchestrator");
    WriteCorpus(temp.path() / "docs");
    ScenarioNotReadyBeforeInitialize(temp.path());
    ScenarioInitializeAndSearch(temp.path());
    ScenarioAsyncAndCancellation(temp.path());
    ScenarioAsyncOutlivesOrchestrator(temp.path());
    ScenarioHealthTransitions(temp.path());
    ScenarioFailedInitialization(temp.path());
    ScenarioMethodologyKeywords();
    rgkb::tests::Log("knowledge_orchestrator_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    rgkb::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
