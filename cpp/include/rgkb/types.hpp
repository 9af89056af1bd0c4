#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace rgkb {

enum class DocumentType {
  kRiskMethodology,
  kSecurityPrinciples,
  kItRiskManagement,
  kRegulatoryFramework,
  kCompliance,
  kGeneral,
};

enum class ChunkType {
  kVulnerability,
  kControl,
  kImpact,
  kMethodology,
  kFrameworkReference,
  kConceptual,
};

[[nodiscard]] const char* DocumentTypeName(DocumentType type);
[[nodiscard]] std::optional<DocumentType> ParseDocumentType(const std::string& name);
[[nodiscard]] const char* ChunkTypeName(ChunkType type);
[[nodiscard]] std::optional<ChunkType> ParseChunkType(const std::string& name);

struct Document {
  std::string content;
  std::string source_path;
  std::string filename;
  DocumentType document_type = DocumentType::kGeneral;
  std::size_t content_length = 0;
  std::string language = "es";
  std::string domain = "cybersecurity";
  std::size_t keywords_count = 0;
};

struct ChunkMetadata {
  std::string filename;
  std::string source_path;
  DocumentType document_type = DocumentType::kGeneral;
  int chunk_index = 0;
  int total_chunks = 1;
  std::vector<std::string> keywords;
  ChunkType chunk_type = ChunkType::kConceptual;
  std::size_t start_offset = 0;
  std::string language = "es";
  std::string domain = "cybersecurity";
};

struct Chunk {
  std::string id;
  std::string text;
  ChunkMetadata metadata;
};

struct EmbeddingRecord {
  std::string id;
  std::vector<float> embedding;
  std::string text;
  ChunkMetadata metadata;
};

struct DocumentStats {
  std::size_t total_documents = 0;
  std::size_t total_characters = 0;
  std::size_t avg_document_length = 0;
  std::map<std::string, std::size_t> document_types;
  std::set<std::string> languages;
};

enum class SearchType {
  kSimilarity,
  kSimilarityScoreThreshold,
  kMmr,
};

[[nodiscard]] const char* SearchTypeName(SearchType type);
[[nodiscard]] std::optional<SearchType> ParseSearchType(const std::string& name);

struct RetrieverConfig {
  SearchType search_type = SearchType::kMmr;
  int k = 8;
  int fetch_k = 16;
  float lambda_mult = 0.7F;
  float score_threshold = 0.3F;
};

struct SearchHit {
  std::string id;
  std::string content;
  ChunkMetadata metadata;
  int relevance_rank = 0;
  std::optional<float> score;
  std::vector<std::string> matched_keywords;
};

enum class RetrievalStatus {
  kOk,
  kDegraded,
  kCancelled,
};

struct RetrievalOutcome {
  RetrievalStatus status = RetrievalStatus::kOk;
  std::vector<SearchHit> hits;
  std::optional<std::string> error;

  [[nodiscard]] bool ok() const { return status == RetrievalStatus::kOk; }
  [[nodiscard]] bool degraded() const { return status == RetrievalStatus::kDegraded; }
};

// A metadata constraint: a scalar means "equals", a collection means "any of".
struct Equals {
  std::string value;
};

struct AnyOf {
  std::vector<std::string> values;
};

using FilterCondition = std::variant<Equals, AnyOf>;
using MetadataFilter = std::map<std::string, FilterCondition>;

class CancellationToken {
 public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() { cancelled_->store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const { return cancelled_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

struct Citation {
  std::string id;
  std::string source;
  std::string document_type;
  std::string chunk_id;
  int relevance_rank = 0;
};

struct SnapshotInfo {
  std::string collection;
  std::size_t record_count = 0;
  std::chrono::system_clock::time_point built_at{};
  std::string embedding_model;
  int dimensions = 0;
  int schema_version = 0;
  std::string frameworks;
};

struct IndexStats {
  bool initialized = false;
  std::size_t record_count = 0;
  std::string collection_name;
  std::string persist_directory;
  bool snapshot_exists = false;
  std::map<std::string, std::size_t> document_types;
  std::set<std::string> languages;
  std::string embedding_model;
};

struct RetrieverStats {
  std::uint64_t total_searches = 0;
  double avg_results_per_search = 0.0;
  std::map<std::string, std::uint64_t> term_frequencies;
  std::vector<std::pair<std::string, std::uint64_t>> top_search_terms;
  RetrieverConfig config{};
};

struct ChunkingConfig {
  int chunk_size = 1000;
  int chunk_overlap = 200;
};

struct EmbeddingConfig {
  std::string api_key;
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "text-embedding-ada-002";
  int dimensions = 1536;
  long timeout_ms = 30000;
  int max_batch_size = 1000;
  int max_retries = 3;
  long retry_backoff_ms = 500;
};

struct KnowledgeConfig {
  std::string docs_path = "docs";
  std::string persist_directory = "vectorstore";
  std::string collection_name = "security_knowledge";
  std::vector<std::string> document_extensions = {".txt"};
  ChunkingConfig chunking{};
  EmbeddingConfig embedding{};
  int build_concurrency = 4;
  RetrieverConfig retriever{};
  std::string log_level = "info";
};

}  // namespace rgkb
