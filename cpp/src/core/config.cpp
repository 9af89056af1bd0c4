#include "rgkb/config.hpp"

#include "rgkb/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

namespace rgkb {
namespace {

using json = nlohmann::json;

std::optional<std::string> ReadEnvironment(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

long ParsePositiveLong(const std::string& raw, const char* name) {
  char* end = nullptr;
  const long value = std::strtol(raw.c_str(), &end, 10);
  if (end == raw.c_str() || *end != '\0' || value <= 0) {
    throw ConfigError(std::string(name) + " must be a positive integer, got '" + raw + "'");
  }
  return value;
}

template <typename T>
void ReadField(const json& object, const char* key, T& out) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return;
  }
  out = it->get<T>();
}

void ApplyRetrieverJson(const json& object, RetrieverConfig& retriever) {
  if (const auto it = object.find("search_type"); it != object.end()) {
    const auto name = it->get<std::string>();
    const auto parsed = ParseSearchType(name);
    if (!parsed.has_value()) {
      throw ConfigError("unknown retriever.search_type: " + name);
    }
    retriever.search_type = *parsed;
  }
  ReadField(object, "k", retriever.k);
  ReadField(object, "fetch_k", retriever.fetch_k);
  ReadField(object, "lambda_mult", retriever.lambda_mult);
  ReadField(object, "score_threshold", retriever.score_threshold);
}

void ApplyEmbeddingJson(const json& object, EmbeddingConfig& embedding) {
  ReadField(object, "api_key", embedding.api_key);
  ReadField(object, "base_url", embedding.base_url);
  ReadField(object, "model", embedding.model);
  ReadField(object, "dimensions", embedding.dimensions);
  ReadField(object, "timeout_ms", embedding.timeout_ms);
  ReadField(object, "max_batch_size", embedding.max_batch_size);
  ReadField(object, "max_retries", embedding.max_retries);
  ReadField(object, "retry_backoff_ms", embedding.retry_backoff_ms);
}

void ApplyJsonFile(const std::filesystem::path& path, KnowledgeConfig& config) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file: " + path.string());
  }
  try {
    const auto root = json::parse(in);
    if (!root.is_object()) {
      throw ConfigError("config file root must be an object: " + path.string());
    }
    ReadField(root, "docs_path", config.docs_path);
    ReadField(root, "persist_directory", config.persist_directory);
    ReadField(root, "collection_name", config.collection_name);
    ReadField(root, "document_extensions", config.document_extensions);
    ReadField(root, "build_concurrency", config.build_concurrency);
    ReadField(root, "log_level", config.log_level);
    if (const auto it = root.find("chunking"); it != root.end() && it->is_object()) {
      ReadField(*it, "chunk_size", config.chunking.chunk_size);
      ReadField(*it, "chunk_overlap", config.chunking.chunk_overlap);
    }
    if (const auto it = root.find("embedding"); it != root.end() && it->is_object()) {
      ApplyEmbeddingJson(*it, config.embedding);
    }
    if (const auto it = root.find("retriever"); it != root.end() && it->is_object()) {
      ApplyRetrieverJson(*it, config.retriever);
    }
  } catch (const json::exception& ex) {
    throw ConfigError("invalid config file " + path.string() + ": " + ex.what());
  }
}

void ApplyEnvironment(KnowledgeConfig& config) {
  if (auto value = ReadEnvironment("OPENAI_API_KEY")) {
    config.embedding.api_key = *value;
  }
  if (auto value = ReadEnvironment("RGKB_DOCS_PATH")) {
    config.docs_path = *value;
  }
  if (auto value = ReadEnvironment("RGKB_PERSIST_DIR")) {
    config.persist_directory = *value;
  }
  if (auto value = ReadEnvironment("RGKB_COLLECTION")) {
    config.collection_name = *value;
  }
  if (auto value = ReadEnvironment("RGKB_LOG_LEVEL")) {
    config.log_level = *value;
  }
  if (auto value = ReadEnvironment("RGKB_EMBEDDING_MODEL")) {
    config.embedding.model = *value;
  }
  if (auto value = ReadEnvironment("RGKB_EMBEDDING_TIMEOUT_MS")) {
    config.embedding.timeout_ms = ParsePositiveLong(*value, "RGKB_EMBEDDING_TIMEOUT_MS");
  }
}

}  // namespace

KnowledgeConfig LoadKnowledgeConfig(const std::optional<std::filesystem::path>& json_path) {
  KnowledgeConfig config{};
  if (json_path.has_value()) {
    ApplyJsonFile(*json_path, config);
  }
  ApplyEnvironment(config);
  ValidateKnowledgeConfig(config);
  return config;
}

void ValidateKnowledgeConfig(const KnowledgeConfig& config) {
  if (config.chunking.chunk_size <= 0) {
    throw ConfigError("chunk_size must be positive");
  }
  if (config.chunking.chunk_overlap < 0 || config.chunking.chunk_overlap >= config.chunking.chunk_size) {
    throw ConfigError("chunk_overlap must be in [0, chunk_size)");
  }
  if (config.retriever.k <= 0) {
    throw ConfigError("retriever.k must be positive");
  }
  if (config.retriever.fetch_k < config.retriever.k) {
    throw ConfigError("retriever.fetch_k must be >= retriever.k");
  }
  if (config.retriever.lambda_mult < 0.0F || config.retriever.lambda_mult > 1.0F) {
    throw ConfigError("retriever.lambda_mult must be in [0, 1]");
  }
  if (config.embedding.max_batch_size <= 0) {
    throw ConfigError("embedding.max_batch_size must be positive");
  }
  if (config.embedding.max_retries < 0) {
    throw ConfigError("embedding.max_retries must not be negative");
  }
  if (config.collection_name.empty()) {
    throw ConfigError("collection_name must not be empty");
  }
}

}  // namespace rgkb
