#include "rgkb/config.hpp"
#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const rgkb::ConfigError&) {
    return true;
  }
  return false;
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

void ClearEnvironment() {
  for (const char* name : {"OPENAI_API_KEY", "RGKB_DOCS_PATH", "RGKB_PERSIST_DIR", "RGKB_COLLECTION",
                           "RGKB_LOG_LEVEL", "RGKB_EMBEDDING_MODEL", "RGKB_EMBEDDING_TIMEOUT_MS"}) {
    ::unsetenv(name);
  }
}

void ScenarioDefaults() {
  rgkb::tests::Log("scenario: defaults");
  ClearEnvironment();
  const auto config = rgkb::LoadKnowledgeConfig();
  Require(config.docs_path == "docs", "docs_path default mismatch");
  Require(config.persist_directory == "vectorstore", "persist_directory default mismatch");
  Require(config.embedding.model == "text-embedding-ada-002", "embedding model default mismatch");
  Require(config.embedding.timeout_ms == 30000, "timeout default mismatch");
  Require(config.embedding.api_key.empty(), "api key must be empty without environment");
  Require(config.retriever.lambda_mult == 0.7F, "lambda default mismatch");
}

void ScenarioJsonFileAndEnvironment(const std::filesystem::path& dir) {
  rgkb::tests::Log("scenario: json file then environment");
  ClearEnvironment();
  const auto path = dir / "config.json";
  WriteFile(path, R"({
    "docs_path": "knowledge/docs",
    "collection_name": "from_file",
    "unknown_key": 42,
    "chunking": {"chunk_size": 600, "chunk_overlap": 100},
    "embedding": {"model": "text-embedding-3-small", "dimensions": 1536, "max_retries": 1},
    "retriever": {"search_type": "similarity", "k": 4, "fetch_k": 10}
  })");

  auto config = rgkb::LoadKnowledgeConfig(path);
  Require(config.docs_path == "knowledge/docs", "docs_path not read from file");
  Require(config.collection_name == "from_file", "collection not read from file");
  Require(config.chunking.chunk_size == 600 && config.chunking.chunk_overlap == 100, "chunking not read");
  Require(config.embedding.model == "text-embedding-3-small", "embedding model not read");
  Require(config.embedding.max_retries == 1, "max_retries not read");
  Require(config.retriever.search_type == rgkb::SearchType::kSimilarity, "search_type not read");
  Require(config.retriever.k == 4 && config.retriever.fetch_k == 10, "k/fetch_k not read");

  ::setenv("RGKB_COLLECTION", "from_env", 1);
  ::setenv("OPENAI_API_KEY", "sk-test", 1);
  ::setenv("RGKB_EMBEDDING_TIMEOUT_MS", "1500", 1);
  config = rgkb::LoadKnowledgeConfig(path);
  Require(config.collection_name == "from_env", "environment must override the file");
  Require(config.embedding.api_key == "sk-test", "api key must come from environment");
  Require(config.embedding.timeout_ms == 1500, "timeout must come from environment");

  ::setenv("RGKB_EMBEDDING_TIMEOUT_MS", "soon", 1);
  Require(ThrowsConfigError([&]() { (void)rgkb::LoadKnowledgeConfig(path); }), "non-numeric timeout must throw");
  ClearEnvironment();
}

void ScenarioInvalidFiles(const std::filesystem::path& dir) {
  rgkb::tests::Log("scenario: invalid files");
  ClearEnvironment();
  const auto malformed = dir / "malformed.json";
  WriteFile(malformed, "{ \"docs_path\": ");
  Require(ThrowsConfigError([&]() { (void)rgkb::LoadKnowledgeConfig(malformed); }), "malformed json must throw");

  const auto wrong_type = dir / "wrong_type.json";
  WriteFile(wrong_type, R"({"chunking": {"chunk_size": "big"}})");
  Require(ThrowsConfigError([&]() { (void)rgkb::LoadKnowledgeConfig(wrong_type); }), "wrong type must throw");

  const auto bad_search = dir / "bad_search.json";
  WriteFile(bad_search, R"({"retriever": {"search_type": "fuzzy"}})");
  Require(ThrowsConfigError([&]() { (void)rgkb::LoadKnowledgeConfig(bad_search); }), "unknown search type must throw");

  Require(ThrowsConfigError([&]() { (void)rgkb::LoadKnowledgeConfig(dir / "missing.json"); }),
          "missing file must throw");
}

void ScenarioValidation() {
  rgkb::tests::Log("scenario: validation");
  rgkb::KnowledgeConfig config{};
  rgkb::ValidateKnowledgeConfig(config);

  auto overlap = config;
  overlap.chunking.chunk_overlap = overlap.chunking.chunk_size;
  Require(ThrowsConfigError([&]() { rgkb::ValidateKnowledgeConfig(overlap); }), "overlap >= size must throw");

  auto fetch = config;
  fetch.retriever.fetch_k = fetch.retriever.k - 1;
  Require(ThrowsConfigError([&]() { rgkb::ValidateKnowledgeConfig(fetch); }), "fetch_k < k must throw");

  auto lambda = config;
  lambda.retriever.lambda_mult = 1.5F;
  Require(ThrowsConfigError([&]() { rgkb::ValidateKnowledgeConfig(lambda); }), "lambda > 1 must throw");

  auto batch = config;
  batch.embedding.max_batch_size = 0;
  Require(ThrowsConfigError([&]() { rgkb::ValidateKnowledgeConfig(batch); }), "zero batch size must throw");
}

void ScenarioLogLevels() {
  rgkb::tests::Log("scenario: log levels");
  rgkb::SetLogLevel("debug");
  Require(rgkb::Logger()->level() == spdlog::level::debug, "debug level not applied");
  rgkb::SetLogLevel("off");
  Require(rgkb::Logger()->level() == spdlog::level::off, "off level not applied");
  Require(ThrowsConfigError([]() { rgkb::SetLogLevel("verbose"); }), "unknown level must throw");
  rgkb::SetLogLevel("info");
  Require(rgkb::QueryPreview(std::string(80, 'q')).size() == 53, "query preview must truncate to 50 chars");
  const std::string accented = std::string(49, 'a') + "ánalisis";
  Require(rgkb::QueryPreview(accented) == std::string(49, 'a') + "...",
          "query preview must not split a multibyte character");
}

}  // namespace

int main() {
  try {
    rgkb::tests::Log("config_test: start");
    rgkb::tests::TempDir dir("rgkb_config_test");
    ScenarioDefaults();
    ScenarioJsonFileAndEnvironment(dir.path());
    ScenarioInvalidFiles(dir.path());
    ScenarioValidation();
    ScenarioLogLevels();
    rgkb::tests::Log("config_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    rgkb::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
