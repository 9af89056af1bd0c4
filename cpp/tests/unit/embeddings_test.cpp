#include "rgkb/embeddings.hpp"
#include "rgkb/errors.hpp"
#include "rgkb/vector_engine.hpp"

#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

double L2Norm(const std::vector<float>& values) {
  double sum = 0.0;
  for (const auto value : values) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return std::sqrt(sum);
}

void ScenarioIdentity() {
  rgkb::tests::Log("scenario: identity");
  rgkb::HashingEmbedder embedder;
  Require(embedder.dimensions() == 384 && embedder.normalize(), "default shape mismatch");
  const auto identity = embedder.identity();
  Require(identity.has_value() && identity->dimensions == 384, "identity must carry the dimensions");
  Require(rgkb::EmbeddingModelName(embedder) == "hashing-bow", "model name mismatch");

  bool threw = false;
  try {
    rgkb::HashingEmbedder invalid(0);
  } catch (const rgkb::ConfigError&) {
    threw = true;
  }
  Require(threw, "dimensions <= 0 must throw ConfigError");
}

void ScenarioAccentAndCaseFolding() {
  rgkb::tests::Log("scenario: accent and case folding");
  rgkb::HashingEmbedder embedder(256);
  Require(embedder.Embed("GESTIÓN DE RIESGOS") == embedder.Embed("gestión de riesgos"),
          "accented capitals must fold to the lowercase token");
  Require(embedder.Embed("ANÁLISIS") == embedder.Embed("análisis"), "Á must fold to á");
  Require(embedder.Embed("Ñandú") == embedder.Embed("ñandú"), "Ñ must fold to ñ");
  // "analisis" without the accent is a different word.
  Require(embedder.Embed("análisis") != embedder.Embed("analisis"), "accents must stay part of the token");
  Require(embedder.Embed("gestión") != embedder.Embed("gesti n"), "multibyte letters must not split words");
}

void ScenarioStopWords() {
  rgkb::tests::Log("scenario: stop words");
  rgkb::HashingEmbedder embedder(256);
  Require(embedder.Embed("análisis de los riesgos") == embedder.Embed("análisis riesgos"),
          "function words must not contribute");
  const auto only_stop_words = embedder.Embed("de la y el");
  Require(L2Norm(only_stop_words) == 0.0, "stop words alone must give the zero vector");
  Require(embedder.Embed("").size() == 256, "empty text keeps the full dimension");
}

void ScenarioNormalizationAndSimilarity() {
  rgkb::tests::Log("scenario: normalization and similarity");
  rgkb::HashingEmbedder embedder(256);
  const auto query = embedder.Embed("amenaza sobre activos críticos");
  Require(std::fabs(L2Norm(query) - 1.0) <= 1e-5, "non-empty embedding must be L2 normalized");
  Require(embedder.Embed("amenaza sobre activos críticos") == query, "embedding must be deterministic");

  const auto related = embedder.Embed("la amenaza afecta a los activos");
  const auto unrelated = embedder.Embed("presupuesto anual de marketing");
  Require(rgkb::CosineSimilarity(query, related) > rgkb::CosineSimilarity(query, unrelated),
          "shared terms must raise similarity");
}

void ScenarioBatch() {
  rgkb::tests::Log("scenario: batch");
  rgkb::HashingEmbedder embedder(128);
  const std::vector<std::string> texts = {"salvaguarda", "vulnerabilidad", "impacto residual"};
  const auto batch = embedder.EmbedBatch(texts);
  Require(batch.size() == texts.size(), "batch result size mismatch");
  for (std::size_t i = 0; i < texts.size(); ++i) {
    Require(batch[i] == embedder.Embed(texts[i]), "batch item must match single Embed output");
  }

  std::vector<std::string> oversized(embedder.max_batch_size() + 1, "riesgo");
  bool threw = false;
  try {
    (void)embedder.EmbedBatch(oversized);
  } catch (const rgkb::ProviderError& ex) {
    threw = !ex.transient();
  }
  Require(threw, "batches above the limit must be rejected permanently");
}

void ScenarioConcurrentEmbedding() {
  rgkb::tests::Log("scenario: concurrent embedding");
  rgkb::HashingEmbedder embedder(128);
  const auto expected = embedder.Embed("riesgo residual");
  std::vector<std::thread> threads{};
  std::vector<int> matches(8, 0);
  for (std::size_t i = 0; i < matches.size(); ++i) {
    threads.emplace_back([&, i]() {
      (void)embedder.Embed("texto " + std::to_string(i));
      matches[i] = embedder.Embed("riesgo residual") == expected ? 1 : 0;
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (const int match : matches) {
    Require(match == 1, "concurrent embeddings must be identical");
  }
}

}  // namespace

int main() {
  try {
    rgkb::tests::Log("embeddings_test: start");
    ScenarioIdentity();
    ScenarioAccentAndCaseFolding();
    ScenarioStopWords();
    ScenarioNormalizationAndSimilarity();
    ScenarioBatch();
    ScenarioConcurrentEmbedding();
    rgkb::tests::Log("embeddings_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    rgkb::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
