#pragma once

#include "rgkb/net/http.hpp"
#include "rgkb/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rgkb {

struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<int> dimensions;
  std::optional<bool> normalized;
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual bool normalize() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
  // Largest batch the provider accepts in one call.
  virtual std::size_t max_batch_size() const = 0;
};

// Model name recorded in snapshots and statistics.
std::string EmbeddingModelName(const EmbeddingProvider& provider);

// Signed feature hashing over case-folded Spanish word tokens, stop words removed.
// Deterministic and local; used offline and in tests.
class HashingEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  std::size_t max_batch_size() const override;

 private:
  int dimensions_;
};

using EmbeddingTransport = std::function<net::HttpResponse(const net::HttpRequest&)>;

// OpenAI-compatible /embeddings client. Throws ProviderError; transient() is set for
// transport failures, timeouts, HTTP 429 and 5xx.
class OpenAIEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit OpenAIEmbedder(EmbeddingConfig config, EmbeddingTransport transport = net::PostJson);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;
  std::size_t max_batch_size() const override;

 private:
  EmbeddingConfig config_;
  EmbeddingTransport transport_;
};

}  // namespace rgkb
