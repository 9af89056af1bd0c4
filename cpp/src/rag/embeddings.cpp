#include "rgkb/embeddings.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/utf8_text.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rgkb {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr std::size_t kMaxBatchSize = 256;

// Spanish function words that carry no topical signal in the corpus.
constexpr std::array<std::string_view, 24> kStopWords = {
    "a", "al", "con", "de", "del", "e", "el", "en", "es", "la", "las", "lo",
    "los", "o", "para", "por", "que", "se", "su", "sus", "u", "un", "una", "y",
};

bool IsStopWord(std::string_view token) {
  return std::find(kStopWords.begin(), kStopWords.end(), token) != kStopWords.end();
}

// Case-folded word tokens. Accented letters and other multibyte characters stay
// inside the word, so "GESTIÓN" and "gestión" produce the same token.
std::vector<std::string> Tokenize(std::string_view text) {
  const auto folded = FoldCase(text);
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < folded.size()) {
    while (start < folded.size() && !IsWordByte(static_cast<unsigned char>(folded[start]))) {
      ++start;
    }
    std::size_t end = start;
    while (end < folded.size() && IsWordByte(static_cast<unsigned char>(folded[end]))) {
      ++end;
    }
    if (end > start) {
      std::string token = folded.substr(start, end - start);
      if (!IsStopWord(token)) {
        tokens.push_back(std::move(token));
      }
    }
    start = end;
  }
  return tokens;
}

std::uint64_t Fnv1a(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char byte : token) {
    hash = (hash ^ byte) * kFnvPrime;
  }
  return hash;
}

}  // namespace

std::string EmbeddingModelName(const EmbeddingProvider& provider) {
  const auto identity = provider.identity();
  if (identity.has_value() && identity->model.has_value()) {
    return *identity->model;
  }
  return "unknown";
}

HashingEmbedder::HashingEmbedder(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw ConfigError("hashing embedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

bool HashingEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("rgkb"),
      .model = std::string("hashing-bow"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  const auto buckets = static_cast<std::uint64_t>(dimensions_);
  std::vector<double> accumulated(static_cast<std::size_t>(dimensions_), 0.0);
  for (const auto& token : Tokenize(text)) {
    // Low bits pick the bucket, the top bit picks the sign.
    const auto hash = Fnv1a(token);
    accumulated[static_cast<std::size_t>(hash % buckets)] += (hash >> 63U) != 0U ? -1.0 : 1.0;
  }

  double norm = 0.0;
  for (const auto value : accumulated) {
    norm += value * value;
  }
  norm = std::sqrt(norm);

  std::vector<float> embedding(accumulated.size(), 0.0F);
  if (norm > 0.0) {
    std::transform(accumulated.begin(), accumulated.end(), embedding.begin(),
                   [norm](double value) { return static_cast<float>(value / norm); });
  }
  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  if (texts.size() > kMaxBatchSize) {
    throw ProviderError("embedding batch exceeds provider limit", false);
  }
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::size_t HashingEmbedder::max_batch_size() const {
  return kMaxBatchSize;
}

}  // namespace rgkb
