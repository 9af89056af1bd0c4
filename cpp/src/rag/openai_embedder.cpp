#include "rgkb/embeddings.hpp"

#include "rgkb/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace rgkb {
namespace {

using json = nlohmann::json;

bool IsTransientStatus(long status) {
  return status == 408 || status == 429 || status >= 500;
}

std::string TrimmedBody(const std::string& body) {
  constexpr std::size_t kMaxBody = 256;
  return body.size() <= kMaxBody ? body : body.substr(0, kMaxBody) + "...";
}

std::string EmbeddingsUrl(const std::string& base_url) {
  if (!base_url.empty() && base_url.back() == '/') {
    return base_url + "embeddings";
  }
  return base_url + "/embeddings";
}

}  // namespace

OpenAIEmbedder::OpenAIEmbedder(EmbeddingConfig config, EmbeddingTransport transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (config_.api_key.empty()) {
    throw ConfigError("embedding provider credential is missing (set OPENAI_API_KEY)");
  }
  if (config_.dimensions <= 0) {
    throw ConfigError("embedding dimensions must be positive");
  }
  if (config_.max_batch_size <= 0) {
    throw ConfigError("embedding max_batch_size must be positive");
  }
  if (!transport_) {
    throw ConfigError("embedding transport must be callable");
  }
}

int OpenAIEmbedder::dimensions() const {
  return config_.dimensions;
}

bool OpenAIEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> OpenAIEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("openai"),
      .model = config_.model,
      .dimensions = config_.dimensions,
      .normalized = true,
  };
}

std::size_t OpenAIEmbedder::max_batch_size() const {
  return static_cast<std::size_t>(config_.max_batch_size);
}

std::vector<float> OpenAIEmbedder::Embed(const std::string& text) {
  auto batch = EmbedBatch({text});
  return std::move(batch.front());
}

std::vector<std::vector<float>> OpenAIEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  if (texts.empty()) {
    return {};
  }
  if (texts.size() > max_batch_size()) {
    throw ProviderError("embedding batch exceeds provider limit", false);
  }

  net::HttpRequest request{};
  request.url = EmbeddingsUrl(config_.base_url);
  try {
    // Stray non-UTF-8 bytes are sent as U+FFFD rather than failing the request.
    request.body = json{{"model", config_.model}, {"input", texts}}.dump(-1, ' ', false,
                                                                        json::error_handler_t::replace);
  } catch (const json::exception& ex) {
    throw ProviderError(std::string("cannot encode embedding request: ") + ex.what(), false);
  }
  request.headers = {{"Authorization", "Bearer " + config_.api_key}};
  request.timeout_ms = config_.timeout_ms;

  net::HttpResponse response{};
  try {
    response = transport_(request);
  } catch (const ProviderError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProviderError(std::string("embedding request failed: ") + ex.what(), true);
  }

  if (response.status < 200 || response.status >= 300) {
    throw ProviderError("embedding request returned HTTP " + std::to_string(response.status) + ": " +
                            TrimmedBody(response.body),
                        IsTransientStatus(response.status));
  }

  std::vector<std::vector<float>> out(texts.size());
  try {
    const auto body = json::parse(response.body);
    const auto& data = body.at("data");
    if (!data.is_array() || data.size() != texts.size()) {
      throw ProviderError("embedding response count mismatch", false);
    }
    std::vector<bool> filled(texts.size(), false);
    for (std::size_t position = 0; position < data.size(); ++position) {
      const auto& item = data[position];
      const auto index = item.contains("index") ? item.at("index").get<std::size_t>() : position;
      if (index >= out.size() || filled[index]) {
        throw ProviderError("embedding response index out of range", false);
      }
      auto vector = item.at("embedding").get<std::vector<float>>();
      if (vector.size() != static_cast<std::size_t>(config_.dimensions)) {
        throw ProviderError("embedding response dimension mismatch: expected " +
                                std::to_string(config_.dimensions) + ", got " + std::to_string(vector.size()),
                            false);
      }
      out[index] = std::move(vector);
      filled[index] = true;
    }
  } catch (const json::exception& ex) {
    throw ProviderError(std::string("malformed embedding response: ") + ex.what(), false);
  }
  return out;
}

}  // namespace rgkb
