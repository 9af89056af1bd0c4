#include "rgkb/retriever.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"
#include "rgkb/search.hpp"
#include "rgkb/utf8_text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string_view>
#include <utility>

namespace rgkb {
namespace {

std::vector<std::string> SplitWhitespaceTokens(std::string_view text) {
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
      ++start;
    }
    if (start >= text.size()) {
      break;
    }
    std::size_t end = start;
    while (end < text.size() && std::isspace(static_cast<unsigned char>(text[end])) == 0) {
      ++end;
    }
    tokens.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return tokens;
}

void ValidateRetrieverConfig(const RetrieverConfig& config) {
  if (config.k <= 0) {
    throw ConfigError("retriever k must be positive");
  }
  if (config.fetch_k < config.k) {
    throw ConfigError("retriever fetch_k must be >= k");
  }
  if (config.lambda_mult < 0.0F || config.lambda_mult > 1.0F) {
    throw ConfigError("retriever lambda_mult must be in [0, 1]");
  }
}

RetrievalOutcome Cancelled() {
  RetrievalOutcome outcome{};
  outcome.status = RetrievalStatus::kCancelled;
  return outcome;
}

SearchHit ToHit(ScoredRecord scored) {
  SearchHit hit{};
  hit.id = std::move(scored.record.id);
  hit.content = std::move(scored.record.text);
  hit.metadata = std::move(scored.record.metadata);
  hit.score = scored.score;
  return hit;
}

}  // namespace

Retriever::Retriever(std::shared_ptr<const VectorIndex> index, RetrieverConfig config) : index_(std::move(index)) {
  if (index_ == nullptr) {
    throw ConfigError("retriever requires a vector index");
  }
  Configure(config);
}

void Retriever::Configure(const RetrieverConfig& config) {
  ValidateRetrieverConfig(config);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
  }
  Logger()->info("retriever configured: {}, k={}, fetch_k={}, lambda={}", SearchTypeName(config.search_type), config.k,
                 config.fetch_k, config.lambda_mult);
}

RetrieverConfig Retriever::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

RetrievalOutcome Retriever::Retrieve(const std::string& query,
                                     int max_results,
                                     const MetadataFilter& filter,
                                     const CancellationToken& cancel) const {
  if (cancel.cancelled()) {
    return Cancelled();
  }
  if (max_results <= 0) {
    return {};
  }
  const auto config = this->config();
  const int k = std::max(config.k, max_results);
  const int fetch_k = std::max(config.fetch_k, k);

  std::vector<float> query_vector{};
  try {
    query_vector = index_->EmbedQuery(query);
  } catch (const NotReadyError&) {
    throw;
  } catch (const KnowledgeError& ex) {
    Logger()->warn("retrieval degraded for '{}': {}", QueryPreview(query), ex.what());
    RetrievalOutcome outcome{};
    outcome.status = RetrievalStatus::kDegraded;
    outcome.error = ex.what();
    return outcome;
  }
  if (cancel.cancelled()) {
    return Cancelled();
  }

  std::vector<ScoredRecord> candidates{};
  switch (config.search_type) {
    case SearchType::kSimilarity:
      candidates = index_->SimilaritySearch(query_vector, k);
      break;
    case SearchType::kSimilarityScoreThreshold: {
      candidates = index_->SimilaritySearch(query_vector, k);
      const auto threshold = config.score_threshold;
      candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                      [threshold](const ScoredRecord& c) { return c.score < threshold; }),
                       candidates.end());
      break;
    }
    case SearchType::kMmr: {
      auto pool = index_->SimilaritySearch(query_vector, fetch_k);
      std::vector<std::vector<float>> vectors{};
      vectors.reserve(pool.size());
      for (const auto& candidate : pool) {
        vectors.push_back(candidate.record.embedding);
      }
      for (const auto index : SelectMaximalMarginalRelevance(query_vector, vectors, k, config.lambda_mult)) {
        candidates.push_back(std::move(pool[index]));
      }
      break;
    }
  }
  if (cancel.cancelled()) {
    return Cancelled();
  }

  RetrievalOutcome outcome{};
  for (auto& candidate : candidates) {
    if (!filter.empty() && !MatchesFilter(candidate.record.metadata, filter)) {
      continue;
    }
    auto hit = ToHit(std::move(candidate));
    hit.relevance_rank = static_cast<int>(outcome.hits.size()) + 1;
    outcome.hits.push_back(std::move(hit));
    if (outcome.hits.size() >= static_cast<std::size_t>(max_results)) {
      break;
    }
  }
  return outcome;
}

RetrievalOutcome Retriever::Search(const std::string& query,
                                   int max_results,
                                   const MetadataFilter& filter,
                                   const CancellationToken& cancel) {
  auto outcome = Retrieve(query, max_results, filter, cancel);
  if (outcome.ok()) {
    RecordSearch(query, outcome.hits.size());
    Logger()->info("search completed: '{}' -> {} results", QueryPreview(query), outcome.hits.size());
  }
  return outcome;
}

RetrievalOutcome Retriever::SearchByDocumentType(const std::string& query,
                                                 const std::vector<std::string>& document_types,
                                                 int max_results,
                                                 const CancellationToken& cancel) {
  MetadataFilter filter{};
  filter.emplace("document_type", AnyOf{document_types});
  return Search(query, max_results, filter, cancel);
}

RetrievalOutcome Retriever::SearchByKeywords(const std::string& query,
                                             const std::vector<std::string>& required_keywords,
                                             int max_results,
                                             const CancellationToken& cancel) {
  auto outcome = Retrieve(query, max_results * 2, {}, cancel);
  if (!outcome.ok()) {
    return outcome;
  }

  std::vector<std::string> lowered_keywords{};
  lowered_keywords.reserve(required_keywords.size());
  for (const auto& keyword : required_keywords) {
    lowered_keywords.push_back(FoldCase(keyword));
  }

  std::vector<SearchHit> kept{};
  for (auto& hit : outcome.hits) {
    if (kept.size() >= static_cast<std::size_t>(std::max(max_results, 0))) {
      break;
    }
    const auto content = FoldCase(hit.content);
    std::vector<std::string> chunk_keywords{};
    chunk_keywords.reserve(hit.metadata.keywords.size());
    for (const auto& keyword : hit.metadata.keywords) {
      chunk_keywords.push_back(FoldCase(keyword));
    }

    std::vector<std::string> matched{};
    for (std::size_t i = 0; i < required_keywords.size(); ++i) {
      const auto& needle = lowered_keywords[i];
      const bool in_keywords = std::find(chunk_keywords.begin(), chunk_keywords.end(), needle) != chunk_keywords.end();
      if (in_keywords || content.find(needle) != std::string::npos) {
        matched.push_back(required_keywords[i]);
      }
    }
    if (matched.empty()) {
      continue;
    }
    hit.matched_keywords = std::move(matched);
    hit.relevance_rank = static_cast<int>(kept.size()) + 1;
    kept.push_back(std::move(hit));
  }
  outcome.hits = std::move(kept);
  RecordSearch(query, outcome.hits.size());
  Logger()->info("keyword search: {} results for {} keywords", outcome.hits.size(), required_keywords.size());
  return outcome;
}

RetrievalTestReport Retriever::TestRetrieval(const std::vector<std::string>& queries) {
  RetrievalTestReport report{};
  report.queries_tested = queries.size();
  for (const auto& query : queries) {
    RetrievalTestDetail detail{};
    detail.query = query;
    try {
      auto outcome = Search(query, 3);
      if (outcome.ok()) {
        detail.succeeded = true;
        detail.results_count = outcome.hits.size();
        if (!outcome.hits.empty()) {
          detail.top_result = outcome.hits.front().metadata.filename;
        }
      } else {
        detail.error = outcome.error.value_or("retrieval unavailable");
      }
    } catch (const KnowledgeError& ex) {
      detail.error = ex.what();
    }
    if (detail.succeeded) {
      ++report.successful_searches;
      report.total_results_found += detail.results_count;
    } else {
      ++report.failed_searches;
    }
    report.details.push_back(std::move(detail));
  }
  return report;
}

void Retriever::RecordSearch(const std::string& query, std::size_t results_count) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++total_searches_;
  const double total = static_cast<double>(total_searches_);
  const double average = (avg_results_per_search_ * (total - 1.0) + static_cast<double>(results_count)) / total;
  avg_results_per_search_ = std::round(average * 100.0) / 100.0;
  for (const auto& word : SplitWhitespaceTokens(ScrubUtf8(FoldCase(query)))) {
    if (word.size() > 3) {
      ++term_frequencies_[word];
    }
  }
}

RetrieverStats Retriever::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RetrieverStats stats{};
  stats.total_searches = total_searches_;
  stats.avg_results_per_search = avg_results_per_search_;
  stats.term_frequencies = term_frequencies_;
  stats.config = config_;

  std::vector<std::pair<std::string, std::uint64_t>> terms(term_frequencies_.begin(), term_frequencies_.end());
  std::stable_sort(terms.begin(), terms.end(), [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
  if (terms.size() > 10) {
    terms.resize(10);
  }
  stats.top_search_terms = std::move(terms);
  return stats;
}

void Retriever::ResetStats() {
  std::lock_guard<std::mutex> lock(mutex_);
  total_searches_ = 0;
  avg_results_per_search_ = 0.0;
  term_frequencies_.clear();
}

std::vector<std::string> Retriever::DefaultTestQueries() {
  return {
      "vulnerabilidad",
      "MAGERIT",
      "análisis de riesgo",
      "controles de seguridad",
      "principios de seguridad",
  };
}

}  // namespace rgkb
