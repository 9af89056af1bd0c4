#pragma once

#include "rgkb/types.hpp"
#include "rgkb/vector_index.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rgkb {

struct RetrievalTestDetail {
  std::string query;
  bool succeeded = false;
  std::size_t results_count = 0;
  std::optional<std::string> top_result;
  std::optional<std::string> error;
};

struct RetrievalTestReport {
  std::size_t queries_tested = 0;
  std::size_t successful_searches = 0;
  std::size_t failed_searches = 0;
  std::size_t total_results_found = 0;
  std::vector<RetrievalTestDetail> details;
};

// Query-time search over a VectorIndex. Provider failures while embedding the query produce a
// kDegraded outcome instead of an exception; a missing index still throws NotReadyError.
class Retriever {
 public:
  explicit Retriever(std::shared_ptr<const VectorIndex> index, RetrieverConfig config = {});

  // Throws ConfigError for k <= 0, fetch_k < k or lambda_mult outside [0, 1].
  void Configure(const RetrieverConfig& config);
  [[nodiscard]] RetrieverConfig config() const;

  RetrievalOutcome Search(const std::string& query,
                          int max_results = 5,
                          const MetadataFilter& filter = {},
                          const CancellationToken& cancel = CancellationToken());

  RetrievalOutcome SearchByDocumentType(const std::string& query,
                                        const std::vector<std::string>& document_types,
                                        int max_results = 5,
                                        const CancellationToken& cancel = CancellationToken());

  // Keeps hits whose keyword list holds a required keyword or whose text contains one,
  // ignoring case. Examines 2 * max_results candidates.
  RetrievalOutcome SearchByKeywords(const std::string& query,
                                    const std::vector<std::string>& required_keywords,
                                    int max_results = 5,
                                    const CancellationToken& cancel = CancellationToken());

  RetrievalTestReport TestRetrieval(const std::vector<std::string>& queries = DefaultTestQueries());

  [[nodiscard]] RetrieverStats Stats() const;
  void ResetStats();

  static std::vector<std::string> DefaultTestQueries();

 private:
  RetrievalOutcome Retrieve(const std::string& query,
                            int max_results,
                            const MetadataFilter& filter,
                            const CancellationToken& cancel) const;
  void RecordSearch(const std::string& query, std::size_t results_count);

  std::shared_ptr<const VectorIndex> index_;
  mutable std::mutex mutex_{};
  RetrieverConfig config_{};
  std::uint64_t total_searches_ = 0;
  double avg_results_per_search_ = 0.0;
  std::map<std::string, std::uint64_t> term_frequencies_{};
};

}  // namespace rgkb
