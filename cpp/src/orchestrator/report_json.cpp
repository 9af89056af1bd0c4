#include "rgkb/report_json.hpp"

#include <cstdio>
#include <ctime>

namespace rgkb {

using json = nlohmann::json;

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
  const std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
  std::tm utc{};
  gmtime_r(&raw, &utc);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%06lldZ", date, static_cast<long long>(micros));
  return out;
}

json ToJson(const SearchHit& hit) {
  json out = {
      {"id", hit.id},
      {"content", hit.content},
      {"relevance_rank", hit.relevance_rank},
      {"document_type", DocumentTypeName(hit.metadata.document_type)},
      {"filename", hit.metadata.filename},
      {"keywords", hit.metadata.keywords},
      {"metadata",
       {
           {"source", hit.metadata.source_path},
           {"chunk_type", ChunkTypeName(hit.metadata.chunk_type)},
           {"start_offset", hit.metadata.start_offset},
           {"language", hit.metadata.language},
           {"domain", hit.metadata.domain},
       }},
      {"chunk_info",
       {
           {"chunk_id", hit.id},
           {"chunk_index", hit.metadata.chunk_index},
           {"total_chunks", hit.metadata.total_chunks},
       }},
  };
  out["score"] = hit.score.has_value() ? json(*hit.score) : json(nullptr);
  if (!hit.matched_keywords.empty()) {
    out["matched_keywords"] = hit.matched_keywords;
  }
  return out;
}

json ToJson(const IndexStats& stats) {
  return {
      {"status", stats.initialized ? "initialized" : "not_initialized"},
      {"total_documents", stats.record_count},
      {"collection_name", stats.collection_name},
      {"persist_directory", stats.persist_directory},
      {"snapshot_exists", stats.snapshot_exists},
      {"document_types", stats.document_types},
      {"languages", stats.languages},
      {"embedding_model", stats.embedding_model},
  };
}

json ToJson(const RetrieverStats& stats) {
  json top = json::object();
  for (const auto& [term, count] : stats.top_search_terms) {
    top[term] = count;
  }
  return {
      {"total_searches", stats.total_searches},
      {"avg_results_per_search", stats.avg_results_per_search},
      {"top_search_terms", top},
      {"config",
       {
           {"search_type", SearchTypeName(stats.config.search_type)},
           {"k", stats.config.k},
           {"fetch_k", stats.config.fetch_k},
           {"lambda_mult", stats.config.lambda_mult},
       }},
  };
}

json ToJson(const RetrievalTestReport& report) {
  json details = json::array();
  for (const auto& detail : report.details) {
    json entry = {
        {"query", detail.query},
        {"status", detail.succeeded ? "success" : "failed"},
    };
    if (detail.succeeded) {
      entry["results_count"] = detail.results_count;
      entry["top_result"] = detail.top_result.has_value() ? json(*detail.top_result) : json(nullptr);
    } else {
      entry["error"] = detail.error.value_or("");
    }
    details.push_back(std::move(entry));
  }
  return {
      {"queries_tested", report.queries_tested},
      {"successful_searches", report.successful_searches},
      {"failed_searches", report.failed_searches},
      {"total_results_found", report.total_results_found},
      {"details", details},
  };
}

json ToJson(const HealthReport& report) {
  json out = {
      {"status", HealthStatusName(report.status)},
      {"timestamp", FormatTimestamp(report.timestamp)},
      {"test_search_successful", report.test_search_successful},
  };
  if (report.error.has_value()) {
    out["error"] = *report.error;
    out["components"] = json::object();
    return out;
  }
  out["components"] = {
      {"initialized", report.components.initialized},
      {"docs_accessible", report.components.docs_accessible},
      {"embeddings", report.components.embedder},
      {"vector_store", report.components.vector_index},
      {"snapshot_persisted", report.components.snapshot_persisted},
      {"retriever", report.components.retriever},
  };
  return out;
}

json ToJson(const KnowledgeStats& stats) {
  json out = {
      {"state", OrchestratorStateName(stats.state)},
      {"is_initialized", stats.state == OrchestratorState::kReady || stats.state == OrchestratorState::kDegraded},
      {"documents_loaded", stats.documents_loaded},
      {"chunks_created", stats.chunks_created},
      {"retrieval_calls", stats.retrieval_calls},
      {"docs_path", stats.docs_path},
      {"persist_directory", stats.persist_directory},
      {"vectorstore", ToJson(stats.index)},
  };
  out["initialization_time"] =
      stats.initialization_seconds.has_value() ? json(*stats.initialization_seconds) : json(nullptr);
  if (stats.last_search.has_value()) {
    out["last_search"] = {
        {"query", stats.last_search->query},
        {"results_count", stats.last_search->results_count},
        {"timestamp", FormatTimestamp(stats.last_search->timestamp)},
    };
  } else {
    out["last_search"] = nullptr;
  }
  if (stats.retriever.has_value()) {
    out["retriever"] = ToJson(*stats.retriever);
  }
  return out;
}

}  // namespace rgkb
