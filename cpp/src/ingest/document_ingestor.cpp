#include "rgkb/document_ingestor.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"
#include "rgkb/utf8_text.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace rgkb {
namespace {

constexpr std::size_t kMaxKeywordsPerChunk = 10;

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

template <std::size_t N>
bool ContainsAny(std::string_view haystack, const std::array<std::string_view, N>& needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](std::string_view needle) { return Contains(haystack, needle); });
}

constexpr std::array<std::string_view, 5> kVulnerabilityTerms = {
    "vulnerabilidad", "amenaza", "exploit", "vulnerability", "threat"};
constexpr std::array<std::string_view, 5> kControlTerms = {
    "control", "salvaguarda", "mitigación", "safeguard", "mitigation"};
constexpr std::array<std::string_view, 6> kImpactTerms = {
    "impacto", "daño", "consecuencia", "impact", "damage", "consequence"};
constexpr std::array<std::string_view, 5> kMethodologyTerms = {
    "metodología", "framework", "proceso", "methodology", "process"};
constexpr std::array<std::string_view, 4> kFrameworkTerms = {"iso", "nist", "magerit", "octave"};

bool HasExtension(const std::filesystem::path& path, const std::vector<std::string>& extensions) {
  const auto extension = FoldCase(path.extension().string());
  return std::any_of(extensions.begin(), extensions.end(),
                     [&](const std::string& candidate) { return FoldCase(candidate) == extension; });
}

}  // namespace

DocumentIngestor::DocumentIngestor(std::filesystem::path source_dir, std::vector<std::string> extensions)
    : source_dir_(std::move(source_dir)), extensions_(std::move(extensions)) {}

const std::vector<std::string>& DocumentIngestor::SecurityVocabulary() {
  static const std::vector<std::string> kVocabulary = {
      "magerit",     "octave",          "vulnerabilidad", "amenaza",     "riesgo",      "impacto",
      "control",     "salvaguarda",     "activo",         "confidencialidad", "integridad", "disponibilidad",
      "iso",         "nist",            "ens",            "ciberseguridad", "framework",  "metodología",
      "análisis",    "gestión",         "evaluación",     "mitigación",  "compliance",  "auditoria",
      "incidente",   "contingencia",
  };
  return kVocabulary;
}

std::vector<Document> DocumentIngestor::LoadAllDocuments() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(source_dir_, ec)) {
    throw NotFoundError("document directory not found: " + source_dir_.string());
  }

  std::vector<std::filesystem::path> paths{};
  for (auto it = std::filesystem::recursive_directory_iterator(source_dir_, ec);
       !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (it->is_regular_file() && HasExtension(it->path(), extensions_)) {
      paths.push_back(it->path());
    }
  }
  if (ec) {
    throw NotFoundError("cannot enumerate document directory " + source_dir_.string() + ": " + ec.message());
  }
  std::sort(paths.begin(), paths.end());

  std::vector<Document> documents{};
  documents.reserve(paths.size());
  for (const auto& path : paths) {
    documents.push_back(LoadDocument(path));
  }
  Logger()->info("loaded {} documents from {}", documents.size(), source_dir_.string());
  return documents;
}

Document DocumentIngestor::LoadDocument(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw NotFoundError("cannot open document: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  Document document{};
  document.content = buffer.str();
  document.source_path = path.string();
  document.filename = path.filename().string();
  document.document_type = Classify(document.filename);
  document.content_length = document.content.size();
  document.keywords_count = ExtractKeywords(document.content).size();
  return document;
}

DocumentType DocumentIngestor::Classify(std::string_view filename) {
  const auto lower = FoldCase(filename);
  if (Contains(lower, "magerit") || Contains(lower, "medicion_riesgo")) {
    return DocumentType::kRiskMethodology;
  }
  if (Contains(lower, "principios")) {
    return DocumentType::kSecurityPrinciples;
  }
  if (Contains(lower, "riesgo") && Contains(lower, "ti")) {
    return DocumentType::kItRiskManagement;
  }
  if (Contains(lower, "marco") || Contains(lower, "framework")) {
    return DocumentType::kRegulatoryFramework;
  }
  if (Contains(lower, "compliance") || Contains(lower, "cumplimiento")) {
    return DocumentType::kCompliance;
  }
  return DocumentType::kGeneral;
}

ChunkType DocumentIngestor::ClassifyChunk(std::string_view content) {
  const auto lower = FoldCase(content);
  if (ContainsAny(lower, kVulnerabilityTerms)) {
    return ChunkType::kVulnerability;
  }
  if (ContainsAny(lower, kControlTerms)) {
    return ChunkType::kControl;
  }
  if (ContainsAny(lower, kImpactTerms)) {
    return ChunkType::kImpact;
  }
  if (ContainsAny(lower, kMethodologyTerms)) {
    return ChunkType::kMethodology;
  }
  if (ContainsAny(lower, kFrameworkTerms)) {
    return ChunkType::kFrameworkReference;
  }
  return ChunkType::kConceptual;
}

std::vector<std::string> DocumentIngestor::ExtractKeywords(std::string_view content) {
  const auto lower = FoldCase(content);
  std::vector<std::string> found{};
  for (const auto& keyword : SecurityVocabulary()) {
    if (found.size() >= kMaxKeywordsPerChunk) {
      break;
    }
    if (Contains(lower, keyword)) {
      found.push_back(keyword);
    }
  }
  return found;
}

std::vector<Chunk> DocumentIngestor::SplitDocuments(const std::vector<Document>& documents,
                                                    int chunk_size,
                                                    int chunk_overlap) const {
  const RecursiveTextSplitter splitter(chunk_size, chunk_overlap);
  std::vector<Chunk> chunks{};
  for (const auto& document : documents) {
    const auto spans = splitter.SplitSpans(document.content);
    const auto total = static_cast<int>(spans.size());
    for (int index = 0; index < total; ++index) {
      const auto& span = spans[static_cast<std::size_t>(index)];
      Chunk chunk{};
      chunk.text = document.content.substr(span.start, span.length);
      chunk.id = document.filename + "_" + std::to_string(index);
      chunk.metadata.filename = document.filename;
      chunk.metadata.source_path = document.source_path;
      chunk.metadata.document_type = document.document_type;
      chunk.metadata.chunk_index = index;
      chunk.metadata.total_chunks = total;
      chunk.metadata.keywords = ExtractKeywords(chunk.text);
      chunk.metadata.chunk_type = ClassifyChunk(chunk.text);
      chunk.metadata.start_offset = span.start;
      chunk.metadata.language = document.language;
      chunk.metadata.domain = document.domain;
      chunks.push_back(std::move(chunk));
    }
  }
  Logger()->info("created {} chunks from {} documents", chunks.size(), documents.size());
  return chunks;
}

DocumentStats DocumentIngestor::ComputeStats(const std::vector<Document>& documents) {
  DocumentStats stats{};
  stats.total_documents = documents.size();
  for (const auto& document : documents) {
    stats.total_characters += document.content.size();
    stats.document_types[DocumentTypeName(document.document_type)] += 1;
    stats.languages.insert(document.language);
  }
  if (!documents.empty()) {
    stats.avg_document_length = stats.total_characters / documents.size();
  }
  return stats;
}

}  // namespace rgkb
