#pragma once

#include "rgkb/text_splitter.hpp"
#include "rgkb/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rgkb {

class DocumentIngestor {
 public:
  explicit DocumentIngestor(std::filesystem::path source_dir,
                            std::vector<std::string> extensions = {".txt"});

  // Recursively loads every file with a configured extension, sorted by path.
  // Throws NotFoundError when the source directory does not exist.
  std::vector<Document> LoadAllDocuments() const;

  std::vector<Chunk> SplitDocuments(const std::vector<Document>& documents,
                                    int chunk_size = 1000,
                                    int chunk_overlap = 200) const;

  static DocumentType Classify(std::string_view filename);
  static ChunkType ClassifyChunk(std::string_view content);
  static std::vector<std::string> ExtractKeywords(std::string_view content);
  static DocumentStats ComputeStats(const std::vector<Document>& documents);
  static const std::vector<std::string>& SecurityVocabulary();

  [[nodiscard]] const std::filesystem::path& source_dir() const { return source_dir_; }

 private:
  Document LoadDocument(const std::filesystem::path& path) const;

  std::filesystem::path source_dir_;
  std::vector<std::string> extensions_;
};

}  // namespace rgkb
