#pragma once

#include "rgkb/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rgkb {

inline constexpr int kSnapshotSchemaVersion = 1;

// Collection-level descriptors written alongside every snapshot.
struct SnapshotHeader {
  std::string collection;
  std::string embedding_model;
  int dimensions = 0;
  std::string description = "Security Knowledge Base";
  std::string version = "1.0";
  std::string language = "es";
  std::string domain = "cybersecurity";
  std::string frameworks = "MAGERIT, OCTAVE, ISO27001, NIST";
  std::string content_types = "methodologies, principles, frameworks, compliance";
};

struct Snapshot {
  SnapshotInfo info;
  std::vector<EmbeddingRecord> records;
};

// SQLite-backed persistence for one collection under a persist directory.
// Full writes go to a temporary file that replaces the snapshot atomically, so readers
// observe either the previous snapshot or the new one.
class SnapshotStore {
 public:
  SnapshotStore(std::filesystem::path persist_directory, std::string collection);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] const std::filesystem::path& persist_directory() const { return persist_directory_; }
  [[nodiscard]] bool Exists() const;

  // Replaces the snapshot with `records` in the given order. Returns the written info.
  SnapshotInfo Write(const SnapshotHeader& header, const std::vector<EmbeddingRecord>& records) const;

  // nullopt when no snapshot file exists. Throws ParseFailure when the file cannot be decoded.
  std::optional<Snapshot> Read() const;
  std::optional<SnapshotInfo> ReadInfo() const;

  // Upserts and removals applied in one transaction; refreshes the build timestamp.
  // Throws NotFoundError when no snapshot exists yet.
  SnapshotInfo ApplyMutations(const std::vector<EmbeddingRecord>& upserts,
                              const std::vector<std::string>& removed_ids) const;

  // Returns true when a snapshot file was removed.
  bool Remove() const;

 private:
  std::filesystem::path persist_directory_;
  std::string collection_;
  std::filesystem::path path_;
};

}  // namespace rgkb
