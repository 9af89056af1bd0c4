#include "rgkb/snapshot_store.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"

#include <sqlite3.h>

#include <bit>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace rgkb {
namespace {

constexpr std::string_view kKeywordDelimiter = ", ";

class Database final {
 public:
  Database(const std::filesystem::path& path, int flags) {
    if (sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr) != SQLITE_OK) {
      std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
      sqlite3_close(db_);
      db_ = nullptr;
      throw KnowledgeError("sqlite open failed for " + path.string() + ": " + message);
    }
  }

  ~Database() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
  }

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  sqlite3* get() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw KnowledgeError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  void BindText(int index, const std::string& value) {
    Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void BindInt64(int index, std::int64_t value) {
    Check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  void BindBlob(int index, const std::vector<unsigned char>& value) {
    Check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  // True while rows remain.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw KnowledgeError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
  }

  std::string ColumnText(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
  }

  std::int64_t ColumnInt64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
  }

  std::vector<unsigned char> ColumnBlob(int column) const {
    const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt_, column));
    const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    if (data == nullptr || size == 0) {
      return {};
    }
    return std::vector<unsigned char>(data, data + size);
  }

 private:
  void Check(int rc) const {
    if (rc != SQLITE_OK) {
      throw KnowledgeError(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw KnowledgeError(message);
}

void RollbackQuietly(sqlite3* db) {
  try {
    Exec(db, "ROLLBACK;");
  } catch (const KnowledgeError& ex) {
    Logger()->warn("snapshot rollback failed: {}", ex.what());
  }
}

std::vector<unsigned char> EncodeEmbedding(const std::vector<float>& embedding) {
  std::vector<unsigned char> out{};
  out.reserve(embedding.size() * sizeof(float));
  for (const float value : embedding) {
    const auto bits = std::bit_cast<std::uint32_t>(value);
    out.push_back(static_cast<unsigned char>(bits & 0xFFU));
    out.push_back(static_cast<unsigned char>((bits >> 8U) & 0xFFU));
    out.push_back(static_cast<unsigned char>((bits >> 16U) & 0xFFU));
    out.push_back(static_cast<unsigned char>((bits >> 24U) & 0xFFU));
  }
  return out;
}

std::vector<float> DecodeEmbedding(const std::vector<unsigned char>& bytes) {
  if (bytes.size() % sizeof(float) != 0) {
    throw ParseFailure("embedding blob length is not a multiple of 4");
  }
  std::vector<float> out{};
  out.reserve(bytes.size() / sizeof(float));
  for (std::size_t i = 0; i < bytes.size(); i += sizeof(float)) {
    const std::uint32_t bits = static_cast<std::uint32_t>(bytes[i]) |
                               (static_cast<std::uint32_t>(bytes[i + 1]) << 8U) |
                               (static_cast<std::uint32_t>(bytes[i + 2]) << 16U) |
                               (static_cast<std::uint32_t>(bytes[i + 3]) << 24U);
    out.push_back(std::bit_cast<float>(bits));
  }
  return out;
}

std::string JoinKeywords(const std::vector<std::string>& keywords) {
  std::string out{};
  for (std::size_t i = 0; i < keywords.size(); ++i) {
    if (i > 0) {
      out.append(kKeywordDelimiter);
    }
    out.append(keywords[i]);
  }
  return out;
}

std::vector<std::string> SplitKeywords(const std::string& joined) {
  std::vector<std::string> out{};
  if (joined.empty()) {
    return out;
  }
  std::size_t begin = 0;
  while (true) {
    const auto pos = joined.find(kKeywordDelimiter, begin);
    if (pos == std::string::npos) {
      out.push_back(joined.substr(begin));
      break;
    }
    out.push_back(joined.substr(begin, pos - begin));
    begin = pos + kKeywordDelimiter.size();
  }
  return out;
}

std::int64_t ToNanos(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromNanos(std::int64_t ns) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
}

void CreateSchema(sqlite3* db) {
  Exec(db,
       "CREATE TABLE IF NOT EXISTS records("
       "id TEXT PRIMARY KEY,"
       "ordinal INTEGER NOT NULL,"
       "text TEXT NOT NULL,"
       "embedding BLOB NOT NULL,"
       "filename TEXT NOT NULL,"
       "source_path TEXT NOT NULL,"
       "document_type TEXT NOT NULL,"
       "chunk_index INTEGER NOT NULL,"
       "total_chunks INTEGER NOT NULL,"
       "keywords TEXT NOT NULL,"
       "chunk_type TEXT NOT NULL,"
       "start_offset INTEGER NOT NULL,"
       "language TEXT NOT NULL,"
       "domain TEXT NOT NULL"
       ");");
  Exec(db, "CREATE INDEX IF NOT EXISTS records_ordinal ON records(ordinal);");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS collection_meta("
       "key TEXT PRIMARY KEY,"
       "value TEXT NOT NULL"
       ");");
}

void PutMeta(Statement& stmt, const std::string& key, const std::string& value) {
  stmt.Reset();
  stmt.BindText(1, key);
  stmt.BindText(2, value);
  stmt.Step();
}

void WriteHeader(sqlite3* db, const SnapshotHeader& header, std::chrono::system_clock::time_point built_at) {
  Statement stmt(db, "INSERT OR REPLACE INTO collection_meta(key, value) VALUES(?1, ?2);");
  PutMeta(stmt, "collection", header.collection);
  PutMeta(stmt, "description", header.description);
  PutMeta(stmt, "version", header.version);
  PutMeta(stmt, "language", header.language);
  PutMeta(stmt, "domain", header.domain);
  PutMeta(stmt, "frameworks", header.frameworks);
  PutMeta(stmt, "content_types", header.content_types);
  PutMeta(stmt, "embedding_model", header.embedding_model);
  PutMeta(stmt, "dimensions", std::to_string(header.dimensions));
  PutMeta(stmt, "schema_version", std::to_string(kSnapshotSchemaVersion));
  PutMeta(stmt, "built_at_ns", std::to_string(ToNanos(built_at)));
}

void TouchBuiltAt(sqlite3* db, std::chrono::system_clock::time_point built_at) {
  Statement stmt(db, "INSERT OR REPLACE INTO collection_meta(key, value) VALUES(?1, ?2);");
  PutMeta(stmt, "built_at_ns", std::to_string(ToNanos(built_at)));
}

constexpr const char* kUpsertRecordSql =
    "INSERT OR REPLACE INTO records(id, ordinal, text, embedding, filename, source_path, document_type, "
    "chunk_index, total_chunks, keywords, chunk_type, start_offset, language, domain) "
    "VALUES(?1, COALESCE((SELECT ordinal FROM records WHERE id = ?1), "
    "(SELECT COALESCE(MAX(ordinal), -1) + 1 FROM records)), "
    "?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13);";

void UpsertRecord(Statement& stmt, const EmbeddingRecord& record) {
  const auto& meta = record.metadata;
  stmt.Reset();
  stmt.BindText(1, record.id);
  stmt.BindText(2, record.text);
  stmt.BindBlob(3, EncodeEmbedding(record.embedding));
  stmt.BindText(4, meta.filename);
  stmt.BindText(5, meta.source_path);
  stmt.BindText(6, DocumentTypeName(meta.document_type));
  stmt.BindInt64(7, meta.chunk_index);
  stmt.BindInt64(8, meta.total_chunks);
  stmt.BindText(9, JoinKeywords(meta.keywords));
  stmt.BindText(10, ChunkTypeName(meta.chunk_type));
  stmt.BindInt64(11, static_cast<std::int64_t>(meta.start_offset));
  stmt.BindText(12, meta.language);
  stmt.BindText(13, meta.domain);
  stmt.Step();
}

std::map<std::string, std::string> ReadMeta(sqlite3* db) {
  Statement stmt(db, "SELECT key, value FROM collection_meta;");
  std::map<std::string, std::string> meta{};
  while (stmt.Step()) {
    meta.emplace(stmt.ColumnText(0), stmt.ColumnText(1));
  }
  return meta;
}

std::int64_t ParseInteger(const std::map<std::string, std::string>& meta, const std::string& key) {
  const auto it = meta.find(key);
  if (it == meta.end()) {
    throw ParseFailure("snapshot is missing '" + key + "'");
  }
  try {
    std::size_t consumed = 0;
    const auto value = std::stoll(it->second, &consumed);
    if (consumed != it->second.size()) {
      throw ParseFailure("snapshot field '" + key + "' is not an integer");
    }
    return value;
  } catch (const std::logic_error&) {
    throw ParseFailure("snapshot field '" + key + "' is not an integer");
  }
}

std::string MetaOr(const std::map<std::string, std::string>& meta, const std::string& key) {
  const auto it = meta.find(key);
  return it == meta.end() ? std::string{} : it->second;
}

std::size_t CountRecords(sqlite3* db) {
  Statement stmt(db, "SELECT COUNT(*) FROM records;");
  if (!stmt.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(stmt.ColumnInt64(0));
}

SnapshotInfo InfoFromMeta(const std::map<std::string, std::string>& meta, std::size_t record_count) {
  SnapshotInfo info{};
  info.collection = MetaOr(meta, "collection");
  info.embedding_model = MetaOr(meta, "embedding_model");
  info.frameworks = MetaOr(meta, "frameworks");
  info.dimensions = static_cast<int>(ParseInteger(meta, "dimensions"));
  info.schema_version = static_cast<int>(ParseInteger(meta, "schema_version"));
  info.built_at = FromNanos(ParseInteger(meta, "built_at_ns"));
  info.record_count = record_count;
  if (info.schema_version != kSnapshotSchemaVersion) {
    throw ParseFailure("unsupported snapshot schema version " + std::to_string(info.schema_version));
  }
  if (info.dimensions <= 0) {
    throw ParseFailure("snapshot dimensions must be positive");
  }
  return info;
}

std::vector<EmbeddingRecord> ReadRecords(sqlite3* db, int dimensions) {
  Statement stmt(db,
                 "SELECT id, text, embedding, filename, source_path, document_type, chunk_index, total_chunks, "
                 "keywords, chunk_type, start_offset, language, domain FROM records ORDER BY ordinal, id;");
  std::vector<EmbeddingRecord> records{};
  while (stmt.Step()) {
    EmbeddingRecord record{};
    record.id = stmt.ColumnText(0);
    record.text = stmt.ColumnText(1);
    record.embedding = DecodeEmbedding(stmt.ColumnBlob(2));
    if (record.embedding.size() != static_cast<std::size_t>(dimensions)) {
      throw ParseFailure("record '" + record.id + "' has embedding dimension " +
                         std::to_string(record.embedding.size()) + ", expected " + std::to_string(dimensions));
    }
    auto& meta = record.metadata;
    meta.filename = stmt.ColumnText(3);
    meta.source_path = stmt.ColumnText(4);
    const auto document_type = ParseDocumentType(stmt.ColumnText(5));
    if (!document_type.has_value()) {
      throw ParseFailure("record '" + record.id + "' has unknown document_type");
    }
    meta.document_type = *document_type;
    meta.chunk_index = static_cast<int>(stmt.ColumnInt64(6));
    meta.total_chunks = static_cast<int>(stmt.ColumnInt64(7));
    meta.keywords = SplitKeywords(stmt.ColumnText(8));
    const auto chunk_type = ParseChunkType(stmt.ColumnText(9));
    if (!chunk_type.has_value()) {
      throw ParseFailure("record '" + record.id + "' has unknown chunk_type");
    }
    meta.chunk_type = *chunk_type;
    meta.start_offset = static_cast<std::size_t>(stmt.ColumnInt64(10));
    meta.language = stmt.ColumnText(11);
    meta.domain = stmt.ColumnText(12);
    records.push_back(std::move(record));
  }
  return records;
}

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  auto temp = path;
  temp += ".tmp";
  return temp;
}

}  // namespace

SnapshotStore::SnapshotStore(std::filesystem::path persist_directory, std::string collection)
    : persist_directory_(std::move(persist_directory)), collection_(std::move(collection)) {
  if (collection_.empty()) {
    throw ConfigError("snapshot collection name must not be empty");
  }
  path_ = persist_directory_ / (collection_ + ".sqlite3");
}

bool SnapshotStore::Exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

SnapshotInfo SnapshotStore::Write(const SnapshotHeader& header, const std::vector<EmbeddingRecord>& records) const {
  std::filesystem::create_directories(persist_directory_);
  const auto temp_path = TempPathFor(path_);
  std::error_code ec;
  std::filesystem::remove(temp_path, ec);

  const auto built_at = std::chrono::system_clock::now();
  try {
    {
      Database db(temp_path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX);
      Exec(db.get(), "PRAGMA journal_mode=OFF;");
      Exec(db.get(), "PRAGMA synchronous=NORMAL;");
      CreateSchema(db.get());
      Exec(db.get(), "BEGIN IMMEDIATE TRANSACTION;");
      try {
        WriteHeader(db.get(), header, built_at);
        Statement insert_stmt(db.get(), kUpsertRecordSql);
        for (const auto& record : records) {
          UpsertRecord(insert_stmt, record);
        }
        Exec(db.get(), "COMMIT;");
      } catch (const KnowledgeError&) {
        RollbackQuietly(db.get());
        throw;
      }
    }
    std::filesystem::rename(temp_path, path_);
  } catch (const std::exception&) {
    std::filesystem::remove(temp_path, ec);
    throw;
  }

  SnapshotInfo info{};
  info.collection = header.collection;
  info.record_count = records.size();
  info.built_at = built_at;
  info.embedding_model = header.embedding_model;
  info.dimensions = header.dimensions;
  info.schema_version = kSnapshotSchemaVersion;
  info.frameworks = header.frameworks;
  Logger()->debug("snapshot written: {} ({} records)", path_.string(), records.size());
  return info;
}

std::optional<Snapshot> SnapshotStore::Read() const {
  if (!Exists()) {
    return std::nullopt;
  }
  try {
    Database db(path_, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
    const auto meta = ReadMeta(db.get());
    Snapshot snapshot{};
    snapshot.records = ReadRecords(db.get(), static_cast<int>(ParseInteger(meta, "dimensions")));
    snapshot.info = InfoFromMeta(meta, snapshot.records.size());
    return snapshot;
  } catch (const ParseFailure&) {
    throw;
  } catch (const KnowledgeError& ex) {
    throw ParseFailure("snapshot " + path_.string() + " could not be read: " + ex.what());
  }
}

std::optional<SnapshotInfo> SnapshotStore::ReadInfo() const {
  if (!Exists()) {
    return std::nullopt;
  }
  try {
    Database db(path_, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX);
    return InfoFromMeta(ReadMeta(db.get()), CountRecords(db.get()));
  } catch (const ParseFailure&) {
    throw;
  } catch (const KnowledgeError& ex) {
    throw ParseFailure("snapshot " + path_.string() + " could not be read: " + ex.what());
  }
}

SnapshotInfo SnapshotStore::ApplyMutations(const std::vector<EmbeddingRecord>& upserts,
                                           const std::vector<std::string>& removed_ids) const {
  if (!Exists()) {
    throw NotFoundError("no snapshot to update at " + path_.string());
  }
  Database db(path_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX);
  Exec(db.get(), "BEGIN IMMEDIATE TRANSACTION;");
  try {
    Statement delete_stmt(db.get(), "DELETE FROM records WHERE id = ?1;");
    for (const auto& id : removed_ids) {
      delete_stmt.Reset();
      delete_stmt.BindText(1, id);
      delete_stmt.Step();
    }
    Statement upsert_stmt(db.get(), kUpsertRecordSql);
    for (const auto& record : upserts) {
      UpsertRecord(upsert_stmt, record);
    }
    TouchBuiltAt(db.get(), std::chrono::system_clock::now());
    Exec(db.get(), "COMMIT;");
  } catch (const KnowledgeError&) {
    RollbackQuietly(db.get());
    throw;
  }
  try {
    return InfoFromMeta(ReadMeta(db.get()), CountRecords(db.get()));
  } catch (const ParseFailure&) {
    throw;
  } catch (const KnowledgeError& ex) {
    throw ParseFailure(std::string("snapshot metadata could not be read back: ") + ex.what());
  }
}

bool SnapshotStore::Remove() const {
  std::error_code ec;
  std::filesystem::remove(TempPathFor(path_), ec);
  const bool removed = std::filesystem::remove(path_, ec);
  if (ec) {
    throw KnowledgeError("failed to remove snapshot " + path_.string() + ": " + ec.message());
  }
  return removed;
}

}  // namespace rgkb
