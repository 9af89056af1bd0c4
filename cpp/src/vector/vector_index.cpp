#include "rgkb/vector_index.hpp"

#include "rgkb/errors.hpp"
#include "rgkb/logging.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace rgkb {
namespace {

// One mutation lock per snapshot path, shared by every index in the process.
std::shared_ptr<std::mutex> CollectionLock(const std::filesystem::path& snapshot_path) {
  static std::mutex registry_mutex;
  static std::map<std::string, std::weak_ptr<std::mutex>> registry;

  const auto key = std::filesystem::weakly_canonical(snapshot_path).string();
  std::lock_guard<std::mutex> lock(registry_mutex);
  auto& slot = registry[key];
  auto existing = slot.lock();
  if (existing == nullptr) {
    existing = std::make_shared<std::mutex>();
    slot = existing;
  }
  return existing;
}

std::string ModelOf(const std::shared_ptr<BatchEmbeddingProvider>& provider) {
  return provider == nullptr ? std::string{} : EmbeddingModelName(*provider);
}

EmbeddingRecord ToRecord(const Chunk& chunk, std::vector<float> embedding) {
  EmbeddingRecord record{};
  record.id = chunk.id;
  record.embedding = std::move(embedding);
  record.text = chunk.text;
  record.metadata = chunk.metadata;
  return record;
}

}  // namespace

VectorIndex::VectorIndex(VectorIndexOptions options)
    : options_(std::move(options)), store_(options_.persist_directory, options_.collection_name) {
  if (options_.max_retries < 0) {
    throw ConfigError("max_retries must be non-negative");
  }
}

VectorIndex::VectorIndex(const KnowledgeConfig& config)
    : VectorIndex(VectorIndexOptions{
          .persist_directory = config.persist_directory,
          .collection_name = config.collection_name,
          .build_concurrency = config.build_concurrency,
          .max_retries = config.embedding.max_retries,
          .retry_backoff = std::chrono::milliseconds(config.embedding.retry_backoff_ms),
      }) {}

void VectorIndex::InitializeEmbedder(std::shared_ptr<BatchEmbeddingProvider> provider) {
  if (provider == nullptr) {
    throw ConfigError("embedding provider must not be null");
  }
  if (provider->dimensions() <= 0) {
    throw ConfigError("embedding provider dimensions must be positive");
  }
  const auto model = EmbeddingModelName(*provider);
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    embedder_ = std::move(provider);
  }
  Logger()->info("embedder initialized: {}", model);
}

void VectorIndex::InitializeEmbedder(const EmbeddingConfig& config) {
  InitializeEmbedder(std::make_shared<OpenAIEmbedder>(config));
}

bool VectorIndex::embedder_initialized() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return embedder_ != nullptr;
}

std::shared_ptr<BatchEmbeddingProvider> VectorIndex::embedder() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return embedder_;
}

std::shared_ptr<BatchEmbeddingProvider> VectorIndex::RequireEmbedder() const {
  auto provider = embedder();
  if (provider == nullptr) {
    throw NotReadyError("embedder is not initialized");
  }
  return provider;
}

SnapshotHeader VectorIndex::MakeHeader(const BatchEmbeddingProvider& provider) const {
  SnapshotHeader header{};
  header.collection = options_.collection_name;
  header.embedding_model = EmbeddingModelName(provider);
  header.dimensions = provider.dimensions();
  return header;
}

std::vector<std::vector<float>> VectorIndex::EmbedBatchWithRetry(BatchEmbeddingProvider& provider,
                                                                 const std::vector<std::string>& texts) const {
  for (int attempt = 0;; ++attempt) {
    try {
      auto vectors = provider.EmbedBatch(texts);
      if (vectors.size() != texts.size()) {
        throw ProviderError("embedding batch returned " + std::to_string(vectors.size()) + " vectors for " +
                                std::to_string(texts.size()) + " texts",
                            false);
      }
      for (const auto& vector : vectors) {
        if (vector.size() != static_cast<std::size_t>(provider.dimensions())) {
          throw ProviderError("embedding dimension mismatch", false);
        }
      }
      return vectors;
    } catch (const ProviderError& ex) {
      if (!ex.transient() || attempt >= options_.max_retries) {
        throw;
      }
      const auto delay = options_.retry_backoff * (1LL << attempt);
      Logger()->warn("embedding batch failed (attempt {}/{}), retrying in {} ms: {}", attempt + 1,
                     options_.max_retries + 1, delay.count(), ex.what());
      std::this_thread::sleep_for(delay);
    }
  }
}

std::vector<std::vector<float>> VectorIndex::EmbedTexts(BatchEmbeddingProvider& provider,
                                                        const std::vector<std::string>& texts) const {
  const std::size_t batch_size = std::max<std::size_t>(1, provider.max_batch_size());
  std::vector<std::pair<std::size_t, std::size_t>> batches{};
  for (std::size_t start = 0; start < texts.size(); start += batch_size) {
    batches.emplace_back(start, std::min(texts.size(), start + batch_size));
  }

  std::vector<std::vector<float>> out(texts.size());
  auto run_batch = [&](std::size_t batch_index) {
    const auto [start, end] = batches[batch_index];
    std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto partial = EmbedBatchWithRetry(provider, slice);
    for (std::size_t i = 0; i < partial.size(); ++i) {
      out[start + i] = std::move(partial[i]);
    }
  };

  const std::size_t worker_count =
      options_.build_concurrency > 1 ? std::min(batches.size(), static_cast<std::size_t>(options_.build_concurrency))
                                     : 1;
  if (worker_count <= 1) {
    for (std::size_t i = 0; i < batches.size(); ++i) {
      run_batch(i);
    }
    return out;
  }

  std::atomic<std::size_t> next_batch{0};
  std::atomic<bool> stop_workers{false};
  std::exception_ptr first_error{};
  std::mutex error_mutex{};

  auto worker = [&]() {
    while (true) {
      if (stop_workers.load(std::memory_order_acquire)) {
        return;
      }
      const auto index = next_batch.fetch_add(1);
      if (index >= batches.size()) {
        return;
      }
      try {
        run_batch(index);
      } catch (...) {
        std::lock_guard<std::mutex> error_lock(error_mutex);
        if (first_error == nullptr) {
          first_error = std::current_exception();
        }
        stop_workers.store(true, std::memory_order_release);
        return;
      }
    }
  };

  std::vector<std::thread> workers{};
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }
  if (first_error != nullptr) {
    std::rethrow_exception(first_error);
  }
  return out;
}

std::vector<EmbeddingRecord> VectorIndex::EmbedChunks(const std::vector<Chunk>& chunks) const {
  auto provider = RequireEmbedder();
  std::vector<std::string> texts{};
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }
  auto vectors = EmbedTexts(*provider, texts);
  std::vector<EmbeddingRecord> records{};
  records.reserve(chunks.size());
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    records.push_back(ToRecord(chunks[i], std::move(vectors[i])));
  }
  return records;
}

std::unique_ptr<VectorIndex::State> VectorIndex::MakeState(int dimensions,
                                                           std::vector<EmbeddingRecord> records,
                                                           std::optional<SnapshotInfo> info) {
  auto state = std::make_unique<State>();
  state->engine = std::make_unique<FlatVectorEngine>(dimensions);
  std::vector<std::uint64_t> ordinals{};
  std::vector<std::vector<float>> vectors{};
  ordinals.reserve(records.size());
  vectors.reserve(records.size());
  for (auto& record : records) {
    const auto existing = state->ordinals.find(record.id);
    if (existing != state->ordinals.end()) {
      throw KnowledgeError("duplicate record id: " + record.id);
    }
    const auto ordinal = state->next_ordinal++;
    ordinals.push_back(ordinal);
    vectors.push_back(record.embedding);
    state->ordinals.emplace(record.id, ordinal);
    state->records.emplace(ordinal, std::move(record));
  }
  state->engine->AddBatch(ordinals, vectors);
  state->info = std::move(info);
  return state;
}

SnapshotInfo VectorIndex::Build(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    throw EmptyInputError("cannot build a vector index from zero chunks");
  }
  const auto collection_lock = CollectionLock(store_.path());
  std::lock_guard<std::mutex> mutation_lock(*collection_lock);

  auto provider = RequireEmbedder();
  const auto started = std::chrono::steady_clock::now();
  auto records = EmbedChunks(chunks);
  const auto info = store_.Write(MakeHeader(*provider), records);
  auto state = MakeState(provider->dimensions(), std::move(records), info);
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(state);
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  Logger()->info("vector index built: collection={} records={} model={} ({} ms)", options_.collection_name,
                 info.record_count, info.embedding_model, elapsed.count());
  return info;
}

std::optional<SnapshotInfo> VectorIndex::Load() {
  std::optional<Snapshot> snapshot{};
  try {
    snapshot = store_.Read();
  } catch (const ParseFailure& ex) {
    Logger()->warn("snapshot {} is unreadable, treating as absent: {}", store_.path().string(), ex.what());
    return std::nullopt;
  }
  if (!snapshot.has_value()) {
    Logger()->info("no snapshot for collection {}", options_.collection_name);
    return std::nullopt;
  }
  if (snapshot->records.empty()) {
    Logger()->warn("snapshot {} holds no records, treating as absent", store_.path().string());
    return std::nullopt;
  }

  auto provider = embedder();
  if (provider != nullptr) {
    const auto model = EmbeddingModelName(*provider);
    if (snapshot->info.dimensions != provider->dimensions() || snapshot->info.embedding_model != model) {
      Logger()->warn("snapshot {} was built with {} ({} dims), embedder is {} ({} dims); treating as absent",
                     store_.path().string(), snapshot->info.embedding_model, snapshot->info.dimensions, model,
                     provider->dimensions());
      return std::nullopt;
    }
  }

  auto info = snapshot->info;
  auto state = MakeState(info.dimensions, std::move(snapshot->records), info);
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(state);
  }
  Logger()->info("vector index loaded: collection={} records={}", options_.collection_name, info.record_count);
  return info;
}

bool VectorIndex::ShouldRebuild(const std::filesystem::path& source_dir) const {
  std::optional<SnapshotInfo> info = snapshot_info();
  if (!info.has_value()) {
    try {
      info = store_.ReadInfo();
    } catch (const ParseFailure& ex) {
      Logger()->warn("snapshot metadata unreadable, rebuild required: {}", ex.what());
      return true;
    }
  }
  if (!info.has_value()) {
    return true;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(source_dir, ec)) {
    Logger()->warn("source directory {} not found; keeping existing snapshot", source_dir.string());
    return false;
  }

  for (std::filesystem::recursive_directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const auto modified = it->last_write_time(ec);
    if (ec) {
      continue;
    }
    if (std::chrono::file_clock::to_sys(modified) > info->built_at) {
      Logger()->info("{} changed since the last build", it->path().string());
      return true;
    }
  }
  if (ec) {
    Logger()->warn("scanning {} failed: {}", source_dir.string(), ec.message());
  }
  return false;
}

SnapshotInfo VectorIndex::Add(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    throw EmptyInputError("no chunks to add");
  }
  const auto collection_lock = CollectionLock(store_.path());
  std::lock_guard<std::mutex> mutation_lock(*collection_lock);
  if (!loaded()) {
    throw NotReadyError("vector index is not loaded");
  }

  auto records = EmbedChunks(chunks);
  const auto info = store_.ApplyMutations(records, {});

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    throw NotReadyError("vector index was unloaded during add");
  }
  for (auto& record : records) {
    const auto existing = state_->ordinals.find(record.id);
    std::uint64_t ordinal = 0;
    if (existing != state_->ordinals.end()) {
      ordinal = existing->second;
    } else {
      ordinal = state_->next_ordinal++;
      state_->ordinals.emplace(record.id, ordinal);
    }
    state_->engine->StageAdd(ordinal, record.embedding);
    state_->records[ordinal] = std::move(record);
  }
  state_->engine->CommitStaged();
  state_->info = info;
  Logger()->info("added {} records to {}", chunks.size(), options_.collection_name);
  return info;
}

SnapshotInfo VectorIndex::Update(const std::string& id, const Chunk& chunk) {
  const auto collection_lock = CollectionLock(store_.path());
  std::lock_guard<std::mutex> mutation_lock(*collection_lock);
  if (!loaded()) {
    throw NotReadyError("vector index is not loaded");
  }
  if (!Get(id).has_value()) {
    throw NotFoundError("no record with id " + id);
  }

  Chunk replacement = chunk;
  replacement.id = id;
  auto records = EmbedChunks({replacement});
  const auto info = store_.ApplyMutations(records, {id});

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    throw NotReadyError("vector index was unloaded during update");
  }
  const auto old_ordinal = state_->ordinals.at(id);
  state_->engine->StageRemove(old_ordinal);
  state_->records.erase(old_ordinal);
  const auto ordinal = state_->next_ordinal++;
  state_->ordinals[id] = ordinal;
  state_->engine->StageAdd(ordinal, records.front().embedding);
  state_->engine->CommitStaged();
  state_->records.emplace(ordinal, std::move(records.front()));
  state_->info = info;
  Logger()->debug("updated record {}", id);
  return info;
}

SnapshotInfo VectorIndex::Remove(const std::vector<std::string>& ids) {
  const auto collection_lock = CollectionLock(store_.path());
  std::lock_guard<std::mutex> mutation_lock(*collection_lock);
  if (!loaded()) {
    throw NotReadyError("vector index is not loaded");
  }
  const auto info = store_.ApplyMutations({}, ids);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    throw NotReadyError("vector index was unloaded during remove");
  }
  for (const auto& id : ids) {
    const auto it = state_->ordinals.find(id);
    if (it == state_->ordinals.end()) {
      continue;
    }
    state_->engine->StageRemove(it->second);
    state_->records.erase(it->second);
    state_->ordinals.erase(it);
  }
  state_->engine->CommitStaged();
  state_->info = info;
  return info;
}

std::vector<float> VectorIndex::EmbedQuery(const std::string& query) const {
  auto provider = RequireEmbedder();
  try {
    auto vector = provider->Embed(query);
    if (vector.size() != static_cast<std::size_t>(provider->dimensions())) {
      throw ProviderError("query embedding dimension mismatch", false);
    }
    return vector;
  } catch (const ProviderError& ex) {
    throw RetrievalUnavailableError(std::string("query embedding failed: ") + ex.what());
  }
}

std::vector<ScoredRecord> VectorIndex::SimilaritySearch(const std::vector<float>& query, int top_k) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    throw NotReadyError("vector index is not loaded");
  }
  std::vector<ScoredRecord> out{};
  for (const auto& [ordinal, score] : state_->engine->Search(query, top_k)) {
    const auto it = state_->records.find(ordinal);
    if (it == state_->records.end()) {
      continue;
    }
    out.push_back(ScoredRecord{it->second, score});
  }
  return out;
}

std::optional<EmbeddingRecord> VectorIndex::Get(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    return std::nullopt;
  }
  const auto it = state_->ordinals.find(id);
  if (it == state_->ordinals.end()) {
    return std::nullopt;
  }
  return state_->records.at(it->second);
}

std::vector<std::string> VectorIndex::RecordIds() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    return {};
  }
  std::vector<std::pair<std::uint64_t, std::string>> ordered{};
  ordered.reserve(state_->ordinals.size());
  for (const auto& [id, ordinal] : state_->ordinals) {
    ordered.emplace_back(ordinal, id);
  }
  std::sort(ordered.begin(), ordered.end());
  std::vector<std::string> ids{};
  ids.reserve(ordered.size());
  for (auto& entry : ordered) {
    ids.push_back(std::move(entry.second));
  }
  return ids;
}

bool VectorIndex::loaded() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_ != nullptr;
}

std::size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_ == nullptr ? 0 : state_->records.size();
}

std::optional<SnapshotInfo> VectorIndex::snapshot_info() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (state_ == nullptr) {
    return std::nullopt;
  }
  return state_->info;
}

bool VectorIndex::SnapshotExists() const {
  return store_.Exists();
}

IndexStats VectorIndex::Stats() const {
  IndexStats stats{};
  stats.collection_name = options_.collection_name;
  stats.persist_directory = options_.persist_directory.string();
  stats.snapshot_exists = store_.Exists();

  std::shared_lock<std::shared_mutex> lock(mutex_);
  stats.embedding_model = ModelOf(embedder_);
  if (state_ == nullptr) {
    return stats;
  }
  stats.initialized = true;
  stats.record_count = state_->records.size();
  if (stats.embedding_model.empty() && state_->info.has_value()) {
    stats.embedding_model = state_->info->embedding_model;
  }
  for (const auto& [ordinal, record] : state_->records) {
    stats.document_types[DocumentTypeName(record.metadata.document_type)] += 1;
    stats.languages.insert(record.metadata.language);
  }
  return stats;
}

void VectorIndex::Unload() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  state_.reset();
}

void VectorIndex::Cleanup() {
  const auto collection_lock = CollectionLock(store_.path());
  std::lock_guard<std::mutex> mutation_lock(*collection_lock);
  Unload();
  if (store_.Remove()) {
    Logger()->info("snapshot {} removed", store_.path().string());
  }
}

}  // namespace rgkb
