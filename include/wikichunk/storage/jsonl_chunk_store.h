#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include <wikichunk/storage/chunk_store.h>

namespace wikichunk::storage {

inline constexpr size_t DEFAULT_STORE_BATCH_SIZE = 100;

/**
 * Append-only JSON Lines store, one chunk record per line.
 *
 * IDs already in the file are loaded on open; new records are buffered and appended once
 * batch_size of them are pending, on flush(), or on destruction.
 *
 * A flush appends all pending records in one write or, when the write fails, truncates the
 * file back to its previous size and keeps them pending. A put whose automatic flush fails
 * is rolled back, so its ids can be stored again later.
 */
class JsonlChunkStore : public IChunkStore {
public:
    static Result<std::unique_ptr<JsonlChunkStore>>
    open(const std::filesystem::path& path, size_t batch_size = DEFAULT_STORE_BATCH_SIZE);

    ~JsonlChunkStore() override;

    JsonlChunkStore(const JsonlChunkStore&) = delete;
    JsonlChunkStore& operator=(const JsonlChunkStore&) = delete;

    Result<bool> put(const chunking::Chunk& chunk) override;
    Result<size_t> putAll(const std::vector<chunking::Chunk>& chunks) override;
    bool contains(const std::string& chunk_id) const override;
    Result<void> flush() override;
    size_t size() const override { return ids_.size(); }

    size_t pendingCount() const { return pending_.size(); }
    const std::filesystem::path& path() const { return path_; }

private:
    JsonlChunkStore(std::filesystem::path path, size_t batch_size);

    Result<void> loadExisting();

    std::filesystem::path path_;
    size_t batch_size_;
    std::unordered_set<std::string> ids_;
    std::vector<chunking::Chunk> pending_;
};

} // namespace wikichunk::storage
