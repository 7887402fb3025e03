#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include <wikichunk/chunking/chunk.h>
#include <wikichunk/core/types.h>

namespace wikichunk::storage {

// InvalidArgument naming the first chunk without an id, or success
Result<void> requireChunkIds(const std::vector<chunking::Chunk>& chunks);

/**
 * Destination for chunk records keyed by chunk_id with insert-if-absent semantics, so
 * re-ingesting a document leaves existing records untouched.
 */
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    // true when inserted, false when the chunk_id was already present
    virtual Result<bool> put(const chunking::Chunk& chunk) = 0;

    // Inserts every absent chunk or, on error, none of them. Returns the number inserted;
    // ids already present or repeated within the batch are skipped.
    virtual Result<size_t> putAll(const std::vector<chunking::Chunk>& chunks) = 0;

    virtual bool contains(const std::string& chunk_id) const = 0;
    virtual Result<void> flush() = 0;
    virtual size_t size() const = 0;
};

// In-memory store preserving insertion order
class MemoryChunkStore : public IChunkStore {
public:
    Result<bool> put(const chunking::Chunk& chunk) override;
    Result<size_t> putAll(const std::vector<chunking::Chunk>& chunks) override;
    bool contains(const std::string& chunk_id) const override;
    Result<void> flush() override { return Result<void>(); }
    size_t size() const override { return chunks_.size(); }

    const std::vector<chunking::Chunk>& chunks() const { return chunks_; }

private:
    std::vector<chunking::Chunk> chunks_;
    std::unordered_set<std::string> ids_;
};

} // namespace wikichunk::storage
