#include <wikichunk/storage/chunk_store.h>

namespace wikichunk::storage {

Result<void> requireChunkIds(const std::vector<chunking::Chunk>& chunks) {
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].chunk_id.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "chunk " + std::to_string(i) + " of " + chunks[i].document_id +
                             " has no chunk_id"};
        }
    }
    return Result<void>();
}

Result<bool> MemoryChunkStore::put(const chunking::Chunk& chunk) {
    if (chunk.chunk_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "chunk has no chunk_id"};
    }
    if (!ids_.insert(chunk.chunk_id).second) {
        return false;
    }
    chunks_.push_back(chunk);
    return true;
}

Result<size_t> MemoryChunkStore::putAll(const std::vector<chunking::Chunk>& chunks) {
    if (auto r = requireChunkIds(chunks); !r) {
        return r.error();
    }
    size_t inserted = 0;
    for (const auto& chunk : chunks) {
        if (ids_.insert(chunk.chunk_id).second) {
            chunks_.push_back(chunk);
            ++inserted;
        }
    }
    return inserted;
}

bool MemoryChunkStore::contains(const std::string& chunk_id) const {
    return ids_.count(chunk_id) > 0;
}

} // namespace wikichunk::storage
