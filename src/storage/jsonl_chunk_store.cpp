#include <spdlog/spdlog.h>
#include <wikichunk/storage/chunk_json.h>
#include <wikichunk/storage/jsonl_chunk_store.h>

#include <cstdint>
#include <exception>
#include <fstream>

namespace wikichunk::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

Result<std::unique_ptr<JsonlChunkStore>> JsonlChunkStore::open(const fs::path& path,
                                                               size_t batch_size) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "chunk store path is empty"};
    }
    if (batch_size == 0) {
        return Error{ErrorCode::InvalidArgument, "batch size must be positive"};
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "cannot create " + path.parent_path().string() +
                                                    ": " + ec.message()};
        }
    }

    std::unique_ptr<JsonlChunkStore> store(new JsonlChunkStore(path, batch_size));
    if (auto r = store->loadExisting(); !r) {
        return r.error();
    }
    spdlog::debug("Opened chunk store {} with {} existing chunks", path.string(),
                  store->ids_.size());
    return store;
}

JsonlChunkStore::JsonlChunkStore(fs::path path, size_t batch_size)
    : path_(std::move(path)), batch_size_(batch_size) {}

JsonlChunkStore::~JsonlChunkStore() {
    if (pending_.empty()) {
        return;
    }
    try {
        if (auto r = flush(); !r) {
            spdlog::error("Dropping {} unflushed chunks for {}: {}", pending_.size(),
                          path_.string(), r.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::error("Dropping {} unflushed chunks for {}: {}", pending_.size(), path_.string(),
                      e.what());
    }
}

Result<void> JsonlChunkStore::loadExisting() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Result<void>();
    }

    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "cannot read " + path_.string()};
    }

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        auto j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("chunk_id") ||
            !j["chunk_id"].is_string()) {
            spdlog::warn("Skipping malformed record at {}:{}", path_.string(), lineNo);
            continue;
        }
        ids_.insert(j["chunk_id"].get<std::string>());
    }
    return Result<void>();
}

Result<bool> JsonlChunkStore::put(const chunking::Chunk& chunk) {
    auto inserted = putAll({chunk});
    if (!inserted) {
        return inserted.error();
    }
    return inserted.value() > 0;
}

Result<size_t> JsonlChunkStore::putAll(const std::vector<chunking::Chunk>& chunks) {
    if (auto r = requireChunkIds(chunks); !r) {
        return r.error();
    }

    const size_t before = pending_.size();
    for (const auto& chunk : chunks) {
        if (ids_.insert(chunk.chunk_id).second) {
            pending_.push_back(chunk);
        }
    }
    const size_t inserted = pending_.size() - before;

    if (pending_.size() >= batch_size_) {
        if (auto r = flush(); !r) {
            // flush() keeps everything pending on failure; drop only this call's records
            for (size_t i = before; i < pending_.size(); ++i) {
                ids_.erase(pending_[i].chunk_id);
            }
            pending_.resize(before);
            return r.error();
        }
    }
    return inserted;
}

bool JsonlChunkStore::contains(const std::string& chunk_id) const {
    return ids_.count(chunk_id) > 0;
}

Result<void> JsonlChunkStore::flush() {
    if (pending_.empty()) {
        return Result<void>();
    }

    std::string batch;
    for (const auto& chunk : pending_) {
        batch += dumpRecord(toJson(chunk));
        batch += '\n';
    }

    std::error_code ec;
    std::uintmax_t previousSize = 0;
    if (fs::is_regular_file(path_, ec)) {
        previousSize = fs::file_size(path_, ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         "cannot stat " + path_.string() + ": " + ec.message()};
        }
    }

    bool written = false;
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        if (out) {
            out.write(batch.data(), static_cast<std::streamsize>(batch.size()));
            out.flush();
            written = static_cast<bool>(out);
        }
    }
    if (!written) {
        if (fs::is_regular_file(path_, ec)) {
            fs::resize_file(path_, previousSize, ec);
            if (ec) {
                spdlog::warn("Could not truncate {} after a failed write: {}", path_.string(),
                             ec.message());
            }
        }
        return Error{ErrorCode::WriteError, "failed writing " + std::to_string(pending_.size()) +
                                                " chunks to " + path_.string()};
    }

    spdlog::debug("Flushed {} chunks to {}", pending_.size(), path_.string());
    pending_.clear();
    return Result<void>();
}

} // namespace wikichunk::storage
