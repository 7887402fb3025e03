#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include <wikichunk/chunking/document_chunker.h>
#include <wikichunk/core/types.h>
#include <wikichunk/document/outline.h>
#include <wikichunk/storage/chunk_store.h>

namespace wikichunk::ingest {

/**
 * Outcome of ingesting one document. Only produced when all of its chunks were stored.
 */
struct IngestReport {
    std::string document_id;
    size_t paragraph_chunks = 0;
    size_t merged_chunks = 0;
    size_t split_chunks = 0;
    size_t inserted = 0;
    size_t skipped = 0; // Already present in the store
    std::string abstract;
    std::vector<document::TocEntry> toc;

    size_t totalChunks() const { return paragraph_chunks + merged_chunks + split_chunks; }
};

/**
 * Running totals across documents
 */
struct IngestStats {
    size_t total_documents = 0;
    size_t failed_documents = 0;
    size_t total_chunks = 0;
    size_t inserted_chunks = 0;
    size_t skipped_chunks = 0;
    std::chrono::milliseconds total_time{0};

    void update(const IngestReport& report, std::chrono::milliseconds time) {
        total_documents++;
        total_chunks += report.totalChunks();
        inserted_chunks += report.inserted;
        skipped_chunks += report.skipped;
        total_time += time;
    }
};

/**
 * Parses, chunks and stores documents. Chunking completes before anything is written and
 * each document's chunks go to the store in a single IChunkStore::putAll, so a document
 * whose tokenizer or store write fails leaves nothing of itself behind and can be retried.
 */
class DocumentIngestor {
public:
    DocumentIngestor(const chunking::DocumentChunker& chunker, storage::IChunkStore& store);

    Result<IngestReport> ingest(std::string_view document_id, std::string_view markdown);

    const IngestStats& stats() const { return stats_; }
    void resetStats() { stats_ = IngestStats{}; }

private:
    const chunking::DocumentChunker& chunker_;
    storage::IChunkStore& store_;
    document::StructureParser parser_;
    IngestStats stats_;
};

} // namespace wikichunk::ingest
