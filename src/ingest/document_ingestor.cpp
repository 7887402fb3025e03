#include <spdlog/spdlog.h>
#include <wikichunk/ingest/document_ingestor.h>

namespace wikichunk::ingest {

DocumentIngestor::DocumentIngestor(const chunking::DocumentChunker& chunker,
                                   storage::IChunkStore& store)
    : chunker_(chunker), store_(store) {}

Result<IngestReport> DocumentIngestor::ingest(std::string_view document_id,
                                              std::string_view markdown) {
    if (document_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "document id is empty"};
    }

    auto start = std::chrono::steady_clock::now();

    IngestReport report;
    report.document_id = std::string(document_id);

    auto root = parser_.parse(markdown);
    report.toc = document::buildTableOfContents(root);
    report.abstract = document::extractAbstract(markdown);

    std::vector<chunking::Chunk> chunks;
    try {
        chunks = chunker_.chunkDocument(document_id, root);
    } catch (const std::exception& e) {
        stats_.failed_documents++;
        spdlog::error("Chunking failed for {}: {}", document_id, e.what());
        return Error{ErrorCode::InternalError,
                     "chunking failed for " + report.document_id + ": " + e.what()};
    }

    for (const auto& chunk : chunks) {
        switch (chunk.chunk_type) {
            case chunking::ChunkType::Paragraph: report.paragraph_chunks++; break;
            case chunking::ChunkType::Merged: report.merged_chunks++; break;
            case chunking::ChunkType::Split: report.split_chunks++; break;
        }
    }

    auto inserted = store_.putAll(chunks);
    if (!inserted) {
        stats_.failed_documents++;
        spdlog::error("Storing {} chunks of {} failed: {}", chunks.size(), document_id,
                      inserted.error().message);
        return inserted.error();
    }
    report.inserted = inserted.value();
    report.skipped = chunks.size() - report.inserted;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    stats_.update(report, elapsed);

    spdlog::debug("Ingested {}: {} sections, {} chunks ({} new, {} existing)", document_id,
                  root.sectionCount(), report.totalChunks(), report.inserted, report.skipped);
    return report;
}

} // namespace wikichunk::ingest
