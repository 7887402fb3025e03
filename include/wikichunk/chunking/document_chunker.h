#pragma once

#include <string_view>
#include <vector>
#include <wikichunk/chunking/section_chunker.h>
#include <wikichunk/document/structure_parser.h>

namespace wikichunk::chunking {

/**
 * Chunks a whole Section tree in pre-order: a section's own chunks come before those of
 * its subsections, and chunks never span two sections.
 *
 * Chunking is synchronous and keeps no state between calls, so separate documents may be
 * chunked from several threads provided the tokenizer is reentrant. If the tokenizer
 * throws, the exception propagates and no chunks are returned for that document.
 */
class DocumentChunker {
public:
    // Default policy with whitespace token counting
    DocumentChunker();
    // Throws std::invalid_argument when the policy is invalid or the tokenizer is empty
    DocumentChunker(const ChunkingPolicy& policy, Tokenizer tokenizer);

    std::vector<Chunk> chunkDocument(std::string_view document_id,
                                     const document::Section& root) const;

    // Parses ATX markup and chunks the resulting tree
    std::vector<Chunk> chunkMarkdown(std::string_view document_id, std::string_view text) const;

    const ChunkingPolicy& getPolicy() const { return section_chunker_.getPolicy(); }

private:
    void chunkRecursive(std::string_view document_id, const document::Section& section,
                        std::vector<Chunk>& out) const;

    SectionChunker section_chunker_;
    document::StructureParser parser_;
};

} // namespace wikichunk::chunking
