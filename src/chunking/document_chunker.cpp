#include <wikichunk/chunking/document_chunker.h>

#include <iterator>
#include <utility>

namespace wikichunk::chunking {

DocumentChunker::DocumentChunker()
    : DocumentChunker(ChunkingPolicy{}, makeTokenizer(TokenizerKind::Whitespace)) {}

DocumentChunker::DocumentChunker(const ChunkingPolicy& policy, Tokenizer tokenizer)
    : section_chunker_(policy, std::move(tokenizer)) {}

std::vector<Chunk> DocumentChunker::chunkDocument(std::string_view document_id,
                                                  const document::Section& root) const {
    std::vector<Chunk> chunks;
    chunkRecursive(document_id, root, chunks);
    return chunks;
}

std::vector<Chunk> DocumentChunker::chunkMarkdown(std::string_view document_id,
                                                  std::string_view text) const {
    auto root = parser_.parse(text);
    return chunkDocument(document_id, root);
}

void DocumentChunker::chunkRecursive(std::string_view document_id,
                                     const document::Section& section,
                                     std::vector<Chunk>& out) const {
    auto own = section_chunker_.chunkSection(document_id, section);
    out.insert(out.end(), std::make_move_iterator(own.begin()),
               std::make_move_iterator(own.end()));

    for (const auto& child : section.subsections) {
        chunkRecursive(document_id, child, out);
    }
}

} // namespace wikichunk::chunking
