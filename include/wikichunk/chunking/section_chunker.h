#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wikichunk/chunking/chunk.h>
#include <wikichunk/chunking/sentence_segmenter.h>
#include <wikichunk/chunking/tokenizer.h>
#include <wikichunk/document/section.h>

namespace wikichunk::chunking {

inline constexpr std::string_view MERGE_SEPARATOR = "\n\n";

/**
 * Applies the merge/split policy to the direct paragraphs of one section.
 *
 * Undersized paragraphs (< min_tokens) accumulate in a merge buffer as long as the merged
 * text stays within max_tokens. A paragraph at or above min_tokens flushes the buffer and
 * is emitted verbatim, or split into overlapping sentence windows when it exceeds
 * max_tokens. A split window may exceed max_tokens when sentences are long; sentences are
 * never cut.
 */
class SectionChunker {
public:
    // Throws std::invalid_argument when the policy is invalid or the tokenizer is empty
    SectionChunker(const ChunkingPolicy& policy, Tokenizer tokenizer);

    std::vector<Chunk> chunkSection(std::string_view document_id,
                                    const document::Section& section) const;

    std::vector<Chunk> splitParagraph(std::string_view document_id,
                                      const document::Section& section, std::string_view text,
                                      size_t paragraph_index) const;

    const ChunkingPolicy& getPolicy() const { return policy_; }

private:
    struct MergeBuffer {
        std::string text;
        size_t first_index = 0;
    };

    Chunk makeChunk(std::string_view document_id, const document::Section& section,
                    std::string text, size_t token_count, ChunkType type, size_t paragraph_index,
                    std::optional<size_t> subchunk_index = std::nullopt) const;

    Chunk flushBuffer(std::string_view document_id, const document::Section& section,
                      MergeBuffer buffer) const;

    ChunkingPolicy policy_;
    Tokenizer tokenizer_;
    SentenceSegmenter segmenter_;
};

} // namespace wikichunk::chunking
