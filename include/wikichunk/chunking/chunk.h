#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wikichunk/core/types.h>

namespace wikichunk::chunking {

/**
 * How a chunk was produced from its section's paragraphs
 */
enum class ChunkType {
    Paragraph, // One paragraph within budget, verbatim
    Merged,    // One or more undersized paragraphs joined by a blank line
    Split      // One sentence window of an oversized paragraph
};

constexpr const char* chunkTypeToString(ChunkType type) {
    switch (type) {
        case ChunkType::Paragraph: return "paragraph";
        case ChunkType::Merged: return "merged";
        case ChunkType::Split: return "split";
    }
    return "paragraph";
}

Result<ChunkType> parseChunkType(std::string_view name);

/**
 * Token-budget policy applied to every section
 */
struct ChunkingPolicy {
    int min_tokens = 80;      // Paragraphs below this are merged
    int target_tokens = 220;  // Sentence windows accumulate until reaching this
    int max_tokens = 300;     // Ceiling for paragraphs and merged chunks
    int sentence_overlap = 1; // Sentences repeated between consecutive windows

    // Requires 0 < min < target <= max and overlap >= 0
    Result<void> validate() const;
};

/**
 * A bounded unit of document text ready for embedding
 */
struct Chunk {
    std::string chunk_id;                  // 16 hex chars, see chunk_identity.h
    std::string document_id;
    std::string text;
    size_t token_count = 0;
    ChunkType chunk_type = ChunkType::Paragraph;
    std::vector<std::string> section_path;
    size_t paragraph_index = 0;            // First paragraph for merged chunks
    std::optional<size_t> subchunk_index;  // Set for split chunks only

    bool operator==(const Chunk&) const = default;
};

} // namespace wikichunk::chunking
