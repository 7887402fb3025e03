#include <wikichunk/chunking/chunk_identity.h>
#include <wikichunk/chunking/section_chunker.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace wikichunk::chunking {

namespace {

const ChunkingPolicy& requireValid(const ChunkingPolicy& policy) {
    if (auto r = policy.validate(); !r) {
        throw std::invalid_argument("Invalid chunking policy: " + r.error().message);
    }
    return policy;
}

} // namespace

SectionChunker::SectionChunker(const ChunkingPolicy& policy, Tokenizer tokenizer)
    : policy_(requireValid(policy)), tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) {
        throw std::invalid_argument("SectionChunker requires a tokenizer");
    }
}

std::vector<Chunk> SectionChunker::chunkSection(std::string_view document_id,
                                                const document::Section& section) const {
    // validate() guarantees the thresholds are positive
    const auto min_tokens = static_cast<size_t>(policy_.min_tokens);
    const auto max_tokens = static_cast<size_t>(policy_.max_tokens);

    std::vector<Chunk> chunks;
    std::optional<MergeBuffer> buffer;

    for (size_t i = 0; i < section.content.size(); ++i) {
        const auto& paragraph = section.content[i];
        size_t tokens = tokenizer_(paragraph);

        if (tokens < min_tokens) {
            if (!buffer) {
                buffer = MergeBuffer{paragraph, i};
                continue;
            }
            std::string candidate = buffer->text;
            candidate += MERGE_SEPARATOR;
            candidate += paragraph;
            if (tokenizer_(candidate) <= max_tokens) {
                buffer->text = std::move(candidate);
            } else {
                chunks.push_back(flushBuffer(document_id, section, std::move(*buffer)));
                buffer = MergeBuffer{paragraph, i};
            }
            continue;
        }

        // A paragraph that meets the minimum is never folded into the buffer
        if (buffer) {
            chunks.push_back(flushBuffer(document_id, section, std::move(*buffer)));
            buffer.reset();
        }

        if (tokens <= max_tokens) {
            chunks.push_back(
                makeChunk(document_id, section, paragraph, tokens, ChunkType::Paragraph, i));
        } else {
            auto windows = splitParagraph(document_id, section, paragraph, i);
            chunks.insert(chunks.end(), std::make_move_iterator(windows.begin()),
                          std::make_move_iterator(windows.end()));
        }
    }

    if (buffer) {
        chunks.push_back(flushBuffer(document_id, section, std::move(*buffer)));
    }

    return chunks;
}

std::vector<Chunk> SectionChunker::splitParagraph(std::string_view document_id,
                                                  const document::Section& section,
                                                  std::string_view text,
                                                  size_t paragraph_index) const {
    const auto target_tokens = static_cast<size_t>(policy_.target_tokens);
    const auto overlap = static_cast<size_t>(policy_.sentence_overlap);

    std::vector<Chunk> chunks;
    auto sentences = segmenter_.segment(text);

    size_t i = 0;
    size_t subchunk = 0;
    while (i < sentences.size()) {
        const size_t start = i;
        size_t token_sum = 0;
        std::string window;

        while (i < sentences.size()) {
            if (!window.empty()) {
                window += ' ';
            }
            window += sentences[i];
            token_sum += tokenizer_(sentences[i]);
            ++i;
            if (token_sum >= target_tokens) {
                break;
            }
        }

        chunks.push_back(makeChunk(document_id, section, std::move(window), token_sum,
                                   ChunkType::Split, paragraph_index, subchunk));
        ++subchunk;

        // Step back for overlap, but always advance by at least one sentence
        if (i < sentences.size()) {
            i -= std::min(overlap, i - start - 1);
        }
    }

    return chunks;
}

Chunk SectionChunker::makeChunk(std::string_view document_id, const document::Section& section,
                                std::string text, size_t token_count, ChunkType type,
                                size_t paragraph_index,
                                std::optional<size_t> subchunk_index) const {
    Chunk chunk;
    chunk.chunk_id = deriveChunkId(document_id, section.path, paragraph_index, subchunk_index);
    chunk.document_id = std::string(document_id);
    chunk.text = std::move(text);
    chunk.token_count = token_count;
    chunk.chunk_type = type;
    chunk.section_path = section.path;
    chunk.paragraph_index = paragraph_index;
    chunk.subchunk_index = subchunk_index;
    return chunk;
}

Chunk SectionChunker::flushBuffer(std::string_view document_id, const document::Section& section,
                                  MergeBuffer buffer) const {
    size_t tokens = tokenizer_(buffer.text);
    return makeChunk(document_id, section, std::move(buffer.text), tokens, ChunkType::Merged,
                     buffer.first_index);
}

} // namespace wikichunk::chunking
