#include <wikichunk/chunking/chunk.h>

#include <fmt/format.h>

namespace wikichunk::chunking {

Result<ChunkType> parseChunkType(std::string_view name) {
    for (auto type : {ChunkType::Paragraph, ChunkType::Merged, ChunkType::Split}) {
        if (name == chunkTypeToString(type)) {
            return type;
        }
    }
    return Error{ErrorCode::InvalidData, fmt::format("unknown chunk type '{}'", name)};
}

Result<void> ChunkingPolicy::validate() const {
    if (min_tokens <= 0 || target_tokens <= 0 || max_tokens <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("token thresholds must be positive (min={}, target={}, max={})",
                                 min_tokens, target_tokens, max_tokens)};
    }
    if (min_tokens >= target_tokens) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("min_tokens ({}) must be less than target_tokens ({})",
                                 min_tokens, target_tokens)};
    }
    if (target_tokens > max_tokens) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("target_tokens ({}) must not exceed max_tokens ({})",
                                 target_tokens, max_tokens)};
    }
    if (sentence_overlap < 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("sentence_overlap ({}) must not be negative", sentence_overlap)};
    }
    return Result<void>();
}

} // namespace wikichunk::chunking
