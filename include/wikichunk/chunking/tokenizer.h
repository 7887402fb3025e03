#pragma once

#include <cstddef>
#include <functional>
#include <string_view>
#include <wikichunk/core/types.h>

namespace wikichunk::chunking {

/**
 * Token counting capability supplied by the host. Must be stateless or reentrant when
 * documents are chunked concurrently. Exceptions it throws propagate to the caller.
 */
using Tokenizer = std::function<size_t(std::string_view)>;

enum class TokenizerKind {
    Whitespace, // Runs of non-whitespace characters
    Estimate    // ~4 bytes per token
};

// Number of whitespace-separated words
size_t whitespaceTokenCount(std::string_view text);

// 0 for empty text, otherwise max(1, bytes / 4)
size_t estimateTokenCount(std::string_view text);

Tokenizer makeTokenizer(TokenizerKind kind);

Result<TokenizerKind> parseTokenizerKind(std::string_view name);

const char* tokenizerKindToString(TokenizerKind kind);

} // namespace wikichunk::chunking
