#include <wikichunk/chunking/tokenizer.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace wikichunk::chunking {

size_t whitespaceTokenCount(std::string_view text) {
    size_t count = 0;
    bool in_word = false;
    for (char c : text) {
        bool is_space = std::isspace(static_cast<unsigned char>(c));
        if (!in_word && !is_space) {
            ++count;
        }
        in_word = !is_space;
    }
    return count;
}

size_t estimateTokenCount(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    return std::max(size_t(1), text.size() / 4);
}

Tokenizer makeTokenizer(TokenizerKind kind) {
    switch (kind) {
        case TokenizerKind::Whitespace: return whitespaceTokenCount;
        case TokenizerKind::Estimate: return estimateTokenCount;
    }
    return whitespaceTokenCount;
}

Result<TokenizerKind> parseTokenizerKind(std::string_view name) {
    if (name == "whitespace") {
        return TokenizerKind::Whitespace;
    }
    if (name == "estimate") {
        return TokenizerKind::Estimate;
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("unknown tokenizer '{}' (expected whitespace or estimate)", name)};
}

const char* tokenizerKindToString(TokenizerKind kind) {
    switch (kind) {
        case TokenizerKind::Whitespace: return "whitespace";
        case TokenizerKind::Estimate: return "estimate";
    }
    return "whitespace";
}

} // namespace wikichunk::chunking
