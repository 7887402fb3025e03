#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wikichunk::chunking {

/**
 * Heuristic sentence splitter.
 *
 * Breaks at whitespace that follows '.', '!' or '?', except after dotted abbreviations
 * ("e.g.", "U.S."), capitalized two-letter abbreviations ("Mr.", "Dr.") and single
 * capital initials ("J."). Fragments are trimmed and empty ones dropped. Abbreviations
 * outside these patterns still over-split.
 */
class SentenceSegmenter {
public:
    std::vector<std::string> segment(std::string_view text) const;

    // True when the whitespace character at pos ends a sentence
    static bool isBoundary(std::string_view text, size_t pos);
};

} // namespace wikichunk::chunking
