#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <wikichunk/document/section.h>

namespace wikichunk::document {

struct TocEntry {
    int level = 0;
    std::string title;
    std::vector<std::string> path;
};

inline constexpr size_t ABSTRACT_MAX_BYTES = 2000;
inline constexpr size_t ABSTRACT_FALLBACK_BYTES = 1000;

/**
 * Pre-order table of contents for every non-root section. When max_level is positive,
 * sections deeper than max_level are left out.
 */
std::vector<TocEntry> buildTableOfContents(const Section& root, int max_level = 0);

/**
 * Text preceding the first header line, trimmed and capped at ABSTRACT_MAX_BYTES.
 * Documents that open with a header fall back to their first ABSTRACT_FALLBACK_BYTES.
 */
std::string extractAbstract(std::string_view markdown);

} // namespace wikichunk::document
