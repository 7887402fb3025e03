#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <wikichunk/document/section.h>

namespace wikichunk::document {

/**
 * A parsed ATX header line: "## Title" -> {level 2, "Title"}
 */
struct HeaderLine {
    int level = 0;
    std::string title;
};

/**
 * Parses ATX-header markup (lines starting with one or more '#') into a Section tree.
 *
 * Blank lines and headers delimit paragraphs; consecutive body lines are joined with a
 * single space. Header nesting is resolved with a stack: skipped levels are accepted and
 * nest under the nearest shallower section. Parsing never fails.
 */
class StructureParser {
public:
    StructureParser() = default;

    Section parse(std::string_view text) const;

    // Returns the header described by an already-trimmed line, if it is one
    static std::optional<HeaderLine> parseHeader(std::string_view line);
};

} // namespace wikichunk::document
