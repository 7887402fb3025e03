#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace wikichunk::document {

/**
 * A node in a document's header-derived outline.
 *
 * The root section is synthetic: empty title, level 0 and an empty path. A level-N
 * header opens a section at level N whose path is its parent's path plus its own title.
 * Each section exclusively owns its children; there are no back references.
 */
struct Section {
    std::string title;
    int level = 0;
    std::vector<std::string> path;     // Ancestor titles, outermost first, root excluded
    std::vector<std::string> content;  // Direct paragraphs only
    std::vector<Section> subsections;

    Section() = default;
    Section(std::string t, int lvl, std::vector<std::string> p)
        : title(std::move(t)), level(lvl), path(std::move(p)) {}

    bool isRoot() const { return level == 0; }

    // Number of sections in this subtree, including this one
    size_t sectionCount() const {
        size_t n = 1;
        for (const auto& child : subsections) {
            n += child.sectionCount();
        }
        return n;
    }

    // Number of paragraphs in this subtree
    size_t paragraphCount() const {
        size_t n = content.size();
        for (const auto& child : subsections) {
            n += child.paragraphCount();
        }
        return n;
    }
};

} // namespace wikichunk::document
