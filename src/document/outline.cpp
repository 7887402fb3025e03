#include <wikichunk/document/outline.h>

#include <cctype>

namespace wikichunk::document {

namespace {

void collectToc(const Section& section, int max_level, std::vector<TocEntry>& out) {
    for (const auto& child : section.subsections) {
        if (max_level > 0 && child.level > max_level) {
            continue;
        }
        out.push_back(TocEntry{child.level, child.title, child.path});
        collectToc(child, max_level, out);
    }
}

// Largest prefix length <= limit that does not end inside a UTF-8 sequence
size_t utf8Prefix(std::string_view s, size_t limit) {
    if (s.size() <= limit) {
        return s.size();
    }
    size_t n = limit;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) {
        --n;
    }
    return n;
}

std::string trimmed(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

} // namespace

std::vector<TocEntry> buildTableOfContents(const Section& root, int max_level) {
    std::vector<TocEntry> toc;
    collectToc(root, max_level, toc);
    return toc;
}

std::string extractAbstract(std::string_view markdown) {
    size_t end = 0;
    while (end < markdown.size() && markdown[end] != '#') {
        size_t eol = markdown.find('\n', end);
        if (eol == std::string_view::npos) {
            end = markdown.size();
            break;
        }
        end = eol + 1;
    }

    auto abstract = trimmed(markdown.substr(0, end));
    if (abstract.empty()) {
        return std::string(markdown.substr(0, utf8Prefix(markdown, ABSTRACT_FALLBACK_BYTES)));
    }
    abstract.resize(utf8Prefix(abstract, ABSTRACT_MAX_BYTES));
    return abstract;
}

} // namespace wikichunk::document
