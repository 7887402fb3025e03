#include <wikichunk/document/structure_parser.h>

#include <cctype>
#include <vector>

namespace wikichunk::document {

namespace {

std::string_view trimView(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

// Accumulates body lines until a blank line or header closes the paragraph
class ParagraphBuffer {
public:
    void append(std::string_view line) {
        if (!text_.empty()) {
            text_ += ' ';
        }
        text_.append(line);
    }

    void flushInto(Section& section) {
        auto trimmed = trimView(text_);
        if (!trimmed.empty()) {
            section.content.emplace_back(trimmed);
        }
        text_.clear();
    }

private:
    std::string text_;
};

} // namespace

std::optional<HeaderLine> StructureParser::parseHeader(std::string_view line) {
    size_t markers = 0;
    while (markers < line.size() && line[markers] == '#') {
        ++markers;
    }
    if (markers == 0 || markers >= line.size() ||
        !std::isspace(static_cast<unsigned char>(line[markers]))) {
        return std::nullopt;
    }

    auto title = trimView(line.substr(markers));
    if (title.empty()) {
        return std::nullopt;
    }
    return HeaderLine{static_cast<int>(markers), std::string(title)};
}

Section StructureParser::parse(std::string_view text) const {
    Section root;

    // Ancestors of the current section, root first. Children are only ever appended to the
    // top entry, so the pointers below it stay valid.
    std::vector<Section*> stack{&root};
    Section* current = &root;
    ParagraphBuffer paragraph;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }
        auto line = trimView(text.substr(pos, eol - pos));
        pos = eol + 1;

        if (line.empty()) {
            paragraph.flushInto(*current);
            continue;
        }

        auto header = parseHeader(line);
        if (!header) {
            paragraph.append(line);
            continue;
        }

        paragraph.flushInto(*current);

        while (stack.size() > 1 && stack.back()->level >= header->level) {
            stack.pop_back();
        }
        Section* parent = stack.back();

        auto path = parent->path;
        path.push_back(header->title);
        parent->subsections.emplace_back(std::move(header->title), header->level,
                                         std::move(path));

        current = &parent->subsections.back();
        stack.push_back(current);
    }

    paragraph.flushInto(*current);
    return root;
}

} // namespace wikichunk::document
