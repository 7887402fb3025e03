#include <wikichunk/chunking/sentence_segmenter.h>

#include <cctype>

namespace wikichunk::chunking {

namespace {

bool isWordChar(char c) {
    auto u = static_cast<unsigned char>(c);
    // Bytes of multi-byte UTF-8 sequences count as word characters
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool isLower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

void appendTrimmed(std::string_view fragment, std::vector<std::string>& out) {
    size_t start = 0;
    while (start < fragment.size() && std::isspace(static_cast<unsigned char>(fragment[start]))) {
        ++start;
    }
    size_t end = fragment.size();
    while (end > start && std::isspace(static_cast<unsigned char>(fragment[end - 1]))) {
        --end;
    }
    if (end > start) {
        out.emplace_back(fragment.substr(start, end - start));
    }
}

} // namespace

bool SentenceSegmenter::isBoundary(std::string_view text, size_t pos) {
    if (pos == 0 || pos >= text.size() || !std::isspace(static_cast<unsigned char>(text[pos]))) {
        return false;
    }

    char prev = text[pos - 1];
    if (prev != '.' && prev != '!' && prev != '?') {
        return false;
    }

    // "e.g. ", "i.e. ", "U.S. "
    if (pos >= 4 && isWordChar(text[pos - 4]) && text[pos - 3] == '.' &&
        isWordChar(text[pos - 2])) {
        return false;
    }

    if (prev == '.') {
        // "Mr. ", "Dr. ", "St. "
        if (pos >= 3 && isUpper(text[pos - 3]) && isLower(text[pos - 2])) {
            return false;
        }
        // "J. Smith"
        if (pos >= 2 && isUpper(text[pos - 2]) && (pos == 2 || !isWordChar(text[pos - 3]))) {
            return false;
        }
    }

    return true;
}

std::vector<std::string> SentenceSegmenter::segment(std::string_view text) const {
    std::vector<std::string> sentences;

    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isBoundary(text, i)) {
            appendTrimmed(text.substr(start, i - start), sentences);
            start = i + 1;
        }
    }
    appendTrimmed(text.substr(start), sentences);

    return sentences;
}

} // namespace wikichunk::chunking
