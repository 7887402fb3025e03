#include <wikichunk/ingest/document_id.h>

#include <fmt/format.h>

namespace wikichunk::ingest {

namespace fs = std::filesystem;

Result<DocumentIdSource> parseDocumentIdSource(std::string_view name) {
    if (name == "path") {
        return DocumentIdSource::Path;
    }
    if (name == "stem") {
        return DocumentIdSource::Stem;
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("unknown document id source '{}' (expected path or stem)", name)};
}

std::string documentIdForFile(const fs::path& file, DocumentIdSource source,
                              const fs::path& root) {
    if (source == DocumentIdSource::Stem) {
        return file.stem().string();
    }

    fs::path id = file.lexically_normal();
    if (!root.empty()) {
        auto relative = id.lexically_relative(root.lexically_normal());
        // Files outside root keep their own path
        if (!relative.empty() && *relative.begin() != "..") {
            id = relative;
        }
    }
    id.replace_extension();

    auto text = id.generic_string();
    while (text.rfind("./", 0) == 0) {
        text.erase(0, 2);
    }
    return text;
}

} // namespace wikichunk::ingest
