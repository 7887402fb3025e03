#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <wikichunk/core/types.h>

namespace wikichunk::ingest {

// How a document id is derived from a source file name
enum class DocumentIdSource {
    Path, // Path relative to a root, extension dropped: "b/intro"
    Stem  // File name without extension: "intro"
};

Result<DocumentIdSource> parseDocumentIdSource(std::string_view name);

/**
 * Derives a stable document id for a source file. In Path mode the file is made relative
 * to root when it lies below it, normalized, stripped of its extension and written with
 * '/' separators, so files sharing a stem in different directories stay distinct.
 */
std::string documentIdForFile(const std::filesystem::path& file, DocumentIdSource source,
                              const std::filesystem::path& root = {});

} // namespace wikichunk::ingest
