#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wikichunk::chunking {

inline constexpr size_t CHUNK_ID_LENGTH = 16;

/**
 * Derives the stable identifier of a chunk position.
 *
 * The canonical key is "<document_id>|<path joined by '/'>|<paragraph_index>|<subchunk>",
 * with an empty subchunk field when the index is absent. The identifier is the first
 * CHUNK_ID_LENGTH hex characters of the key's MD5 digest (64 bits); collisions are
 * possible in principle and accepted. Titles containing '/' or '|' may alias other paths.
 */
std::string deriveChunkId(std::string_view document_id,
                          const std::vector<std::string>& section_path, size_t paragraph_index,
                          std::optional<size_t> subchunk_index);

// The string that deriveChunkId digests
std::string canonicalChunkKey(std::string_view document_id,
                              const std::vector<std::string>& section_path,
                              size_t paragraph_index, std::optional<size_t> subchunk_index);

} // namespace wikichunk::chunking
