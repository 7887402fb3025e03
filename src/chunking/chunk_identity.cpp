#include <wikichunk/chunking/chunk_identity.h>
#include <wikichunk/crypto/md5_hasher.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace wikichunk::chunking {

std::string canonicalChunkKey(std::string_view document_id,
                              const std::vector<std::string>& section_path,
                              size_t paragraph_index, std::optional<size_t> subchunk_index) {
    return fmt::format("{}|{}|{}|{}", document_id, fmt::join(section_path, "/"),
                       paragraph_index,
                       subchunk_index ? std::to_string(*subchunk_index) : std::string());
}

std::string deriveChunkId(std::string_view document_id,
                          const std::vector<std::string>& section_path, size_t paragraph_index,
                          std::optional<size_t> subchunk_index) {
    auto digest = crypto::MD5Hasher::hash(
        canonicalChunkKey(document_id, section_path, paragraph_index, subchunk_index));
    return digest.substr(0, CHUNK_ID_LENGTH);
}

} // namespace wikichunk::chunking
