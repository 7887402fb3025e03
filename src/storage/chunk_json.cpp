#include <wikichunk/storage/chunk_json.h>

namespace wikichunk::storage {

using json = nlohmann::json;

json toJson(const chunking::Chunk& chunk) {
    json j;
    j["chunk_id"] = chunk.chunk_id;
    j["document_id"] = chunk.document_id;
    j["text"] = chunk.text;
    j["token_count"] = chunk.token_count;
    j["chunk_type"] = chunking::chunkTypeToString(chunk.chunk_type);
    j["section_path"] = chunk.section_path;
    j["paragraph_index"] = chunk.paragraph_index;
    if (chunk.subchunk_index) {
        j["subchunk_index"] = *chunk.subchunk_index;
    } else {
        j["subchunk_index"] = nullptr;
    }
    return j;
}

Result<chunking::Chunk> chunkFromJson(const json& j) {
    try {
        chunking::Chunk chunk;
        chunk.chunk_id = j.at("chunk_id").get<std::string>();
        chunk.document_id = j.at("document_id").get<std::string>();
        chunk.text = j.at("text").get<std::string>();
        chunk.token_count = j.at("token_count").get<size_t>();
        auto type = chunking::parseChunkType(j.at("chunk_type").get<std::string>());
        if (!type) {
            return type.error();
        }
        chunk.chunk_type = type.value();
        chunk.section_path = j.at("section_path").get<std::vector<std::string>>();
        chunk.paragraph_index = j.at("paragraph_index").get<size_t>();
        if (auto it = j.find("subchunk_index"); it != j.end() && !it->is_null()) {
            chunk.subchunk_index = it->get<size_t>();
        }
        return chunk;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed chunk record: ") + e.what()};
    }
}

json toJson(const std::vector<document::TocEntry>& toc) {
    json arr = json::array();
    for (const auto& entry : toc) {
        arr.push_back({{"level", entry.level}, {"title", entry.title}, {"path", entry.path}});
    }
    return arr;
}

std::string dumpRecord(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace wikichunk::storage
