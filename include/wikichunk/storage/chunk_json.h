#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <wikichunk/chunking/chunk.h>
#include <wikichunk/core/types.h>
#include <wikichunk/document/outline.h>

namespace wikichunk::storage {

// subchunk_index serializes as null when absent
nlohmann::json toJson(const chunking::Chunk& chunk);

Result<chunking::Chunk> chunkFromJson(const nlohmann::json& j);

nlohmann::json toJson(const std::vector<document::TocEntry>& toc);

// Serializes without throwing on invalid UTF-8; offending bytes become U+FFFD
std::string dumpRecord(const nlohmann::json& j, int indent = -1);

} // namespace wikichunk::storage
