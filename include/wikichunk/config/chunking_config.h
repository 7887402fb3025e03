#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <wikichunk/chunking/chunk.h>
#include <wikichunk/chunking/tokenizer.h>
#include <wikichunk/core/types.h>

namespace wikichunk::config {

struct ChunkingSettings {
    chunking::ChunkingPolicy policy;
    chunking::TokenizerKind tokenizer = chunking::TokenizerKind::Whitespace;
};

// Strict decimal integer, optionally signed; anything else is InvalidData
Result<int> parseIntSetting(std::string_view name, std::string_view value);

/**
 * Reads the [chunking] section of a TOML config file over the defaults. A missing file
 * yields the defaults. The returned settings are validated.
 */
Result<ChunkingSettings> loadChunkingSettings(const std::filesystem::path& config_path);

// Applies WIKICHUNK_MIN_TOKENS, WIKICHUNK_TARGET_TOKENS, WIKICHUNK_MAX_TOKENS and
// WIKICHUNK_SENTENCE_OVERLAP. Does not validate the combined policy.
Result<void> applyEnvironmentOverrides(ChunkingSettings& settings);

// Config file (see get_config_path), then environment overrides, then validation
Result<ChunkingSettings> resolveChunkingSettings(const std::string& override_path = "");

} // namespace wikichunk::config
