#include <spdlog/spdlog.h>
#include <wikichunk/config/chunking_config.h>
#include <wikichunk/config/config_helpers.h>

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>

namespace wikichunk::config {

namespace {

struct IntSetting {
    const char* key;
    const char* env;
    int chunking::ChunkingPolicy::*field;
};

constexpr IntSetting kIntSettings[] = {
    {"min_tokens", "WIKICHUNK_MIN_TOKENS", &chunking::ChunkingPolicy::min_tokens},
    {"target_tokens", "WIKICHUNK_TARGET_TOKENS", &chunking::ChunkingPolicy::target_tokens},
    {"max_tokens", "WIKICHUNK_MAX_TOKENS", &chunking::ChunkingPolicy::max_tokens},
    {"sentence_overlap", "WIKICHUNK_SENTENCE_OVERLAP",
     &chunking::ChunkingPolicy::sentence_overlap},
};

Result<ChunkingSettings> validated(ChunkingSettings settings) {
    if (auto r = settings.policy.validate(); !r) {
        return r.error();
    }
    return settings;
}

} // namespace

Result<int> parseIntSetting(std::string_view name, std::string_view value) {
    int parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (!value.empty() && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (value.empty() || ec != std::errc() || ptr != last) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("{} must be an integer, got '{}'", name, value)};
    }
    return parsed;
}

Result<ChunkingSettings> loadChunkingSettings(const std::filesystem::path& config_path) {
    ChunkingSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::debug("No config at {}; using default chunking policy", config_path.string());
        return settings;
    }

    for (const auto& setting : kIntSettings) {
        auto raw = parse_config_value(config_path, "chunking", setting.key);
        if (!raw) {
            continue;
        }
        auto value = parseIntSetting(setting.key, *raw);
        if (!value) {
            return value.error();
        }
        settings.policy.*setting.field = value.value();
    }

    if (auto raw = parse_config_value(config_path, "chunking", "tokenizer"); raw) {
        auto kind = chunking::parseTokenizerKind(*raw);
        if (!kind) {
            return kind.error();
        }
        settings.tokenizer = kind.value();
    }

    spdlog::debug("Loaded chunking config from {}", config_path.string());
    return validated(std::move(settings));
}

Result<void> applyEnvironmentOverrides(ChunkingSettings& settings) {
    for (const auto& setting : kIntSettings) {
        const char* env = std::getenv(setting.env);
        if (!env || !*env) {
            continue;
        }
        auto value = parseIntSetting(setting.env, env);
        if (!value) {
            return value.error();
        }
        spdlog::debug("{} overrides {} = {}", setting.env, setting.key, value.value());
        settings.policy.*setting.field = value.value();
    }
    return Result<void>();
}

Result<ChunkingSettings> resolveChunkingSettings(const std::string& override_path) {
    auto loaded = loadChunkingSettings(get_config_path(override_path));
    if (!loaded) {
        return loaded.error();
    }
    auto settings = std::move(loaded).value();
    if (auto r = applyEnvironmentOverrides(settings); !r) {
        return r.error();
    }
    return validated(std::move(settings));
}

} // namespace wikichunk::config
