#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <wikichunk/chunking/document_chunker.h>
#include <wikichunk/config/chunking_config.h>
#include <wikichunk/document/outline.h>
#include <wikichunk/document/structure_parser.h>
#include <wikichunk/ingest/document_id.h>
#include <wikichunk/ingest/document_ingestor.h>
#include <wikichunk/storage/chunk_json.h>
#include <wikichunk/storage/jsonl_chunk_store.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>

using json = nlohmann::json;
using namespace wikichunk;

namespace {

struct PolicyOverrides {
    std::optional<int> min_tokens;
    std::optional<int> target_tokens;
    std::optional<int> max_tokens;
    std::optional<int> overlap;
    std::optional<std::string> tokenizer;
};

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Result<config::ChunkingSettings> resolveSettings(const std::string& configPath,
                                                 const PolicyOverrides& overrides) {
    auto resolved = config::resolveChunkingSettings(configPath);
    if (!resolved) {
        return resolved.error();
    }
    auto settings = std::move(resolved).value();

    auto& policy = settings.policy;
    if (overrides.min_tokens)
        policy.min_tokens = *overrides.min_tokens;
    if (overrides.target_tokens)
        policy.target_tokens = *overrides.target_tokens;
    if (overrides.max_tokens)
        policy.max_tokens = *overrides.max_tokens;
    if (overrides.overlap)
        policy.sentence_overlap = *overrides.overlap;
    if (overrides.tokenizer) {
        auto kind = chunking::parseTokenizerKind(*overrides.tokenizer);
        if (!kind) {
            return kind.error();
        }
        settings.tokenizer = kind.value();
    }

    if (auto r = policy.validate(); !r) {
        return r.error();
    }
    spdlog::debug("Chunking policy: min={} target={} max={} overlap={} tokenizer={}",
                  policy.min_tokens, policy.target_tokens, policy.max_tokens,
                  policy.sentence_overlap, chunking::tokenizerKindToString(settings.tokenizer));
    return settings;
}

int fail(const Error& error) {
    spdlog::error("{}: {}", error.code, error.message);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Structure-aware document chunking for retrieval indexing", "wikichunk"};
        app.set_version_flag("--version", "0.1.0");
        app.require_subcommand(1);

        std::string configPath;
        bool verbose = false;
        PolicyOverrides overrides;

        app.add_option("--config", configPath, "Path to config.toml");
        app.add_flag("-v,--verbose", verbose, "Enable verbose output");
        app.add_option("--min-tokens", overrides.min_tokens, "Merge paragraphs below this");
        app.add_option("--target-tokens", overrides.target_tokens, "Sentence window target");
        app.add_option("--max-tokens", overrides.max_tokens, "Paragraph and merge ceiling");
        app.add_option("--overlap", overrides.overlap, "Sentences repeated between windows");
        app.add_option("--tokenizer", overrides.tokenizer, "whitespace or estimate");

        int rc = 0;
        auto applyVerbosity = [&]() {
            if (verbose) {
                spdlog::set_level(spdlog::level::debug);
            }
        };

        auto* chunkCmd = app.add_subcommand("chunk", "Chunk a markdown document");
        std::string chunkFile;
        std::string docId;
        bool pretty = false;
        chunkCmd->add_option("file", chunkFile, "Markdown file")
            ->required()
            ->check(CLI::ExistingFile);
        chunkCmd->add_option("--doc-id", docId, "Document id (defaults to the file stem)");
        chunkCmd->add_flag("--pretty", pretty, "Print an indented JSON array");
        chunkCmd->callback([&]() {
            applyVerbosity();
            auto settings = resolveSettings(configPath, overrides);
            if (!settings) {
                rc = fail(settings.error());
                return;
            }
            auto text = readFile(chunkFile);
            if (!text) {
                rc = fail(text.error());
                return;
            }
            if (docId.empty()) {
                docId = std::filesystem::path(chunkFile).stem().string();
            }

            chunking::DocumentChunker chunker(settings.value().policy,
                                              chunking::makeTokenizer(settings.value().tokenizer));
            auto chunks = chunker.chunkMarkdown(docId, text.value());
            spdlog::info("{}: {} chunks", docId, chunks.size());

            if (pretty) {
                json arr = json::array();
                for (const auto& chunk : chunks) {
                    arr.push_back(storage::toJson(chunk));
                }
                std::cout << storage::dumpRecord(arr, 2) << std::endl;
            } else {
                for (const auto& chunk : chunks) {
                    std::cout << storage::dumpRecord(storage::toJson(chunk)) << '\n';
                }
                std::cout.flush();
            }
        });

        auto* outlineCmd = app.add_subcommand("outline", "Print abstract and table of contents");
        std::string outlineFile;
        int maxLevel = 0;
        outlineCmd->add_option("file", outlineFile, "Markdown file")
            ->required()
            ->check(CLI::ExistingFile);
        outlineCmd->add_option("--max-level", maxLevel, "Deepest header level to list (0 = all)");
        outlineCmd->callback([&]() {
            applyVerbosity();
            auto text = readFile(outlineFile);
            if (!text) {
                rc = fail(text.error());
                return;
            }
            document::StructureParser parser;
            auto root = parser.parse(text.value());

            json out;
            out["abstract"] = document::extractAbstract(text.value());
            out["toc"] = storage::toJson(document::buildTableOfContents(root, maxLevel));
            std::cout << storage::dumpRecord(out, 2) << std::endl;
        });

        auto* ingestCmd = app.add_subcommand("ingest", "Chunk documents into a JSONL store");
        std::vector<std::string> ingestFiles;
        std::string storePath;
        size_t batchSize = storage::DEFAULT_STORE_BATCH_SIZE;
        ingestCmd->add_option("files", ingestFiles, "Markdown files")
            ->required()
            ->check(CLI::ExistingFile);
        ingestCmd->add_option("--store", storePath, "JSONL chunk store")->required();
        ingestCmd->add_option("--batch-size", batchSize, "Records buffered before a write")
            ->default_val(storage::DEFAULT_STORE_BATCH_SIZE);
        std::string idFrom = "path";
        std::string idRoot;
        ingestCmd
            ->add_option("--doc-id-from", idFrom,
                         "Derive document ids from the file path (relative to --root) or stem")
            ->check(CLI::IsMember({"path", "stem"}))
            ->default_val("path");
        ingestCmd->add_option("--root", idRoot, "Directory that path-based ids are relative to");
        ingestCmd->callback([&]() {
            applyVerbosity();
            auto settings = resolveSettings(configPath, overrides);
            if (!settings) {
                rc = fail(settings.error());
                return;
            }
            auto idSource = ingest::parseDocumentIdSource(idFrom);
            if (!idSource) {
                rc = fail(idSource.error());
                return;
            }
            auto opened = storage::JsonlChunkStore::open(storePath, batchSize);
            if (!opened) {
                rc = fail(opened.error());
                return;
            }
            auto store = std::move(opened).value();

            chunking::DocumentChunker chunker(settings.value().policy,
                                              chunking::makeTokenizer(settings.value().tokenizer));
            ingest::DocumentIngestor ingestor(chunker, *store);

            // Two files mapping to one id would silently share chunk ids
            std::map<std::string, std::string> sourceOfId;
            for (const auto& file : ingestFiles) {
                auto id = ingest::documentIdForFile(file, idSource.value(), idRoot);
                if (auto [it, fresh] = sourceOfId.emplace(id, file); !fresh) {
                    rc = fail(Error{ErrorCode::InvalidArgument,
                                    fmt::format("{} maps to document id '{}' already used by {}",
                                                file, id, it->second)});
                    continue;
                }
                auto text = readFile(file);
                if (!text) {
                    rc = fail(text.error());
                    continue;
                }
                auto report = ingestor.ingest(id, text.value());
                if (!report) {
                    rc = fail(report.error());
                    continue;
                }
                spdlog::info("{}: {} chunks ({} new, {} existing)", id,
                             report.value().totalChunks(), report.value().inserted,
                             report.value().skipped);
            }

            if (auto r = store->flush(); !r) {
                rc = fail(r.error());
                return;
            }

            const auto& stats = ingestor.stats();
            json summary;
            summary["documents"] = stats.total_documents;
            summary["failed"] = stats.failed_documents;
            summary["chunks"] = stats.total_chunks;
            summary["inserted"] = stats.inserted_chunks;
            summary["skipped"] = stats.skipped_chunks;
            summary["store_size"] = store->size();
            summary["elapsed_ms"] = stats.total_time.count();
            std::cout << summary.dump(2) << std::endl;
        });

        CLI11_PARSE(app, argc, argv);
        return rc;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
