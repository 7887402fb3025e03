#include <gtest/gtest.h>
#include <support/temp_dir_scope.hpp>
#include <wikichunk/chunking/document_chunker.h>
#include <wikichunk/storage/chunk_json.h>
#include <wikichunk/storage/jsonl_chunk_store.h>

#include <fstream>
#include <string>
#include <vector>

using namespace wikichunk;
using namespace wikichunk::storage;
using wikichunk::test_support::TempDirScope;

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

class JsonlChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunks_ = chunker_.chunkMarkdown("article", "# One\n\nfirst small\n\n# Two\n\nsecond small\n"
                                                    "\n# Three\n\nthird small\n");
        ASSERT_EQ(chunks_.size(), 3u);
    }

    TempDirScope tmp_ = TempDirScope::unique_under("wikichunk-jsonl");
    std::filesystem::path storePath_ = tmp_.path() / "nested" / "chunks.jsonl";
    chunking::DocumentChunker chunker_;
    std::vector<chunking::Chunk> chunks_;
};

TEST_F(JsonlChunkStoreTest, WritesRecordsOnFlush) {
    auto opened = JsonlChunkStore::open(storePath_, 10);
    ASSERT_TRUE(opened) << opened.error().message;
    auto store = std::move(opened).value();

    for (const auto& chunk : chunks_) {
        auto put = store->put(chunk);
        ASSERT_TRUE(put);
        EXPECT_TRUE(put.value());
    }
    EXPECT_EQ(store->pendingCount(), 3u);
    EXPECT_TRUE(readLines(storePath_).empty());

    ASSERT_TRUE(store->flush());
    EXPECT_EQ(store->pendingCount(), 0u);

    auto lines = readLines(storePath_);
    ASSERT_EQ(lines.size(), 3u);
    auto parsed = chunkFromJson(nlohmann::json::parse(lines[1]));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value(), chunks_[1]);
}

TEST_F(JsonlChunkStoreTest, FlushesWhenBatchIsFull) {
    auto store = JsonlChunkStore::open(storePath_, 2).value();
    ASSERT_TRUE(store->put(chunks_[0]));
    EXPECT_TRUE(readLines(storePath_).empty());
    ASSERT_TRUE(store->put(chunks_[1]));
    EXPECT_EQ(readLines(storePath_).size(), 2u);
    EXPECT_EQ(store->pendingCount(), 0u);
}

TEST_F(JsonlChunkStoreTest, ReopenedStoreSkipsExistingIds) {
    {
        auto store = JsonlChunkStore::open(storePath_).value();
        for (const auto& chunk : chunks_) {
            ASSERT_TRUE(store->put(chunk));
        }
        // Destructor flushes pending records
    }
    ASSERT_EQ(readLines(storePath_).size(), 3u);

    auto store = JsonlChunkStore::open(storePath_).value();
    EXPECT_EQ(store->size(), 3u);
    for (const auto& chunk : chunks_) {
        EXPECT_TRUE(store->contains(chunk.chunk_id));
        auto put = store->put(chunk);
        ASSERT_TRUE(put);
        EXPECT_FALSE(put.value());
    }
    ASSERT_TRUE(store->flush());
    EXPECT_EQ(readLines(storePath_).size(), 3u);
}

TEST_F(JsonlChunkStoreTest, SkipsMalformedLines) {
    std::filesystem::create_directories(storePath_.parent_path());
    {
        std::ofstream out(storePath_);
        out << "not json\n";
        out << "{\"no_id\": true}\n";
        out << toJson(chunks_[0]).dump() << "\n";
    }

    auto store = JsonlChunkStore::open(storePath_).value();
    EXPECT_EQ(store->size(), 1u);
    EXPECT_TRUE(store->contains(chunks_[0].chunk_id));
}

TEST_F(JsonlChunkStoreTest, RejectsInvalidArguments) {
    auto zeroBatch = JsonlChunkStore::open(storePath_, 0);
    ASSERT_FALSE(zeroBatch);
    EXPECT_EQ(zeroBatch.error().code, ErrorCode::InvalidArgument);

    auto emptyPath = JsonlChunkStore::open("");
    ASSERT_FALSE(emptyPath);
    EXPECT_EQ(emptyPath.error().code, ErrorCode::InvalidArgument);
}

TEST_F(JsonlChunkStoreTest, InvalidUtf8TextIsStoredWithReplacement) {
    auto chunk = chunks_[0];
    chunk.text = "bad \xff byte";

    {
        auto store = JsonlChunkStore::open(storePath_).value();
        auto put = store->put(chunk);
        ASSERT_TRUE(put);
        EXPECT_TRUE(put.value());
        ASSERT_TRUE(store->flush());
    }

    auto lines = readLines(storePath_);
    ASSERT_EQ(lines.size(), 1u);
    auto parsed = chunkFromJson(nlohmann::json::parse(lines[0]));
    ASSERT_TRUE(parsed) << parsed.error().message;
    EXPECT_EQ(parsed.value().text, "bad \xEF\xBF\xBD byte");
    EXPECT_EQ(parsed.value().chunk_id, chunk.chunk_id);
}

TEST_F(JsonlChunkStoreTest, FailedAutoFlushRollsBackBatch) {
    auto store = JsonlChunkStore::open(storePath_, 2).value();
    // A directory where the file should be makes every append fail
    std::filesystem::create_directories(storePath_);

    auto failed = store->putAll(chunks_);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::WriteError);
    EXPECT_EQ(store->pendingCount(), 0u);
    EXPECT_EQ(store->size(), 0u);
    for (const auto& chunk : chunks_) {
        EXPECT_FALSE(store->contains(chunk.chunk_id));
    }

    std::filesystem::remove(storePath_);
    auto retried = store->putAll(chunks_);
    ASSERT_TRUE(retried) << retried.error().message;
    EXPECT_EQ(retried.value(), 3u);
    EXPECT_EQ(readLines(storePath_).size(), 3u);
}

TEST_F(JsonlChunkStoreTest, FailedFlushKeepsRecordsPending) {
    auto store = JsonlChunkStore::open(storePath_).value();
    ASSERT_TRUE(store->put(chunks_[0]));
    std::filesystem::create_directories(storePath_);

    EXPECT_FALSE(store->flush());
    EXPECT_EQ(store->pendingCount(), 1u);
    EXPECT_TRUE(store->contains(chunks_[0].chunk_id));

    std::filesystem::remove(storePath_);
    ASSERT_TRUE(store->flush());
    EXPECT_EQ(readLines(storePath_).size(), 1u);
}

TEST_F(JsonlChunkStoreTest, DestructorSurvivesFailedFlush) {
    EXPECT_NO_THROW({
        auto store = JsonlChunkStore::open(storePath_).value();
        EXPECT_TRUE(store->put(chunks_[0]));
        std::filesystem::create_directories(storePath_);
    });
    EXPECT_TRUE(std::filesystem::is_directory(storePath_));
}
