#include <gtest/gtest.h>
#include <wikichunk/chunking/chunk_identity.h>
#include <wikichunk/chunking/section_chunker.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wikichunk::chunking;
using wikichunk::document::Section;

namespace {

// n whitespace tokens with no sentence punctuation
std::string words(size_t n, const std::string& word = "word") {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += word;
    }
    return out;
}

// A sentence of exactly `tokens` whitespace tokens, tagged so it can be told apart
std::string sentence(size_t tag, size_t tokens) {
    return "S" + std::to_string(tag) + " " + words(tokens - 2) + " end.";
}

std::string sentences(size_t count, size_t tokens) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += sentence(i, tokens);
    }
    return out;
}

Section makeSection(std::vector<std::string> paragraphs,
                    std::vector<std::string> path = {"Topic", "Detail"}) {
    Section section("Detail", static_cast<int>(path.size()), std::move(path));
    section.content = std::move(paragraphs);
    return section;
}

} // namespace

class SectionChunkerTest : public ::testing::Test {
protected:
    ChunkingPolicy policy_; // 80 / 220 / 300 / 1
    SectionChunker chunker_{policy_, whitespaceTokenCount};
};

TEST_F(SectionChunkerTest, MergesSmallParagraphsAndKeepsInBudgetParagraph) {
    auto section = makeSection({words(30, "alpha"), words(40, "beta"), words(250, "gamma")});
    auto chunks = chunker_.chunkSection("doc", section);

    ASSERT_EQ(chunks.size(), 2u);

    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[0].token_count, 70u);
    EXPECT_EQ(chunks[0].paragraph_index, 0u);
    EXPECT_EQ(chunks[0].text, words(30, "alpha") + "\n\n" + words(40, "beta"));
    EXPECT_FALSE(chunks[0].subchunk_index.has_value());

    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Paragraph);
    EXPECT_EQ(chunks[1].token_count, 250u);
    EXPECT_EQ(chunks[1].paragraph_index, 2u);
    EXPECT_EQ(chunks[1].text, section.content[2]);
    EXPECT_FALSE(chunks[1].subchunk_index.has_value());
}

TEST_F(SectionChunkerTest, ChunksCarrySectionMetadataAndIds) {
    auto section = makeSection({words(100)});
    auto chunks = chunker_.chunkSection("doc-7", section);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].document_id, "doc-7");
    EXPECT_EQ(chunks[0].section_path, section.path);
    EXPECT_EQ(chunks[0].chunk_id, deriveChunkId("doc-7", section.path, 0, std::nullopt));
}

TEST_F(SectionChunkerTest, EmptySectionYieldsNoChunks) {
    EXPECT_TRUE(chunker_.chunkSection("doc", makeSection({})).empty());
}

TEST_F(SectionChunkerTest, LoneSmallParagraphBecomesMergedChunk) {
    auto chunks = chunker_.chunkSection("doc", makeSection({words(5)}));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[0].text, words(5));
    EXPECT_EQ(chunks[0].token_count, 5u);
}

TEST_F(SectionChunkerTest, MergeStopsBeforeExceedingMax) {
    auto section = makeSection({words(79), words(79), words(79), words(79)});
    auto chunks = chunker_.chunkSection("doc", section);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[0].token_count, 237u);
    EXPECT_EQ(chunks[0].paragraph_index, 0u);
    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[1].token_count, 79u);
    EXPECT_EQ(chunks[1].paragraph_index, 3u);

    for (const auto& chunk : chunks) {
        EXPECT_LE(chunk.token_count, static_cast<size_t>(policy_.max_tokens));
    }
}

TEST_F(SectionChunkerTest, ParagraphAtMinimumIsNeverFoldedIntoBuffer) {
    auto section = makeSection({words(10), words(80), words(10)});
    auto chunks = chunker_.chunkSection("doc", section);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[0].paragraph_index, 0u);
    EXPECT_EQ(chunks[0].token_count, 10u);
    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Paragraph);
    EXPECT_EQ(chunks[1].paragraph_index, 1u);
    EXPECT_EQ(chunks[2].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[2].paragraph_index, 2u);
}

TEST_F(SectionChunkerTest, ParagraphAtMaxIsKeptAboveMaxIsSplit) {
    auto atMax = chunker_.chunkSection("doc", makeSection({words(300)}));
    ASSERT_EQ(atMax.size(), 1u);
    EXPECT_EQ(atMax[0].chunk_type, ChunkType::Paragraph);

    auto overMax = chunker_.chunkSection("doc", makeSection({words(301)}));
    ASSERT_EQ(overMax.size(), 1u);
    EXPECT_EQ(overMax[0].chunk_type, ChunkType::Split);
    EXPECT_EQ(overMax[0].subchunk_index, std::optional<size_t>(0));
}

TEST_F(SectionChunkerTest, SplitsOversizedParagraphIntoOverlappingWindows) {
    // 10 sentences of 70 tokens: 4 sentences reach the 220 target
    auto section = makeSection({sentences(10, 70)});
    auto chunks = chunker_.chunkSection("doc", section);

    ASSERT_EQ(chunks.size(), 3u);
    std::vector<std::vector<size_t>> expected{{0, 1, 2, 3}, {3, 4, 5, 6}, {6, 7, 8, 9}};
    for (size_t w = 0; w < chunks.size(); ++w) {
        const auto& chunk = chunks[w];
        EXPECT_EQ(chunk.chunk_type, ChunkType::Split);
        EXPECT_EQ(chunk.paragraph_index, 0u);
        EXPECT_EQ(chunk.subchunk_index, std::optional<size_t>(w));
        EXPECT_EQ(chunk.token_count, 280u);

        std::string text;
        for (size_t s : expected[w]) {
            if (!text.empty()) {
                text += ' ';
            }
            text += sentence(s, 70);
        }
        EXPECT_EQ(chunk.text, text);
        EXPECT_EQ(chunk.chunk_id, deriveChunkId("doc", section.path, 0, w));
    }
}

TEST_F(SectionChunkerTest, LastWindowMayBeShort) {
    auto chunks = chunker_.chunkSection("doc", makeSection({sentences(9, 70)}));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].text, sentence(6, 70) + " " + sentence(7, 70) + " " + sentence(8, 70));
    EXPECT_EQ(chunks[2].token_count, 210u);
}

TEST_F(SectionChunkerTest, SplitWindowsReconstructSentenceSequence) {
    SentenceSegmenter segmenter;
    auto paragraph = sentences(13, 45);
    auto original = segmenter.segment(paragraph);
    auto chunks = chunker_.splitParagraph("doc", makeSection({}), paragraph, 4);

    std::vector<std::string> rebuilt;
    for (const auto& chunk : chunks) {
        auto window = segmenter.segment(chunk.text);
        // Sentences are tagged, so the repeated prefix is exactly the overlap
        size_t shared = 0;
        for (size_t k = std::min(window.size(), rebuilt.size()); k > 0; --k) {
            if (std::equal(window.begin(), window.begin() + static_cast<long>(k),
                           rebuilt.end() - static_cast<long>(k))) {
                shared = k;
                break;
            }
        }
        EXPECT_LE(shared, static_cast<size_t>(policy_.sentence_overlap));
        rebuilt.insert(rebuilt.end(), window.begin() + static_cast<long>(shared), window.end());
        EXPECT_EQ(chunk.paragraph_index, 4u);
    }
    EXPECT_EQ(rebuilt, original);
}

TEST_F(SectionChunkerTest, WindowMayExceedMaxToKeepSentencesWhole) {
    auto paragraph = words(400) + ".";
    auto chunks = chunker_.chunkSection("doc", makeSection({paragraph}));

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Split);
    EXPECT_EQ(chunks[0].token_count, 400u);
    EXPECT_GT(chunks[0].token_count, static_cast<size_t>(policy_.max_tokens));
}

TEST_F(SectionChunkerTest, OverlapIsClampedForSingleSentenceWindows) {
    // Each sentence alone reaches the target, so no sentence is repeated
    auto chunks = chunker_.chunkSection("doc", makeSection({sentences(3, 250)}));

    ASSERT_EQ(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].text, sentence(i, 250));
    }
}

TEST_F(SectionChunkerTest, ZeroOverlapProducesDisjointWindows) {
    ChunkingPolicy policy;
    policy.sentence_overlap = 0;
    SectionChunker chunker(policy, whitespaceTokenCount);

    auto chunks = chunker.chunkSection("doc", makeSection({sentences(8, 70)}));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[1].text.substr(0, 3), "S4 ");
}

TEST_F(SectionChunkerTest, LargerOverlapRepeatsMoreSentences) {
    ChunkingPolicy policy;
    policy.sentence_overlap = 2;
    SectionChunker chunker(policy, whitespaceTokenCount);

    auto chunks = chunker.chunkSection("doc", makeSection({sentences(6, 70)}));
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text.substr(0, 3), "S0 ");
    EXPECT_EQ(chunks[1].text.substr(0, 3), "S2 ");
}

TEST_F(SectionChunkerTest, SplitFlushesPendingBufferFirst) {
    auto chunks = chunker_.chunkSection("doc", makeSection({words(20), sentences(5, 70)}));

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Merged);
    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Split);
    EXPECT_EQ(chunks[2].chunk_type, ChunkType::Split);
    EXPECT_EQ(chunks[1].paragraph_index, 1u);
}

TEST_F(SectionChunkerTest, ParagraphWithoutSentencesYieldsNoWindows) {
    EXPECT_TRUE(chunker_.splitParagraph("doc", makeSection({}), "   ", 0).empty());
}

TEST(SectionChunkerPolicyTest, RejectsInvalidPolicies) {
    auto expectRejected = [](ChunkingPolicy policy) {
        EXPECT_THROW({ SectionChunker chunker(policy, whitespaceTokenCount); },
                     std::invalid_argument);
    };

    ChunkingPolicy minNotBelowTarget;
    minNotBelowTarget.min_tokens = 220;
    expectRejected(minNotBelowTarget);

    ChunkingPolicy targetAboveMax;
    targetAboveMax.target_tokens = 301;
    expectRejected(targetAboveMax);

    ChunkingPolicy negativeOverlap;
    negativeOverlap.sentence_overlap = -1;
    expectRejected(negativeOverlap);

    ChunkingPolicy zeroMin;
    zeroMin.min_tokens = 0;
    expectRejected(zeroMin);

    ChunkingPolicy targetEqualsMax;
    targetEqualsMax.target_tokens = 300;
    EXPECT_NO_THROW({ SectionChunker chunker(targetEqualsMax, whitespaceTokenCount); });
}

TEST(SectionChunkerPolicyTest, RejectsEmptyTokenizer) {
    EXPECT_THROW({ SectionChunker chunker(ChunkingPolicy{}, Tokenizer{}); }, std::invalid_argument);
}

TEST(SectionChunkerPolicyTest, TokenizerExceptionsPropagate) {
    Tokenizer failing = [](std::string_view) -> size_t {
        throw std::runtime_error("tokenizer offline");
    };
    SectionChunker chunker(ChunkingPolicy{}, failing);
    EXPECT_THROW(chunker.chunkSection("doc", makeSection({"text"})), std::runtime_error);
}
