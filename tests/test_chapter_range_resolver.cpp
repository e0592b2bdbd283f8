#include <gtest/gtest.h>
#include <toc_outline/chapter_range_resolver.h>

using namespace toc_outline;

namespace {

std::vector<OutlineNode> chapters_at(const std::vector<int>& pages) {
    std::vector<OutlineNode> chapters;
    for (size_t i = 0; i < pages.size(); ++i) {
        chapters.push_back(OutlineNode::chapter(std::to_string(i + 1),
                                                "장" + std::to_string(i + 1), pages[i]));
    }
    return chapters;
}

std::vector<std::pair<int, int>> spans_of(const RangeResolution& resolution) {
    std::vector<std::pair<int, int>> spans;
    for (const auto& range : resolution.ranges) {
        spans.emplace_back(range.start_page, range.end_page);
    }
    return spans;
}

} // namespace

TEST(ChapterRangeResolverTest, ContiguousRanges) {
    auto resolution = resolve_chapter_ranges(chapters_at({3, 10, 25}), 47);

    using Span = std::pair<int, int>;
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{3, 9}, {10, 24}, {25, 47}}));
    EXPECT_TRUE(resolution.diagnostics.empty());
    EXPECT_EQ(resolution.ranges[1].page_count(), 15);
    EXPECT_EQ(resolution.ranges[2].chapter.title, "장3");
}

TEST(ChapterRangeResolverTest, StartBeyondDocumentIsRejected) {
    auto resolution = resolve_chapter_ranges(chapters_at({3, 10, 50}), 47);

    using Span = std::pair<int, int>;
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{3, 9}, {10, 47}}));

    // the chapter before it is clamped, the chapter itself rejected
    ASSERT_EQ(resolution.diagnostics.size(), 2u);
    EXPECT_EQ(resolution.diagnostics[0].kind, DiagnosticKind::EndClamped);
    EXPECT_EQ(resolution.diagnostics[0].subject, "제2장 장2");
    EXPECT_EQ(resolution.diagnostics[1].kind, DiagnosticKind::StartBeyondDocument);
    EXPECT_EQ(resolution.diagnostics[1].page, 50);
    EXPECT_TRUE(is_rejection(resolution.diagnostics[1].kind));
    EXPECT_FALSE(is_rejection(resolution.diagnostics[0].kind));
}

TEST(ChapterRangeResolverTest, PageZeroIsRejected) {
    auto resolution = resolve_chapter_ranges(chapters_at({0, 5}), 10);

    using Span = std::pair<int, int>;
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{5, 10}}));

    ASSERT_EQ(resolution.diagnostics.size(), 1u);
    EXPECT_EQ(resolution.diagnostics[0].kind, DiagnosticKind::StartBeforeDocument);
    EXPECT_EQ(resolution.diagnostics[0].page, 0);
    EXPECT_STREQ(diagnostic_kind_name(resolution.diagnostics[0].kind), "start_before_document");
    EXPECT_TRUE(is_rejection(resolution.diagnostics[0].kind));
}

TEST(ChapterRangeResolverTest, OutOfOrderChapterIsRejectedAndNamesBoth) {
    auto resolution = resolve_chapter_ranges(chapters_at({3, 20, 15, 30}), 40);

    using Span = std::pair<int, int>;
    // 20 is followed by 15: rejected; 15 itself is fine
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{3, 19}, {15, 29}, {30, 40}}));

    ASSERT_EQ(resolution.diagnostics.size(), 1u);
    const auto& diagnostic = resolution.diagnostics[0];
    EXPECT_EQ(diagnostic.kind, DiagnosticKind::OutOfOrderChapter);
    EXPECT_EQ(diagnostic.subject, "제2장 장2");
    EXPECT_NE(diagnostic.message.find("제2장 장2"), std::string::npos);
    EXPECT_NE(diagnostic.message.find("제3장 장3"), std::string::npos);
}

TEST(ChapterRangeResolverTest, SamePageChaptersRejectEarlierOne) {
    auto resolution = resolve_chapter_ranges(chapters_at({5, 5, 9}), 12);

    using Span = std::pair<int, int>;
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{5, 8}, {9, 12}}));
    ASSERT_EQ(resolution.diagnostics.size(), 1u);
    EXPECT_EQ(resolution.diagnostics[0].kind, DiagnosticKind::OutOfOrderChapter);
}

TEST(ChapterRangeResolverTest, AcceptedNeighboursAreAdjacent) {
    auto chapters = chapters_at({3, 10, 25, 31, 60, 61, 90});
    auto resolution = resolve_chapter_ranges(chapters, 100);

    ASSERT_EQ(resolution.ranges.size(), chapters.size());
    for (size_t i = 0; i + 1 < resolution.ranges.size(); ++i) {
        EXPECT_EQ(resolution.ranges[i].end_page + 1, resolution.ranges[i + 1].start_page);
    }
    for (const auto& range : resolution.ranges) {
        EXPECT_LE(range.start_page, range.end_page);
        EXPECT_LE(range.end_page, 100);
    }
}

TEST(ChapterRangeResolverTest, SingleChapterRunsToTheEnd) {
    auto resolution = resolve_chapter_ranges(chapters_at({1}), 1);
    using Span = std::pair<int, int>;
    EXPECT_EQ(spans_of(resolution), (std::vector<Span>{{1, 1}}));
}

TEST(ChapterRangeResolverTest, EmptyInput) {
    auto resolution = resolve_chapter_ranges({}, 10);
    EXPECT_TRUE(resolution.ranges.empty());
    EXPECT_TRUE(resolution.diagnostics.empty());
}

TEST(ChapterRangeResolverTest, MissingTotalPagesViolatesContract) {
    EXPECT_THROW(resolve_chapter_ranges(chapters_at({3}), 0), ContractError);
    EXPECT_THROW(resolve_chapter_ranges({}, -1), ContractError);
}
