#include <gtest/gtest.h>
#include <toc_outline/line_classifier.h>
#include <toc_outline/outline_types.h>

using namespace toc_outline;

class LineClassifierTest : public ::testing::Test {
protected:
    LineClassifier classifier;
};

TEST_F(LineClassifierTest, ChapterMarkerWithTitleLookahead) {
    auto result = classifier.classify("제1장", std::string("적용기준 ······· 3"));

    EXPECT_EQ(result.kind, LineKind::Chapter);
    EXPECT_EQ(result.number, "1");
    EXPECT_EQ(result.title, "적용기준");
    ASSERT_TRUE(result.target_page.has_value());
    EXPECT_EQ(*result.target_page, 3);
    EXPECT_TRUE(result.consumes_next);
}

TEST_F(LineClassifierTest, ChapterMarkerToleratesInnerSpacing) {
    auto result = classifier.classify("  제 12 장 ", std::string("배관공사 ········· 601"));

    EXPECT_EQ(result.kind, LineKind::Chapter);
    EXPECT_EQ(result.number, "12");
    EXPECT_EQ(result.title, "배관공사");
    EXPECT_EQ(result.target_page.value_or(0), 601);
}

TEST_F(LineClassifierTest, ChapterMarkerWithoutUsableTitleLine) {
    auto no_next = classifier.classify("제3장");
    EXPECT_EQ(no_next.kind, LineKind::Chapter);
    EXPECT_EQ(no_next.number, "3");
    EXPECT_TRUE(no_next.title.empty());
    EXPECT_FALSE(no_next.target_page.has_value());
    EXPECT_FALSE(no_next.consumes_next);

    // no leader on the next line: marker still stands, next line is left for its own rule
    auto bad_next = classifier.classify("제3장", std::string("토공사"));
    EXPECT_EQ(bad_next.kind, LineKind::Chapter);
    EXPECT_TRUE(bad_next.title.empty());
    EXPECT_FALSE(bad_next.consumes_next);
}

TEST_F(LineClassifierTest, ChapterMarkerMustBeAloneOnTheLine) {
    std::string number;
    EXPECT_TRUE(classifier.match_chapter_marker("제7장", number));
    EXPECT_EQ(number, "7");
    EXPECT_FALSE(classifier.match_chapter_marker("제7장 돌공사", number));
    EXPECT_FALSE(classifier.match_chapter_marker("제장", number));
}

TEST_F(LineClassifierTest, HierarchicalItem) {
    auto result = classifier.classify("1-1 일반사항 ······ 3");

    EXPECT_EQ(result.kind, LineKind::Item);
    EXPECT_EQ(result.number, "1-1");
    EXPECT_EQ(result.title, "일반사항");
    EXPECT_EQ(result.target_page.value_or(0), 3);
    EXPECT_FALSE(result.consumes_next);
    EXPECT_EQ(item_level(result.number), 1);
}

TEST_F(LineClassifierTest, DeepItemWithDotLeader) {
    auto result = classifier.classify("2-3-4 콘크리트 타설......... 45");

    EXPECT_EQ(result.kind, LineKind::Item);
    EXPECT_EQ(result.number, "2-3-4");
    EXPECT_EQ(result.title, "콘크리트 타설");
    EXPECT_EQ(result.target_page.value_or(0), 45);
    EXPECT_EQ(item_level(result.number), 2);
}

TEST_F(LineClassifierTest, ItemWithoutTitle) {
    auto result = classifier.classify("4-2 ······ 18");

    EXPECT_EQ(result.kind, LineKind::Item);
    EXPECT_EQ(result.number, "4-2");
    EXPECT_TRUE(result.title.empty());
    EXPECT_EQ(result.target_page.value_or(0), 18);
}

TEST_F(LineClassifierTest, SingleSegmentNumberIsNotAnItem) {
    // "1" alone is not a dash-delimited numeral, and a leading digit excludes Other too
    EXPECT_EQ(classifier.classify("1 개요 ······ 3").kind, LineKind::None);
}

TEST_F(LineClassifierTest, OtherTitledEntry) {
    auto result = classifier.classify("참 고 자 료 ········ 901");

    EXPECT_EQ(result.kind, LineKind::Other);
    EXPECT_TRUE(result.number.empty());
    EXPECT_EQ(result.title, "참 고 자 료");
    EXPECT_EQ(result.target_page.value_or(0), 901);
}

TEST_F(LineClassifierTest, ShortLeaderIsOrdinaryPunctuation) {
    EXPECT_EQ(classifier.classify("부록. 12").kind, LineKind::None);
    EXPECT_EQ(classifier.classify("1-1 일반사항·3").kind, LineKind::None);
    EXPECT_EQ(classifier.classify("부록... 12").kind, LineKind::Other);
}

TEST_F(LineClassifierTest, NoiseLinesDoNotMatch) {
    EXPECT_FALSE(classifier.classify(""));
    EXPECT_FALSE(classifier.classify("   "));
    EXPECT_FALSE(classifier.classify("목  차"));
    EXPECT_FALSE(classifier.classify("3"));
    EXPECT_FALSE(classifier.classify("이 표준품셈은 정부 등 공공기관에서 시행하는 공사에 적용한다."));
    EXPECT_FALSE(classifier.classify("······ 12"));
}

TEST_F(LineClassifierTest, OverlongLinesAreNoise) {
    std::string body;
    while (body.size() < 100000) {
        body += "가";
    }

    EXPECT_EQ(classifier.classify(body + " ······ 3").kind, LineKind::None);
    EXPECT_EQ(classifier.classify("1-1" + body + " ······ 3").kind, LineKind::None);
    EXPECT_EQ(classifier.classify(body).kind, LineKind::None);

    // an overlong lookahead leaves the chapter untitled
    auto chapter = classifier.classify("제1장", body + " ······ 3");
    EXPECT_EQ(chapter.kind, LineKind::Chapter);
    EXPECT_TRUE(chapter.title.empty());
    EXPECT_FALSE(chapter.consumes_next);
}

TEST_F(LineClassifierTest, MaxLineLengthIsConfigurable) {
    OutlineOptions options;
    options.max_line_length = 24;
    LineClassifier strict(options);

    EXPECT_EQ(strict.classify("부록 ···· 12").kind, LineKind::Other);
    EXPECT_EQ(strict.classify("참 고 자 료 ········ 45").kind, LineKind::None);
    EXPECT_EQ(classifier.classify("참 고 자 료 ········ 45").kind, LineKind::Other);

    options.max_line_length = 0;
    EXPECT_THROW(LineClassifier{options}, ContractError);
}

TEST_F(LineClassifierTest, ItemTakesPrecedenceOverOther) {
    auto result = classifier.classify("3-1 토공 ····· 77");
    EXPECT_EQ(result.kind, LineKind::Item);
}

TEST_F(LineClassifierTest, MatchChapterTitleAlone) {
    auto entry = classifier.match_chapter_title("관부설 및 접합공사 ········ 321");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->title, "관부설 및 접합공사");
    EXPECT_EQ(entry->page, 321);

    EXPECT_FALSE(classifier.match_chapter_title("관부설 및 접합공사").has_value());
}

TEST_F(LineClassifierTest, ConfigurableFillerThreshold) {
    OutlineOptions options;
    options.min_filler_run = 2;
    LineClassifier relaxed(options);

    auto result = relaxed.classify("부록. 12");
    EXPECT_EQ(result.kind, LineKind::Other);
    EXPECT_EQ(result.title, "부록");
    EXPECT_EQ(classifier.classify("부록. 12").kind, LineKind::None);
}

TEST_F(LineClassifierTest, ConfigurableChapterMarker) {
    OutlineOptions options;
    options.chapter_prefix = "Chapter ";
    options.chapter_suffix = "";
    LineClassifier english(options);

    auto result = english.classify("Chapter 4", std::string("Earthwork ...... 88"));
    EXPECT_EQ(result.kind, LineKind::Chapter);
    EXPECT_EQ(result.number, "4");
    EXPECT_EQ(result.title, "Earthwork");
    EXPECT_EQ(result.target_page.value_or(0), 88);
}

TEST_F(LineClassifierTest, InvalidOptionsThrow) {
    OutlineOptions options;
    options.min_filler_run = 0;
    EXPECT_THROW(LineClassifier{options}, ContractError);

    options = OutlineOptions{};
    options.filler_chars.clear();
    EXPECT_THROW(LineClassifier{options}, ContractError);
}

TEST(ClassifyLineTest, FreeFunctionUsesDefaultTypography) {
    auto result = classify_line("제2장", std::string("가설공사 ······ 41"));
    EXPECT_EQ(result.kind, LineKind::Chapter);
    EXPECT_EQ(result.title, "가설공사");
    EXPECT_EQ(result.target_page.value_or(0), 41);
}
