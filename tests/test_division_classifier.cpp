#include <gtest/gtest.h>
#include <toc_outline/division_classifier.h>

using namespace toc_outline;

class DivisionClassifierTest : public ::testing::Test {
protected:
    std::vector<OutlineNode> CreateChapters() {
        return {
            OutlineNode::chapter("1", "적용기준", 3),
            OutlineNode::chapter("2", "가설공사", 10),
            OutlineNode::chapter("5", "도로포장공사", 100),
            OutlineNode::chapter("6", "관부설 및 접합공사", 140),
            OutlineNode::chapter("18", "철골공사", 300),
            OutlineNode::chapter("40", "공 통", 900),
        };
    }

    DivisionClassifier classifier;
};

TEST_F(DivisionClassifierTest, LookupIsExactModuloSpacing) {
    EXPECT_EQ(classifier.lookup("적용기준"), Division::Common);
    EXPECT_EQ(classifier.lookup("관부설 및 접합공사"), Division::Civil);
    EXPECT_EQ(classifier.lookup("관부설  및   접합공사"), Division::Civil);
    EXPECT_EQ(classifier.lookup(" 철골공사 "), Division::Architecture);
    EXPECT_EQ(classifier.lookup("배관공사"), Division::Mechanical);
    EXPECT_EQ(classifier.lookup("기계설비"), Division::Maintenance);

    // no keyword guessing
    EXPECT_FALSE(classifier.lookup("철골").has_value());
    EXPECT_FALSE(classifier.lookup("관부설및접합공사").has_value());
    EXPECT_FALSE(classifier.lookup("").has_value());
}

TEST_F(DivisionClassifierTest, SpansFollowCanonicalOrder) {
    auto report = classifier.classify(CreateChapters(), 1000);

    ASSERT_EQ(report.spans.size(), 5u);
    EXPECT_TRUE(report.unclassified.empty());
    EXPECT_TRUE(report.diagnostics.empty());

    const auto& common = report.spans.at(Division::Common);
    EXPECT_EQ(common.start_page, 3);
    EXPECT_EQ(common.end_page, 99);
    EXPECT_EQ(common.chapters.size(), 2u);

    const auto& civil = report.spans.at(Division::Civil);
    EXPECT_EQ(civil.start_page, 100);
    EXPECT_EQ(civil.end_page, 299);
    EXPECT_EQ(civil.chapters.size(), 2u);

    // mechanical is missing, so architecture runs up to maintenance
    const auto& architecture = report.spans.at(Division::Architecture);
    EXPECT_EQ(architecture.start_page, 300);
    EXPECT_EQ(architecture.end_page, 899);

    const auto& mechanical = report.spans.at(Division::Mechanical);
    EXPECT_FALSE(mechanical.found());
    EXPECT_FALSE(mechanical.start_page.has_value());
    EXPECT_FALSE(mechanical.end_page.has_value());
    EXPECT_TRUE(mechanical.chapters.empty());

    const auto& maintenance = report.spans.at(Division::Maintenance);
    EXPECT_EQ(maintenance.start_page, 900);
    EXPECT_EQ(maintenance.end_page, 1000);
}

TEST_F(DivisionClassifierTest, StartPageIsFirstWriteWins) {
    auto report = classifier.classify({
        OutlineNode::chapter("2", "가설공사", 10),
        OutlineNode::chapter("1", "적용기준", 3),
    }, 50);

    const auto& common = report.spans.at(Division::Common);
    EXPECT_EQ(common.start_page, 10);
    EXPECT_EQ(common.end_page, 50);
    ASSERT_EQ(common.chapters.size(), 2u);
    EXPECT_EQ(common.chapters[1].title, "적용기준");
}

TEST_F(DivisionClassifierTest, UnclassifiedChapterIsReportedNotDefaulted) {
    auto chapters = CreateChapters();
    chapters.insert(chapters.begin() + 1, OutlineNode::chapter("99", "삭제예정항목", 8));

    auto report = classifier.classify(chapters, 1000);

    ASSERT_EQ(report.unclassified.size(), 1u);
    EXPECT_EQ(report.unclassified[0].title, "삭제예정항목");
    EXPECT_EQ(report.spans.at(Division::Common).chapters.size(), 2u);

    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].kind, DiagnosticKind::UnclassifiedChapter);
    EXPECT_EQ(report.diagnostics[0].page, 8);
    EXPECT_EQ(report.diagnostics[0].subject, "제99장 삭제예정항목");
}

TEST_F(DivisionClassifierTest, NoChaptersMeansNothingFound) {
    auto report = classifier.classify({}, 10);

    ASSERT_EQ(report.spans.size(), 5u);
    for (const auto& [division, span] : report.spans) {
        EXPECT_FALSE(span.found()) << division_name(division);
        EXPECT_FALSE(span.end_page.has_value());
    }
}

TEST_F(DivisionClassifierTest, PopulatedSpansAreOrdered) {
    auto report = classifier.classify(CreateChapters(), 1000);
    for (const auto& [division, span] : report.spans) {
        if (span.found()) {
            ASSERT_TRUE(span.end_page.has_value());
            EXPECT_LE(*span.start_page, *span.end_page) << division_name(division);
        } else {
            EXPECT_FALSE(span.end_page.has_value());
        }
    }
}

TEST_F(DivisionClassifierTest, OutOfOrderDivisionCollapsesToStart) {
    // civil printed before common in the contents
    auto report = classifier.classify({
        OutlineNode::chapter("5", "도로포장공사", 20),
        OutlineNode::chapter("1", "적용기준", 30),
    }, 100);

    const auto& common = report.spans.at(Division::Common);
    EXPECT_EQ(common.start_page, 30);
    EXPECT_EQ(common.end_page, 30);
    EXPECT_EQ(report.spans.at(Division::Civil).end_page, 100);

    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0].kind, DiagnosticKind::DivisionOutOfOrder);
}

TEST_F(DivisionClassifierTest, CustomTable) {
    DivisionClassifier custom({{"Earthwork", Division::Civil}, {"Roofing", Division::Architecture}});

    auto report = custom.classify({
        OutlineNode::chapter("1", "Earthwork", 5),
        OutlineNode::chapter("2", "적용기준", 9),
        OutlineNode::chapter("3", "Roofing", 20),
    }, 40);

    EXPECT_EQ(report.spans.at(Division::Civil).end_page, 19);
    EXPECT_EQ(report.spans.at(Division::Architecture).end_page, 40);
    EXPECT_EQ(report.unclassified.size(), 1u);
}

TEST_F(DivisionClassifierTest, ContractViolations) {
    EXPECT_THROW(classifier.classify(CreateChapters(), 0), ContractError);
    EXPECT_THROW(classifier.classify({OutlineNode::item("1-1", "일반사항", 3)}, 10), ContractError);
}

TEST(DivisionNamesTest, NamesAndLabels) {
    EXPECT_STREQ(division_name(Division::Common), "common");
    EXPECT_STREQ(division_name(Division::Maintenance), "maintenance");
    EXPECT_STREQ(division_label(Division::Mechanical), "기계설비부문");
}

TEST(ClassifyDivisionsTest, FreeFunctionUsesDefaultTable) {
    auto spans = classify_divisions({OutlineNode::chapter("29", "배관공사", 601)}, 700).spans;
    EXPECT_EQ(spans.at(Division::Mechanical).start_page, 601);
    EXPECT_EQ(spans.at(Division::Mechanical).end_page, 700);
}
