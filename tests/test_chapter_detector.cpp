#include <gtest/gtest.h>
#include <paper_splitter/chapter_detector.h>
#include <paper_splitter/header_extractor.h>
#include "test_helpers.h"

using namespace paper_splitter;
using paper_splitter_test::FakeDocument;

TEST(PageHeaderExtractorTest, KeepsOnlyBlocksStartingInTopBand) {
    FakeDocument doc(1, 1000.0f);
    doc.with_block(1, 10.0f, "  SOLVED  ")
       .with_block(1, 150.0f, "Sample Question Paper-2\n")
       .with_block(1, 200.0f, "Section A")
       .with_block(1, 700.0f, "Page 1");

    PageHeaderExtractor extractor;
    EXPECT_EQ(extractor.extract_header(doc, 1), "SOLVED Sample Question Paper-2");
}

TEST(PageHeaderExtractorTest, EmptyWhenNothingInBand) {
    FakeDocument doc(1);
    doc.with_block(1, 500.0f, "Self Assessment Paper-1");

    EXPECT_EQ(PageHeaderExtractor().extract_header(doc, 1), "");
}

TEST(PageHeaderExtractorTest, FractionIsConfigurable) {
    FakeDocument doc(1, 1000.0f);
    doc.with_block(1, 400.0f, "Unit 5");

    EXPECT_EQ(PageHeaderExtractor(0.2).extract_header(doc, 1), "");
    EXPECT_EQ(PageHeaderExtractor(0.5).extract_header(doc, 1), "Unit 5");
}

TEST(PageHeaderExtractorTest, RejectsInvalidFraction) {
    EXPECT_THROW(PageHeaderExtractor(0.0), std::invalid_argument);
    EXPECT_THROW(PageHeaderExtractor(1.5), std::invalid_argument);
}

TEST(ChapterDetectorTest, DetectsOnePerMatchingPageInPageOrder) {
    FakeDocument doc(30);
    doc.with_header(21, "SOLUTIONS Sample Question Paper-2")
       .with_header(1, "UNSOLVED Self Assessment Paper-1")
       .with_header(11, "SOLVED Sample Question Paper-2")
       .with_header(15, "Physics Class XII");

    auto detections = ChapterDetector().detect_chapters(doc);

    std::vector<ChapterDetection> expected = {
        {"UNSOLVED Self Assessment Paper-1", "UNSOLVED", 1},
        {"SOLVED Sample Question Paper-2", "SOLVED", 11},
        {"SOLUTIONS Sample Question Paper-2", "SOLUTIONS", 21}
    };
    EXPECT_EQ(detections, expected);
}

TEST(ChapterDetectorTest, TagIsFirstTokenOfName) {
    ChapterDetector detector;
    EXPECT_EQ(detector.detect_in_header("Mind Map-2")->tag, "Mind");
    EXPECT_EQ(detector.detect_in_header("UNSOLVED PP-3")->tag, "UNSOLVED");
    EXPECT_FALSE(detector.detect_in_header("Contents").has_value());
}

TEST(ChapterDetectorTest, PrefersSpecificPaperOverGenericChapter) {
    FakeDocument doc(4);
    doc.with_block(2, 20.0f, "Self Assessment Paper-3")
       .with_block(2, 60.0f, "Chapter 3");

    auto detections = ChapterDetector().detect_chapters(doc);
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].name, "Self Assessment Paper-3");
    EXPECT_EQ(detections[0].page, 2);
}

TEST(ChapterDetectorTest, RepeatedNamesOnDifferentPagesAreKept) {
    FakeDocument doc(3);
    doc.with_header(1, "Mind map").with_header(2, "Mind map");

    auto detections = ChapterDetector().detect_chapters(doc);
    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].page, 1);
    EXPECT_EQ(detections[1].page, 2);
}

TEST(ChapterDetectorTest, UnreadablePageIsSkipped) {
    FakeDocument doc(3);
    doc.with_header(1, "Unit 1").with_header(2, "Unit 2").with_header(3, "Unit 3")
       .with_unreadable_page(2);

    auto detections = ChapterDetector().detect_chapters(doc);
    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].page, 1);
    EXPECT_EQ(detections[1].page, 3);
}

TEST(ChapterDetectorTest, EmptyDocumentHasNoDetections) {
    FakeDocument doc(0);
    EXPECT_TRUE(ChapterDetector().detect_chapters(doc).empty());
}

TEST(ChapterDetectorTest, ParallelScanMatchesSequentialScan) {
    FakeDocument doc(200);
    for (int page = 1; page <= 200; page += 7) {
        doc.with_header(page, (page % 2 ? "UNSOLVED Practice Paper-" : "Unit ") + std::to_string(page));
    }
    doc.with_unreadable_page(50);

    DetectorOptions parallel;
    parallel.page_threads = 4;

    auto sequential_result = ChapterDetector().detect_chapters(doc);
    auto parallel_result = ChapterDetector(parallel).detect_chapters(doc);
    EXPECT_FALSE(sequential_result.empty());
    EXPECT_EQ(parallel_result, sequential_result);
}
