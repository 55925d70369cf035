#include <gtest/gtest.h>
#include <paper_splitter/range_resolver.h>

using paper_splitter::ChapterDetection;
using paper_splitter::resolve_ranges;

TEST(RangeResolverTest, NoDetectionsGiveNoChapters) {
    EXPECT_TRUE(resolve_ranges({}, 40).empty());
}

TEST(RangeResolverTest, SingleDetectionRunsToLastPage) {
    auto chapters = resolve_ranges({{"UNSOLVED Practice Paper-1", "UNSOLVED", 3}}, 12);
    ASSERT_EQ(chapters.size(), 1u);
    EXPECT_EQ(chapters[0].start_page, 3);
    EXPECT_EQ(chapters[0].end_page, 12);
    EXPECT_EQ(chapters[0].chapter_name, "UNSOLVED Practice Paper-1");
    EXPECT_EQ(chapters[0].tag, "UNSOLVED");
    EXPECT_FALSE(chapters[0].route.has_value());
}

TEST(RangeResolverTest, EachRangeEndsBeforeTheNextDetection) {
    std::vector<ChapterDetection> detections = {
        {"A", "A", 1}, {"B", "B", 11}, {"C", "C", 21}
    };
    auto chapters = resolve_ranges(detections, 40);
    ASSERT_EQ(chapters.size(), 3u);
    EXPECT_EQ(chapters[0].end_page, 10);
    EXPECT_EQ(chapters[1].start_page, 11);
    EXPECT_EQ(chapters[1].end_page, 20);
    EXPECT_EQ(chapters[2].end_page, 40);
}

TEST(RangeResolverTest, DetectionsSharingAPageKeepBothAsSinglePageChapters) {
    std::vector<ChapterDetection> detections = {
        {"A", "A", 5}, {"B", "B", 5}, {"C", "C", 9}
    };
    auto chapters = resolve_ranges(detections, 15);
    ASSERT_EQ(chapters.size(), 3u);
    EXPECT_EQ(chapters[0].start_page, 5);
    EXPECT_EQ(chapters[0].end_page, 5);
    EXPECT_EQ(chapters[1].start_page, 5);
    EXPECT_EQ(chapters[1].end_page, 8);
    EXPECT_EQ(chapters[2].end_page, 15);
}

TEST(RangeResolverTest, AdjacencyHoldsForEveryConsecutivePair) {
    std::vector<ChapterDetection> detections;
    for (int page : {1, 2, 2, 7, 30, 31, 31, 31, 50}) {
        detections.push_back({"P" + std::to_string(page), "NA", page});
    }
    const int total_pages = 64;
    auto chapters = resolve_ranges(detections, total_pages);
    ASSERT_EQ(chapters.size(), detections.size());

    for (size_t i = 0; i + 1 < chapters.size(); ++i) {
        const auto& current = chapters[i];
        const auto& next = chapters[i + 1];
        bool adjacent = current.end_page == next.start_page - 1;
        bool zero_width = current.end_page == current.start_page && current.start_page == next.start_page;
        EXPECT_TRUE(adjacent || zero_width) << "chapter " << i;
        EXPECT_LE(current.start_page, current.end_page);
    }
    EXPECT_EQ(chapters.back().end_page, total_pages);
}
