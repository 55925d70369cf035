#include <gtest/gtest.h>
#include <paper_splitter/paper_splitter.h>
#include "test_helpers.h"
#include <mutex>

using namespace paper_splitter;
using paper_splitter_test::make_temp_dir;

namespace fs = std::filesystem;

TEST(PaperSplitterTest, MissingFileIsReportedNotThrown) {
    auto dir = make_temp_dir();
    PaperSplitter splitter;

    ProcessResult result;
    ASSERT_NO_THROW(result = splitter.process((dir / "absent.pdf").string(), dir.string()));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(result.split_files.empty());

    nlohmann::json j = result;
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["pdf_path"], (dir / "absent.pdf").string());
    EXPECT_FALSE(j.contains("analysis_result"));

    fs::remove_all(dir);
}

TEST(PaperSplitterTest, AnalyzeMissingFileThrows) {
    PaperSplitter splitter;
    EXPECT_THROW(splitter.analyze("/nonexistent/input.pdf"), std::runtime_error);
    EXPECT_THROW(splitter.split("/nonexistent/input.pdf", AnalysisResult{}, "."), std::runtime_error);
}

TEST(PaperSplitterTest, BatchKeepsInputOrderAndCountsFailures) {
    auto dir = make_temp_dir();
    PipelineOptions options;
    options.thread_count = 3;
    PaperSplitter splitter(options);

    std::vector<std::string> paths;
    for (int i = 0; i < 5; ++i) {
        paths.push_back((dir / ("missing_" + std::to_string(i) + ".pdf")).string());
    }

    size_t calls = 0;
    size_t last_total = 0;
    std::mutex progress_mutex;
    auto results = splitter.process_batch(paths, dir.string(), [&](size_t, size_t total) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        calls++;
        last_total = total;
    });

    ASSERT_EQ(results.size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(results[i].pdf_path, paths[i]);
        EXPECT_FALSE(results[i].success);
    }
    EXPECT_EQ(calls, paths.size());
    EXPECT_EQ(last_total, paths.size());

    auto stats = splitter.get_stats();
    EXPECT_EQ(stats["documents_processed"], 0);
    EXPECT_EQ(stats["documents_failed"], 5);
    EXPECT_EQ(stats["split_files_written"], 0);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));

    fs::remove_all(dir);
}

TEST(PaperSplitterTest, SuccessfulResultJson) {
    ProcessResult result;
    result.pdf_path = "books/physics.pdf";
    result.success = true;
    result.analysis.book_title = "Physics";
    result.analysis_path = "out/physics/analysis.json";
    result.split_files.push_back(SplitUnit{"SAP-1.pdf", "question_papers",
                                           "out/physics/question_papers/SAP-1.pdf", "1-4", 4,
                                           "UNSOLVED Self Assessment Paper-1"});

    nlohmann::json j = result;
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["analysis_result"]["book_title"], "Physics");
    EXPECT_EQ(j["analysis_path"], "out/physics/analysis.json");
    EXPECT_EQ(j["total_files"], 1);
    EXPECT_EQ(j["split_files"][0]["filename"], "SAP-1.pdf");
    EXPECT_FALSE(j.contains("error"));
}

TEST(PaperSplitterTest, BatchOutputNamesKeepUniqueStems) {
    std::vector<std::string> paths = {"books/physics.pdf", "books/chemistry.pdf"};
    EXPECT_EQ(batch_output_names(paths), (std::vector<std::string>{"physics", "chemistry"}));
}

TEST(PaperSplitterTest, BatchOutputNamesSeparateSharedStems) {
    std::vector<std::string> paths = {
        "in/physics/book.pdf",
        "in/chemistry/book.pdf",
        "in/notes.pdf",
        "in/physics_book.pdf",
        "in/physics/book.pdf"
    };
    std::vector<std::string> expected = {
        "physics_book",
        "chemistry_book",
        "notes",
        "physics_book_2",
        "physics_book_3"
    };
    EXPECT_EQ(batch_output_names(paths), expected);
}
