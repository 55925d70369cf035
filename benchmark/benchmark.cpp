#include <benchmark/benchmark.h>
#include <paper_splitter/chapter_detector.h>
#include <paper_splitter/header_patterns.h>
#include <paper_splitter/output_classifier.h>
#include <paper_splitter/range_resolver.h>
#include <paper_splitter/paper_splitter.h>
#include <filesystem>

namespace fs = std::filesystem;

// Provide a real book to enable the end-to-end benchmark.
const std::string TEST_PDF_BOOK = "test_data/book.pdf";

static const std::vector<std::string>& sample_headers() {
    static const std::vector<std::string> headers = {
        "UNSOLVED Self Assessment Paper-3",
        "SOLVED Sample Question Paper-12",
        "SOLUTIONS Sample Question Paper-12",
        "Physics Class XII 2024-25 Chapter 7 Alternating Current",
        "Mind Map-4",
        "Page 118 Oswaal Books",
        ""
    };
    return headers;
}

static void BM_BestHeaderMatch(benchmark::State& state) {
    auto patterns = paper_splitter::HeaderPatternSet::defaults();
    const auto& headers = sample_headers();

    size_t i = 0;
    for (auto _ : state) {
        auto match = patterns.best_match(headers[i++ % headers.size()]);
        benchmark::DoNotOptimize(match);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BestHeaderMatch);

static void BM_ResolveAndClassify(benchmark::State& state) {
    const int chapters = static_cast<int>(state.range(0));
    const int pages_per_chapter = 8;

    std::vector<paper_splitter::ChapterDetection> detections;
    for (int c = 0; c < chapters; ++c) {
        std::string name = (c % 2 ? "SOLUTIONS Sample Question Paper-" : "UNSOLVED Practice Paper-") +
                           std::to_string(c + 1);
        detections.push_back({name, c % 2 ? "SOLUTIONS" : "UNSOLVED", c * pages_per_chapter + 1});
    }

    for (auto _ : state) {
        auto resolved = paper_splitter::resolve_ranges(detections, chapters * pages_per_chapter);
        paper_splitter::classify_chapters(resolved);
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations() * chapters);
}
BENCHMARK(BM_ResolveAndClassify)->Range(8, 512);

static void BM_AnalyzeBook(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_BOOK)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    paper_splitter::PipelineOptions options;
    options.page_threads = state.range(0);
    paper_splitter::PaperSplitter splitter(options);

    for (auto _ : state) {
        auto analysis = splitter.analyze(TEST_PDF_BOOK);
        benchmark::DoNotOptimize(analysis);
    }
}
BENCHMARK(BM_AnalyzeBook)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
