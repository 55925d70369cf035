#include "paper_splitter/chapter_detector.h"
#include "paper_splitter/text_utils.h"
#include "paper_splitter/thread_pool.h"
#include <algorithm>
#include <future>
#include <iostream>

namespace paper_splitter {

namespace {

// Header text of one page, or nothing if the page could not be read.
std::optional<std::string> read_header(const PageHeaderExtractor& extractor,
                                       const Document& document, int page_number) {
    try {
        return extractor.extract_header(document, page_number);
    } catch (const std::exception& e) {
        std::cerr << "[ChapterDetector::detect_chapters] Warning: error processing page "
                  << page_number << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace

ChapterDetector::ChapterDetector(const DetectorOptions& options, HeaderPatternSet patterns)
    : options_(options),
      extractor_(options.header_fraction),
      patterns_(std::move(patterns)) {}

std::vector<std::optional<std::string>> ChapterDetector::scan_headers(const Document& document) const {
    const int page_count = document.page_count();
    std::vector<std::optional<std::string>> headers(page_count);

    if (options_.page_threads <= 1 || page_count < 2) {
        for (int page = 1; page <= page_count; ++page) {
            headers[page - 1] = read_header(extractor_, document, page);
        }
        return headers;
    }

    ThreadPool pool(std::min<size_t>(options_.page_threads, page_count));
    std::vector<std::future<std::optional<std::string>>> futures;
    futures.reserve(page_count);

    for (int page = 1; page <= page_count; ++page) {
        futures.push_back(pool.submit([this, &document, page]() {
            return read_header(extractor_, document, page);
        }));
    }

    for (int page = 1; page <= page_count; ++page) {
        headers[page - 1] = futures[page - 1].get();
    }
    return headers;
}

std::optional<ChapterDetection> ChapterDetector::detect_in_header(const std::string& header) const {
    auto best = patterns_.best_match(header);
    if (!best) {
        return std::nullopt;
    }
    return ChapterDetection{best->text, first_token(best->text, "NA"), 0};
}

std::vector<ChapterDetection> ChapterDetector::detect_chapters(const Document& document) const {
    auto headers = scan_headers(document);

    std::vector<ChapterDetection> detections;
    for (size_t i = 0; i < headers.size(); ++i) {
        if (!headers[i] || headers[i]->empty()) {
            continue;
        }

        auto detection = detect_in_header(*headers[i]);
        if (!detection) {
            continue;
        }
        detection->page = static_cast<int>(i) + 1;

        bool duplicate = std::any_of(detections.begin(), detections.end(),
            [&detection](const ChapterDetection& existing) {
                return existing.name == detection->name && existing.page == detection->page;
            });
        if (duplicate) {
            continue;
        }

        if (options_.verbose) {
            std::cout << "[ChapterDetector::detect_chapters] Page " << detection->page
                      << ": " << detection->name << " (" << detection->tag << ")" << std::endl;
        }
        detections.push_back(std::move(*detection));
    }

    std::stable_sort(detections.begin(), detections.end(),
        [](const ChapterDetection& a, const ChapterDetection& b) {
            return a.page < b.page;
        });
    return detections;
}

} // namespace paper_splitter
