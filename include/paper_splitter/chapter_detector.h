#pragma once

#include "paper_splitter/document.h"
#include "paper_splitter/header_extractor.h"
#include "paper_splitter/header_patterns.h"
#include <string>
#include <vector>
#include <optional>

namespace paper_splitter {

struct ChapterDetection {
    std::string name;
    std::string tag;   // first token of name, "NA" if the name has none
    int page;          // 1-indexed

    bool operator==(const ChapterDetection& other) const {
        return name == other.name && tag == other.tag && page == other.page;
    }
};

struct DetectorOptions {
    double header_fraction = DEFAULT_HEADER_FRACTION;
    size_t page_threads = 1;   // > 1 scans page headers on a thread pool
    bool verbose = false;
};

class ChapterDetector {
public:
    explicit ChapterDetector(const DetectorOptions& options = DetectorOptions{},
                             HeaderPatternSet patterns = HeaderPatternSet::defaults());

    // One detection per page whose header matches a pattern, without
    // duplicate (name, page) pairs, sorted by page.
    std::vector<ChapterDetection> detect_chapters(const Document& document) const;

    // Best detection for a single header string; the page is left at 0.
    std::optional<ChapterDetection> detect_in_header(const std::string& header) const;

    const HeaderPatternSet& patterns() const { return patterns_; }

private:
    std::vector<std::optional<std::string>> scan_headers(const Document& document) const;

    DetectorOptions options_;
    PageHeaderExtractor extractor_;
    HeaderPatternSet patterns_;
};

} // namespace paper_splitter
