#pragma once

#include "paper_splitter/analysis_result.h"
#include "paper_splitter/chapter_detector.h"
#include "paper_splitter/document.h"
#include <string>

namespace paper_splitter {

using AnalyzerOptions = DetectorOptions;

// Detection, range resolution, output classification and scoring for one
// document. Deterministic: the same document always yields the same result.
class DocumentAnalyzer {
public:
    explicit DocumentAnalyzer(const AnalyzerOptions& options = AnalyzerOptions{},
                              HeaderPatternSet patterns = HeaderPatternSet::defaults());

    AnalysisResult analyze(const Document& document) const;

    // Opens `pdf_path` with the MuPDF backend. Throws std::runtime_error if
    // the file cannot be opened.
    AnalysisResult analyze_file(const std::string& pdf_path) const;

    // Metadata title, else the first non-empty line of page 1, else
    // "Unknown Title".
    static std::string extract_book_title(const Document& document);

private:
    AnalyzerOptions options_;
    ChapterDetector detector_;
};

} // namespace paper_splitter
