#include "paper_splitter/document_analyzer.h"
#include "paper_splitter/confidence_scorer.h"
#include "paper_splitter/mupdf_document.h"
#include "paper_splitter/output_classifier.h"
#include "paper_splitter/range_resolver.h"
#include "paper_splitter/text_utils.h"
#include <iostream>
#include <sstream>

namespace paper_splitter {

DocumentAnalyzer::DocumentAnalyzer(const AnalyzerOptions& options, HeaderPatternSet patterns)
    : options_(options),
      detector_(options, std::move(patterns)) {}

std::string DocumentAnalyzer::extract_book_title(const Document& document) {
    std::string title = trim(document.metadata_title());

    if (title.empty() && document.page_count() > 0) {
        try {
            std::istringstream stream(document.page_text(1));
            std::string line;
            while (std::getline(stream, line)) {
                title = trim(line);
                if (!title.empty()) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[DocumentAnalyzer::extract_book_title] Warning: could not extract title from first page: "
                      << e.what() << std::endl;
        }
    }

    return title.empty() ? "Unknown Title" : title;
}

AnalysisResult DocumentAnalyzer::analyze(const Document& document) const {
    const int total_pages = document.page_count();
    if (options_.verbose) {
        std::cout << "[DocumentAnalyzer::analyze] Analyzing document with " << total_pages << " pages" << std::endl;
    }

    auto detections = detector_.detect_chapters(document);

    AnalysisResult result;
    result.book_title = extract_book_title(document);
    result.book_start_page = 1;
    result.book_end_page = total_pages;
    result.chapters = resolve_ranges(detections, total_pages);
    classify_chapters(result.chapters);
    result.confidence_score = score_confidence(detections, total_pages);

    if (options_.verbose) {
        std::cout << "[DocumentAnalyzer::analyze] Analysis completed with " << result.chapters.size()
                  << " chapters, confidence " << result.confidence_score << std::endl;
    }
    return result;
}

AnalysisResult DocumentAnalyzer::analyze_file(const std::string& pdf_path) const {
    auto document = open_pdf_document(pdf_path);
    return analyze(*document);
}

} // namespace paper_splitter
