#pragma once

#include "paper_splitter/analysis_result.h"
#include "paper_splitter/document.h"
#include <string>
#include <vector>
#include <optional>

namespace paper_splitter {

struct SplitOptions {
    std::string output_dir = ".";
    bool verbose = false;
};

// Writes one PDF per routable chapter of an analysis under
// output_dir/<pdf_folder>/<pdf_filename>. Chapters with invalid ranges, no
// route, an unknown folder or no copyable page are logged and skipped; a
// page that fails to copy is left out of its chapter.
class DocumentSplitter {
public:
    explicit DocumentSplitter(const SplitOptions& options = SplitOptions{});

    std::vector<SplitUnit> split(const Document& document, const AnalysisResult& analysis) const;

    // Loads the analysis from a JSON file first; throws std::runtime_error
    // if it cannot be read.
    std::vector<SplitUnit> split_from_file(const Document& document, const std::string& analysis_path) const;

private:
    std::optional<SplitUnit> split_chapter(const Document& document, const Chapter& chapter) const;

    SplitOptions options_;
};

} // namespace paper_splitter
