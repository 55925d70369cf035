#pragma once

#include "paper_splitter/document.h"
#include <string>

namespace paper_splitter {

// Band of the page, measured from the top, in which structural titles are
// looked for.
constexpr double DEFAULT_HEADER_FRACTION = 0.20;

class PageHeaderExtractor {
public:
    // Throws std::invalid_argument unless 0 < header_fraction <= 1.
    explicit PageHeaderExtractor(double header_fraction = DEFAULT_HEADER_FRACTION);

    // Text of every block starting inside the header band, trimmed and
    // joined with single spaces in extraction order. Empty if none.
    std::string extract_header(const Document& document, int page_number) const;

    double header_fraction() const { return header_fraction_; }

private:
    double header_fraction_;
};

} // namespace paper_splitter
