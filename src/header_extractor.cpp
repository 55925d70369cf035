#include "paper_splitter/header_extractor.h"
#include "paper_splitter/text_utils.h"
#include <stdexcept>

namespace paper_splitter {

PageHeaderExtractor::PageHeaderExtractor(double header_fraction)
    : header_fraction_(header_fraction) {
    if (!(header_fraction > 0.0 && header_fraction <= 1.0)) {
        throw std::invalid_argument("header fraction must be in (0, 1]");
    }
}

std::string PageHeaderExtractor::extract_header(const Document& document, int page_number) const {
    const double header_limit = document.page_height(page_number) * header_fraction_;

    std::string header;
    bool first = true;
    for (const auto& block : document.text_blocks(page_number)) {
        if (block.y0 < header_limit) {
            if (!first) {
                header += ' ';
            }
            header += trim(block.text);
            first = false;
        }
    }
    return header;
}

} // namespace paper_splitter
