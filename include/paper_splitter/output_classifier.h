#pragma once

#include "paper_splitter/analysis_result.h"
#include <string>
#include <optional>

namespace paper_splitter {

// Canonical file name and folder for a chapter, or std::nullopt when the
// name/tag combination has no naming rule:
//   Self Assessment Paper-N + UNSOLVED  -> SAP-N.pdf          question_papers
//   Practice Paper-N + UNSOLVED         -> PP-N.pdf           question_papers
//   Question Paper-N + SOLVED|UNSOLVED  -> SQP-N.pdf          question_papers
//   Question Paper-N + SOLUTIONS        -> SQP-N-SOLUTION.pdf answer_keys
std::optional<OutputRoute> classify_output(const std::string& chapter_name, const std::string& tag);

// Sets the route of every chapter the rules above can name.
void classify_chapters(std::vector<Chapter>& chapters);

} // namespace paper_splitter
