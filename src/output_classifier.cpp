#include "paper_splitter/output_classifier.h"
#include <regex>

namespace paper_splitter {

namespace {

std::optional<std::string> paper_number(const std::string& chapter_name, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_search(chapter_name, match, pattern)) {
        return match.str(1);
    }
    return std::nullopt;
}

} // namespace

std::optional<OutputRoute> classify_output(const std::string& chapter_name, const std::string& tag) {
    static const std::regex self_assessment("Self\\s+Assessment\\s+Paper[- ]?(\\d+)", std::regex::icase);
    static const std::regex practice("Practice\\s+Paper[- ]?(\\d+)", std::regex::icase);
    static const std::regex question("Question\\s+Paper[- ]?(\\d+)", std::regex::icase);

    if (auto n = paper_number(chapter_name, self_assessment); n && tag == "UNSOLVED") {
        return OutputRoute{"SAP-" + *n + ".pdf", QUESTION_PAPERS_FOLDER};
    }

    if (auto n = paper_number(chapter_name, practice); n && tag == "UNSOLVED") {
        return OutputRoute{"PP-" + *n + ".pdf", QUESTION_PAPERS_FOLDER};
    }

    if (auto n = paper_number(chapter_name, question)) {
        if (tag == "SOLVED" || tag == "UNSOLVED") {
            return OutputRoute{"SQP-" + *n + ".pdf", QUESTION_PAPERS_FOLDER};
        }
        if (tag == "SOLUTIONS") {
            return OutputRoute{"SQP-" + *n + "-SOLUTION.pdf", ANSWER_KEYS_FOLDER};
        }
    }

    return std::nullopt;
}

void classify_chapters(std::vector<Chapter>& chapters) {
    for (auto& chapter : chapters) {
        chapter.route = classify_output(chapter.chapter_name, chapter.tag);
    }
}

} // namespace paper_splitter
