#include "paper_splitter/confidence_scorer.h"
#include "paper_splitter/text_utils.h"
#include <algorithm>
#include <iterator>

namespace paper_splitter {

int score_confidence(const std::vector<ChapterDetection>& detections, int total_pages) {
    if (detections.empty()) {
        return MIN_CONFIDENCE;
    }

    int confidence = 70;

    if (total_pages > 0 &&
        static_cast<double>(detections.size()) / static_cast<double>(total_pages) > 0.1) {
        confidence += 10;
    }

    static const char* const specific_tokens[] = {"SAP", "SQP", "PP", "PRACTICE", "QUESTION"};
    bool specific = std::any_of(detections.begin(), detections.end(),
        [](const ChapterDetection& detection) {
            const std::string name = to_upper(detection.name);
            return std::any_of(std::begin(specific_tokens), std::end(specific_tokens),
                [&name](const char* token) { return name.find(token) != std::string::npos; });
        });
    if (specific) {
        confidence += 5;
    }

    return std::clamp(confidence, MIN_CONFIDENCE, MAX_CONFIDENCE);
}

} // namespace paper_splitter
