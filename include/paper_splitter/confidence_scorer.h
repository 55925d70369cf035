#pragma once

#include "paper_splitter/chapter_detector.h"
#include <vector>

namespace paper_splitter {

constexpr int MIN_CONFIDENCE = 30;
constexpr int MAX_CONFIDENCE = 95;

// Heuristic review signal in [MIN_CONFIDENCE, MAX_CONFIDENCE]: 30 without
// detections, otherwise 70, +10 when more than a tenth of the pages carry a
// detection, +5 when any name mentions SAP, SQP, PP, Practice or Question.
int score_confidence(const std::vector<ChapterDetection>& detections, int total_pages);

} // namespace paper_splitter
