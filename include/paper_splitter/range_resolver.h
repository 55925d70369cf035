#pragma once

#include "paper_splitter/analysis_result.h"
#include "paper_splitter/chapter_detector.h"
#include <vector>

namespace paper_splitter {

// Turns page-sorted detections into closed page ranges. Each range ends the
// page before the next detection, or on that same page when two detections
// share it; the last one runs to `total_pages`. Routes are left unset.
std::vector<Chapter> resolve_ranges(const std::vector<ChapterDetection>& detections, int total_pages);

} // namespace paper_splitter
