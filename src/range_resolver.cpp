#include "paper_splitter/range_resolver.h"

namespace paper_splitter {

std::vector<Chapter> resolve_ranges(const std::vector<ChapterDetection>& detections, int total_pages) {
    std::vector<Chapter> chapters;
    chapters.reserve(detections.size());

    for (size_t i = 0; i < detections.size(); ++i) {
        Chapter chapter;
        chapter.chapter_name = detections[i].name;
        chapter.tag = detections[i].tag;
        chapter.start_page = detections[i].page;
        chapter.end_page = total_pages;

        if (i + 1 < detections.size()) {
            int next_page = detections[i + 1].page;
            chapter.end_page = next_page == chapter.start_page ? chapter.start_page : next_page - 1;
        }

        chapters.push_back(std::move(chapter));
    }

    return chapters;
}

} // namespace paper_splitter
