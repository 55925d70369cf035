#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace paper_splitter {

constexpr const char* QUESTION_PAPERS_FOLDER = "question_papers";
constexpr const char* ANSWER_KEYS_FOLDER = "answer_keys";

// Where a classified chapter is written, relative to the split output root.
struct OutputRoute {
    std::string filename;
    std::string folder;

    bool operator==(const OutputRoute& other) const {
        return filename == other.filename && folder == other.folder;
    }
};

struct Chapter {
    std::string chapter_name;
    std::string tag;
    int start_page = 0;
    int end_page = 0;
    std::optional<OutputRoute> route;   // unset when no naming rule applies

    bool operator==(const Chapter& other) const {
        return chapter_name == other.chapter_name && tag == other.tag &&
               start_page == other.start_page && end_page == other.end_page &&
               route == other.route;
    }
};

struct AnalysisResult {
    int confidence_score = 30;
    std::string book_title;
    int book_start_page = 1;
    int book_end_page = 0;
    std::vector<Chapter> chapters;

    bool operator==(const AnalysisResult& other) const {
        return confidence_score == other.confidence_score && book_title == other.book_title &&
               book_start_page == other.book_start_page && book_end_page == other.book_end_page &&
               chapters == other.chapters;
    }
};

// One written output file.
struct SplitUnit {
    std::string filename;
    std::string folder;
    std::string path;
    std::string source_page_range;   // "{start}-{end}" as recorded in the analysis
    int page_count_written = 0;
    std::string chapter_name;

    bool operator==(const SplitUnit& other) const {
        return filename == other.filename && folder == other.folder && path == other.path &&
               source_page_range == other.source_page_range &&
               page_count_written == other.page_count_written &&
               chapter_name == other.chapter_name;
    }
};

void to_json(nlohmann::json& j, const Chapter& chapter);
void from_json(const nlohmann::json& j, Chapter& chapter);
void to_json(nlohmann::json& j, const AnalysisResult& result);
void from_json(const nlohmann::json& j, AnalysisResult& result);
void to_json(nlohmann::json& j, const SplitUnit& unit);

// Structural problems in a persisted analysis; empty when it is usable.
std::vector<std::string> validate_analysis(const nlohmann::json& analysis);

// Both throw std::runtime_error on I/O or parse failures.
AnalysisResult load_analysis_file(const std::string& json_path);
void save_analysis_file(const std::string& json_path, const AnalysisResult& result);

} // namespace paper_splitter
