#include "paper_splitter/analysis_result.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace paper_splitter {

namespace {

// Integer JSON value that fits in an int.
std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<std::int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    return std::nullopt;
}

int int_field(const nlohmann::json& j, const char* key, int fallback) {
    auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    return as_int(*it).value_or(fallback);
}

// Page numbers that are absent, not integers or outside the int range load
// as 0, which the splitter rejects as an invalid range.
int page_field(const nlohmann::json& j, const char* key) {
    return int_field(j, key, 0);
}

std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const Chapter& chapter) {
    j = nlohmann::json{
        {"chapter_name", chapter.chapter_name},
        {"tag", chapter.tag},
        {"chapter_start_page_number", chapter.start_page},
        {"chapter_end_page_number", chapter.end_page}
    };
    if (chapter.route) {
        j["pdf_filename"] = chapter.route->filename;
        j["pdf_folder"] = chapter.route->folder;
    }
}

void from_json(const nlohmann::json& j, Chapter& chapter) {
    chapter.chapter_name = string_field(j, "chapter_name", "unknown");
    chapter.tag = string_field(j, "tag", "NA");
    chapter.start_page = page_field(j, "chapter_start_page_number");
    chapter.end_page = page_field(j, "chapter_end_page_number");

    std::string filename = string_field(j, "pdf_filename", "");
    std::string folder = string_field(j, "pdf_folder", "");
    if (!filename.empty() && !folder.empty()) {
        chapter.route = OutputRoute{filename, folder};
    } else {
        chapter.route.reset();
    }
}

void to_json(nlohmann::json& j, const AnalysisResult& result) {
    j = nlohmann::json{
        {"confidence_score", result.confidence_score},
        {"book_title", result.book_title},
        {"book_start_page", result.book_start_page},
        {"book_end_page", result.book_end_page},
        {"chapters", result.chapters}
    };
}

void from_json(const nlohmann::json& j, AnalysisResult& result) {
    if (!j.is_object()) {
        throw std::runtime_error("Analysis must be a JSON object");
    }
    result.confidence_score = int_field(j, "confidence_score", 30);
    result.book_title = string_field(j, "book_title", "Unknown Title");
    result.book_start_page = int_field(j, "book_start_page", 1);
    result.book_end_page = int_field(j, "book_end_page", 0);

    result.chapters.clear();
    auto it = j.find("chapters");
    if (it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_object()) {
                result.chapters.push_back(item.get<Chapter>());
            }
        }
    }
}

void to_json(nlohmann::json& j, const SplitUnit& unit) {
    j = nlohmann::json{
        {"filename", unit.filename},
        {"folder", unit.folder},
        {"path", unit.path},
        {"pages", unit.source_page_range},
        {"page_count", unit.page_count_written},
        {"chapter_name", unit.chapter_name}
    };
}

std::vector<std::string> validate_analysis(const nlohmann::json& analysis) {
    std::vector<std::string> errors;

    if (!analysis.is_object()) {
        errors.push_back("Analysis must be a JSON object");
        return errors;
    }

    for (const char* field : {"book_title", "chapters"}) {
        if (!analysis.contains(field)) {
            errors.push_back(std::string("Missing required field: ") + field);
        }
    }

    if (!analysis.contains("chapters")) {
        return errors;
    }

    const auto& chapters = analysis["chapters"];
    if (!chapters.is_array()) {
        errors.push_back("Chapters must be a list");
        return errors;
    }

    for (size_t i = 0; i < chapters.size(); ++i) {
        const auto& chapter = chapters[i];
        const std::string prefix = "Chapter " + std::to_string(i);

        if (!chapter.is_object()) {
            errors.push_back(prefix + " must be an object");
            continue;
        }

        for (const char* field : {"chapter_name", "tag", "chapter_start_page_number", "chapter_end_page_number"}) {
            if (!chapter.contains(field)) {
                errors.push_back(prefix + " missing required field: " + field);
            }
        }

        auto start = chapter.find("chapter_start_page_number");
        auto end = chapter.find("chapter_end_page_number");
        std::optional<int> start_page;
        std::optional<int> end_page;

        if (start != chapter.end()) {
            if (!start->is_number_integer()) {
                errors.push_back(prefix + " start_page must be an integer");
            } else if (!(start_page = as_int(*start))) {
                errors.push_back(prefix + " start_page is out of range");
            }
        }
        if (end != chapter.end()) {
            if (!end->is_number_integer()) {
                errors.push_back(prefix + " end_page must be an integer");
            } else if (!(end_page = as_int(*end))) {
                errors.push_back(prefix + " end_page is out of range");
            }
        }
        if (start_page && end_page && *start_page > *end_page) {
            errors.push_back(prefix + " start_page (" + std::to_string(*start_page) +
                             ") > end_page (" + std::to_string(*end_page) + ")");
        }
    }

    return errors;
}

AnalysisResult load_analysis_file(const std::string& json_path) {
    std::ifstream in(json_path);
    if (!in) {
        throw std::runtime_error("Cannot open analysis file: " + json_path);
    }

    try {
        nlohmann::json data;
        in >> data;
        return data.get<AnalysisResult>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid analysis JSON in " + json_path + ": " + e.what());
    }
}

void save_analysis_file(const std::string& json_path, const AnalysisResult& result) {
    std::ofstream out(json_path);
    if (!out) {
        throw std::runtime_error("Cannot write analysis file: " + json_path);
    }
    out << nlohmann::json(result).dump(2) << std::endl;
    if (!out) {
        throw std::runtime_error("Failed writing analysis file: " + json_path);
    }
}

} // namespace paper_splitter
