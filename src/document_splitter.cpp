#include "paper_splitter/document_splitter.h"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace paper_splitter {

namespace {

// A file name that stays inside its folder: one path component, not "." or "..".
bool is_plain_filename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    const fs::path path(filename);
    return !path.has_root_path() && path.filename() == path;
}

} // namespace

DocumentSplitter::DocumentSplitter(const SplitOptions& options)
    : options_(options) {}

std::vector<SplitUnit> DocumentSplitter::split(const Document& document, const AnalysisResult& analysis) const {
    std::vector<SplitUnit> units;

    for (size_t i = 0; i < analysis.chapters.size(); ++i) {
        auto unit = split_chapter(document, analysis.chapters[i]);
        if (!unit) {
            continue;
        }
        if (options_.verbose) {
            std::cout << "[DocumentSplitter::split] Split chapter " << (i + 1) << ": "
                      << unit->filename << " (" << unit->source_page_range << ")" << std::endl;
        }
        units.push_back(std::move(*unit));
    }

    if (options_.verbose) {
        std::cout << "[DocumentSplitter::split] Split document into " << units.size() << " files" << std::endl;
    }
    return units;
}

std::vector<SplitUnit> DocumentSplitter::split_from_file(const Document& document,
                                                         const std::string& analysis_path) const {
    return split(document, load_analysis_file(analysis_path));
}

std::optional<SplitUnit> DocumentSplitter::split_chapter(const Document& document, const Chapter& chapter) const {
    const int total_pages = document.page_count();
    const std::string& name = chapter.chapter_name;
    const std::string range = std::to_string(chapter.start_page) + "-" + std::to_string(chapter.end_page);

    if (chapter.start_page < 1 || chapter.end_page < chapter.start_page || chapter.start_page > total_pages) {
        std::cerr << "[DocumentSplitter::split] Warning: skipping chapter '" << name
                  << "' - invalid page numbers: " << range << std::endl;
        return std::nullopt;
    }

    if (!chapter.route) {
        std::cerr << "[DocumentSplitter::split] Warning: skipping chapter '" << name
                  << "' - missing filename or folder" << std::endl;
        return std::nullopt;
    }

    const OutputRoute& route = *chapter.route;
    if (route.folder != QUESTION_PAPERS_FOLDER && route.folder != ANSWER_KEYS_FOLDER) {
        std::cerr << "[DocumentSplitter::split] Warning: unknown folder type '" << route.folder
                  << "' for chapter '" << name << "'" << std::endl;
        return std::nullopt;
    }

    if (!is_plain_filename(route.filename)) {
        std::cerr << "[DocumentSplitter::split] Warning: invalid output filename '" << route.filename
                  << "' for chapter '" << name << "'" << std::endl;
        return std::nullopt;
    }

    std::unique_ptr<DocumentWriter> writer;
    try {
        writer = document.create_writer();
    } catch (const std::exception& e) {
        std::cerr << "[DocumentSplitter::split] Error: cannot create output for chapter '" << name
                  << "': " << e.what() << std::endl;
        return std::nullopt;
    }

    const int last_page = std::min(chapter.end_page, total_pages);
    for (int page = chapter.start_page; page <= last_page; ++page) {
        try {
            writer->append_page(page);
        } catch (const std::exception& e) {
            std::cerr << "[DocumentSplitter::split] Warning: error adding page " << page
                      << " to chapter '" << name << "': " << e.what() << std::endl;
        }
    }

    if (writer->page_count() == 0) {
        std::cerr << "[DocumentSplitter::split] Warning: no pages added for chapter '" << name << "'" << std::endl;
        return std::nullopt;
    }

    const fs::path output_path = fs::path(options_.output_dir) / route.folder / route.filename;
    try {
        fs::create_directories(output_path.parent_path());
        writer->save(output_path.string());
    } catch (const std::exception& e) {
        std::cerr << "[DocumentSplitter::split] Error: writing split PDF for chapter '" << name
                  << "' failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    SplitUnit unit;
    unit.filename = route.filename;
    unit.folder = route.folder;
    unit.path = output_path.string();
    unit.source_page_range = range;
    unit.page_count_written = writer->page_count();
    unit.chapter_name = name;
    return unit;
}

} // namespace paper_splitter
