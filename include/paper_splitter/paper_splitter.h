#pragma once

#include "paper_splitter/analysis_result.h"
#include "paper_splitter/header_extractor.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <thread>
#include <nlohmann/json.hpp>

namespace paper_splitter {

struct PipelineOptions {
    size_t thread_count = std::thread::hardware_concurrency();   // documents in flight
    size_t page_threads = 1;                                     // header scan workers per document
    double header_fraction = DEFAULT_HEADER_FRACTION;
    bool verbose = false;
};

// Outcome of analyze-then-split for one source document.
struct ProcessResult {
    std::string pdf_path;
    bool success = false;
    std::string error;
    AnalysisResult analysis;
    std::string analysis_path;
    std::vector<SplitUnit> split_files;
};

void to_json(nlohmann::json& j, const ProcessResult& result);

using ProgressCallback = std::function<void(size_t current, size_t total)>;

// Output directory name for each document of a batch. A document gets its
// file stem; stems shared by several documents are prefixed with the parent
// directory name, and any name still taken gets a "_2", "_3", ... suffix.
std::vector<std::string> batch_output_names(const std::vector<std::string>& pdf_paths);

class PaperSplitter {
public:
    explicit PaperSplitter(const PipelineOptions& options = PipelineOptions{});
    ~PaperSplitter();

    // Throws std::runtime_error if the PDF cannot be opened.
    AnalysisResult analyze(const std::string& pdf_path);

    // Throws std::runtime_error if the PDF cannot be opened; otherwise
    // returns the (possibly empty) list of written files.
    std::vector<SplitUnit> split(const std::string& pdf_path, const AnalysisResult& analysis,
                                 const std::string& output_dir);

    // Analyzes, stores <output_root>/<pdf stem>/analysis.json and splits into
    // <output_root>/<pdf stem>/. Never throws; failures are reported in the
    // result.
    ProcessResult process(const std::string& pdf_path, const std::string& output_root);

    // Processes every path on the worker pool, each into
    // <output_root>/<name> with names from batch_output_names(). Results
    // keep the order of `pdf_paths`.
    std::vector<ProcessResult> process_batch(const std::vector<std::string>& pdf_paths,
                                             const std::string& output_root,
                                             ProgressCallback progress = nullptr);

    nlohmann::json get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace paper_splitter
