#include "paper_splitter/paper_splitter.h"
#include "paper_splitter/document_analyzer.h"
#include "paper_splitter/document_splitter.h"
#include "paper_splitter/mupdf_document.h"
#include "paper_splitter/thread_pool.h"
#include <filesystem>
#include <chrono>
#include <iostream>
#include <mutex>
#include <atomic>
#include <map>
#include <set>

namespace paper_splitter {

void to_json(nlohmann::json& j, const ProcessResult& result) {
    j = nlohmann::json{
        {"status", result.success ? "success" : "error"},
        {"pdf_path", result.pdf_path}
    };
    if (!result.success) {
        j["error"] = result.error;
        return;
    }
    j["analysis_result"] = result.analysis;
    j["analysis_path"] = result.analysis_path;
    j["split_files"] = result.split_files;
    j["total_files"] = result.split_files.size();
}

std::vector<std::string> batch_output_names(const std::vector<std::string>& pdf_paths) {
    std::map<std::string, size_t> stem_counts;
    for (const auto& path : pdf_paths) {
        stem_counts[std::filesystem::path(path).stem().string()]++;
    }

    std::vector<std::string> names;
    std::set<std::string> taken;
    for (const auto& path : pdf_paths) {
        std::filesystem::path pdf(path);
        std::string name = pdf.stem().string();
        if (stem_counts[name] > 1) {
            std::string parent = pdf.parent_path().filename().string();
            if (!parent.empty() && parent != "." && parent != "..") {
                name = parent + "_" + name;
            }
        }

        std::string unique = name;
        for (int suffix = 2; taken.count(unique); ++suffix) {
            unique = name + "_" + std::to_string(suffix);
        }
        taken.insert(unique);
        names.push_back(unique);
    }
    return names;
}

class PaperSplitter::Impl {
public:
    Impl(const PipelineOptions& options)
        : options_(options),
          thread_pool_(options.thread_count) {
        stats_["documents_processed"] = 0;
        stats_["documents_failed"] = 0;
        stats_["pages_processed"] = 0;
        stats_["split_files_written"] = 0;
        stats_["total_processing_time_ms"] = 0;
    }

    AnalysisResult analyze(const std::string& pdf_path) {
        auto document = open_pdf_document(pdf_path);
        return analyzer().analyze(*document);
    }

    std::vector<SplitUnit> split(const std::string& pdf_path, const AnalysisResult& analysis,
                                 const std::string& output_dir) {
        auto document = open_pdf_document(pdf_path);

        SplitOptions split_opts;
        split_opts.output_dir = output_dir;
        split_opts.verbose = options_.verbose;
        return DocumentSplitter(split_opts).split(*document, analysis);
    }

    ProcessResult process(const std::string& pdf_path, const std::string& output_root) {
        return process_into(pdf_path, std::filesystem::path(output_root) / std::filesystem::path(pdf_path).stem());
    }

    ProcessResult process_into(const std::string& pdf_path, const std::filesystem::path& output_dir) {
        auto start_time = std::chrono::high_resolution_clock::now();

        ProcessResult result;
        result.pdf_path = pdf_path;

        try {
            auto document = open_pdf_document(pdf_path);
            if (options_.verbose) {
                std::cout << "[PaperSplitter::process] Starting processing for " << pdf_path << std::endl;
            }

            result.analysis = analyzer().analyze(*document);

            std::filesystem::create_directories(output_dir);
            result.analysis_path = (output_dir / "analysis.json").string();
            save_analysis_file(result.analysis_path, result.analysis);

            SplitOptions split_opts;
            split_opts.output_dir = output_dir.string();
            split_opts.verbose = options_.verbose;
            result.split_files = DocumentSplitter(split_opts).split(*document, result.analysis);

            if (result.split_files.empty()) {
                result.error = "PDF splitting failed";
            } else {
                result.success = true;
            }
            record(result, document->page_count(), start_time);
        } catch (const std::exception& e) {
            std::cerr << "[PaperSplitter::process] Error processing " << pdf_path << ": " << e.what() << std::endl;
            result.success = false;
            result.error = e.what();
            record(result, 0, start_time);
        }

        return result;
    }

    std::vector<ProcessResult> process_batch(const std::vector<std::string>& pdf_paths,
                                             const std::string& output_root,
                                             ProgressCallback progress) {
        std::vector<ProcessResult> results(pdf_paths.size());
        const auto names = batch_output_names(pdf_paths);
        std::atomic<size_t> completed{0};
        std::vector<std::future<void>> futures;

        for (size_t i = 0; i < pdf_paths.size(); ++i) {
            futures.push_back(
                thread_pool_.submit([this, i, &pdf_paths, &output_root, &names, &results, &completed, progress]() {
                    results[i] = process_into(pdf_paths[i], std::filesystem::path(output_root) / names[i]);

                    size_t done = ++completed;
                    if (progress) {
                        progress(done, pdf_paths.size());
                    }
                })
            );
        }

        for (auto& future : futures) {
            future.get();
        }

        return results;
    }

    nlohmann::json get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        nlohmann::json stats = stats_;

        int documents = stats["documents_processed"].get<int>() + stats["documents_failed"].get<int>();
        stats["average_processing_time_ms"] = 0.0;
        if (documents > 0) {
            stats["average_processing_time_ms"] =
                stats["total_processing_time_ms"].get<double>() / static_cast<double>(documents);
        }

        return stats;
    }

private:
    DocumentAnalyzer analyzer() const {
        AnalyzerOptions analyzer_opts;
        analyzer_opts.header_fraction = options_.header_fraction;
        analyzer_opts.page_threads = options_.page_threads;
        analyzer_opts.verbose = options_.verbose;
        return DocumentAnalyzer(analyzer_opts);
    }

    void record(const ProcessResult& result, int pages,
                std::chrono::high_resolution_clock::time_point start_time) {
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::lock_guard<std::mutex> lock(stats_mutex_);
        const char* counter = result.success ? "documents_processed" : "documents_failed";
        stats_[counter] = stats_[counter].get<int>() + 1;
        stats_["pages_processed"] = stats_["pages_processed"].get<int>() + pages;
        stats_["split_files_written"] = stats_["split_files_written"].get<int>() +
                                        static_cast<int>(result.split_files.size());
        stats_["total_processing_time_ms"] = stats_["total_processing_time_ms"].get<long long>() + duration.count();
    }

    PipelineOptions options_;
    ThreadPool thread_pool_;
    nlohmann::json stats_;
    mutable std::mutex stats_mutex_;
};

PaperSplitter::PaperSplitter(const PipelineOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

PaperSplitter::~PaperSplitter() = default;

AnalysisResult PaperSplitter::analyze(const std::string& pdf_path) {
    return pImpl->analyze(pdf_path);
}

std::vector<SplitUnit> PaperSplitter::split(const std::string& pdf_path, const AnalysisResult& analysis,
                                            const std::string& output_dir) {
    return pImpl->split(pdf_path, analysis, output_dir);
}

ProcessResult PaperSplitter::process(const std::string& pdf_path, const std::string& output_root) {
    return pImpl->process(pdf_path, output_root);
}

std::vector<ProcessResult> PaperSplitter::process_batch(const std::vector<std::string>& pdf_paths,
                                                        const std::string& output_root,
                                                        ProgressCallback progress) {
    return pImpl->process_batch(pdf_paths, output_root, progress);
}

nlohmann::json PaperSplitter::get_stats() const {
    return pImpl->get_stats();
}

} // namespace paper_splitter
