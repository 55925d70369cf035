#include <paper_splitter/paper_splitter.h>
#include <paper_splitter/analysis_result.h>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <string>
#include <vector>
#include <getopt.h>
#include <fstream>

namespace fs = std::filesystem;
using namespace paper_splitter;

struct CLIOptions {
    std::string command;
    std::string input_path;
    std::string analysis_file;
    std::string output_path;
    double header_fraction = DEFAULT_HEADER_FRACTION;
    int thread_count = 0;  // 0 = auto
    int page_threads = 1;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <analyze|split|process> [OPTIONS]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  analyze                    Detect papers and write the analysis JSON\n";
    std::cout << "  split                      Split a PDF using an existing analysis JSON\n";
    std::cout << "  process                    Analyze then split (file or directory input)\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input PATH           Input PDF file (or directory for process)\n";
    std::cout << "  -a, --analysis FILE        Analysis JSON (split only)\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output PATH          analyze: analysis JSON path (default: <input>_analysis.json)\n";
    std::cout << "                             split/process: output directory (default: ./split)\n";
    std::cout << "  --header-fraction F        Top fraction of the page searched for titles (default: 0.2)\n";
    std::cout << "  --threads N                Documents processed in parallel (default: auto-detect)\n";
    std::cout << "  --page-threads N           Header scan threads per document (default: 1)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " analyze -i papers.pdf\n";
    std::cout << "  " << program_name << " split -i papers.pdf -a papers_analysis.json -o out\n";
    std::cout << "  " << program_name << " process -i /path/to/pdfs -o out --threads 4\n";
}

void print_version() {
    std::cout << "paper-splitter version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, and nlohmann/json\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:a:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"analysis", required_argument, nullptr, 'a'},
        {"output", required_argument, nullptr, 'o'},
        {"header-fraction", required_argument, nullptr, 1001},
        {"threads", required_argument, nullptr, 1002},
        {"page-threads", required_argument, nullptr, 1003},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1004},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'a':
                options.analysis_file = optarg;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 1001:  // header-fraction
                options.header_fraction = std::stod(optarg);
                if (options.header_fraction <= 0.0 || options.header_fraction > 1.0) {
                    throw std::invalid_argument("header-fraction must be in (0, 1]");
                }
                break;
            case 1002:  // threads
                options.thread_count = std::stoi(optarg);
                if (options.thread_count < 0) {
                    throw std::invalid_argument("thread count cannot be negative");
                }
                break;
            case 1003:  // page-threads
                options.page_threads = std::stoi(optarg);
                if (options.page_threads < 1) {
                    throw std::invalid_argument("page-threads must be at least 1");
                }
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1004:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (optind < argc) {
        options.command = argv[optind];
    }

    if (options.command.empty()) {
        throw std::invalid_argument("A command is required (analyze, split or process)");
    }
    if (options.command != "analyze" && options.command != "split" && options.command != "process") {
        throw std::invalid_argument("Unknown command: " + options.command);
    }
    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }
    if (options.command == "split" && options.analysis_file.empty()) {
        throw std::invalid_argument("--analysis is required for split");
    }
    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.output_path.empty()) {
        if (options.command == "analyze") {
            fs::path input_path(options.input_path);
            fs::path output_dir = input_path.parent_path();
            if (output_dir.empty()) {
                output_dir = ".";
            }
            options.output_path = (output_dir / (input_path.stem().string() + "_analysis.json")).string();
        } else {
            options.output_path = "./split";
        }
    }

    return options;
}

std::vector<std::string> collect_pdfs(const std::string& input_dir) {
    std::vector<std::string> pdf_files;
    for (const auto& entry : fs::recursive_directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            auto ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (ext == ".pdf") {
                pdf_files.push_back(entry.path().string());
            }
        }
    }
    std::sort(pdf_files.begin(), pdf_files.end());
    return pdf_files;
}

nlohmann::json run_analyze(PaperSplitter& splitter, const CLIOptions& options) {
    AnalysisResult analysis = splitter.analyze(options.input_path);

    fs::path output_dir = fs::path(options.output_path).parent_path();
    if (!output_dir.empty()) {
        fs::create_directories(output_dir);
    }
    save_analysis_file(options.output_path, analysis);

    return {
        {"status", "success"},
        {"pdf_path", options.input_path},
        {"analysis_result", analysis},
        {"analysis_path", options.output_path}
    };
}

nlohmann::json run_split(PaperSplitter& splitter, const CLIOptions& options) {
    std::ifstream in(options.analysis_file);
    if (!in) {
        throw std::runtime_error("Cannot open analysis file: " + options.analysis_file);
    }
    nlohmann::json analysis_json = nlohmann::json::parse(in);

    auto errors = validate_analysis(analysis_json);
    for (const auto& error : errors) {
        std::cerr << "Warning: analysis: " << error << "\n";
    }

    auto split_files = splitter.split(options.input_path, analysis_json.get<AnalysisResult>(),
                                      options.output_path);
    if (split_files.empty()) {
        return {
            {"status", "error"},
            {"error", "PDF splitting failed"},
            {"pdf_path", options.input_path}
        };
    }

    return {
        {"status", "success"},
        {"split_files", split_files},
        {"total_files", split_files.size()},
        {"pdf_path", options.input_path}
    };
}

nlohmann::json run_process(PaperSplitter& splitter, const CLIOptions& options) {
    if (fs::is_regular_file(options.input_path)) {
        return splitter.process(options.input_path, options.output_path);
    }

    auto pdf_files = collect_pdfs(options.input_path);
    if (pdf_files.empty()) {
        return {
            {"status", "error"},
            {"error", "No PDF files found in " + options.input_path}
        };
    }

    auto results = splitter.process_batch(pdf_files, options.output_path,
        [&options](size_t current, size_t total) {
            if (!options.quiet) {
                std::cerr << "\rProgress: " << current << "/" << total
                          << " (" << (100 * current / total) << "%)" << std::flush;
            }
        });
    if (!options.quiet) {
        std::cerr << std::endl;
    }

    size_t success_count = std::count_if(results.begin(), results.end(),
                                         [](const ProcessResult& r) { return r.success; });
    return {
        {"status", success_count > 0 ? "success" : "error"},
        {"results", results},
        {"succeeded", success_count},
        {"total", results.size()},
        {"stats", splitter.get_stats()}
    };
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(options.input_path)) {
            throw std::runtime_error("Input path not found: " + options.input_path);
        }

        PipelineOptions pipeline_opts;
        if (options.thread_count > 0) {
            pipeline_opts.thread_count = options.thread_count;
        }
        pipeline_opts.page_threads = options.page_threads;
        pipeline_opts.header_fraction = options.header_fraction;
        pipeline_opts.verbose = options.verbose;

        PaperSplitter splitter(pipeline_opts);

        nlohmann::json result;
        if (options.command == "analyze") {
            result = run_analyze(splitter, options);
        } else if (options.command == "split") {
            result = run_split(splitter, options);
        } else {
            result = run_process(splitter, options);
        }

        if (options.quiet) {
            std::cout << result["status"].get<std::string>() << "\n";
        } else {
            std::cout << result.dump(2) << "\n";
        }

        return result["status"] == "success" ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        nlohmann::json result = {
            {"status", "error"},
            {"error", e.what()}
        };
        std::cout << result.dump(2) << "\n";
        return 1;
    }
}
