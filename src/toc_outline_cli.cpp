#include <toc_outline/toc_outline.h>
#include <toc_outline/page_dump_reader.h>
#include <toc_outline/toc_serializer.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <set>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace toc_outline;

struct CLIOptions {
    std::string input_file;
    std::string output_file;
    std::string plan_file;
    std::string source_name;
    std::string contents_marker;
    bool from_json = false;
    int total_pages = 0;    // 0 = unknown, required with --plan
    int thread_count = 1;
    int min_filler = 3;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Page dump (or TOC tree JSON with --from-json)\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          TOC tree JSON path (default: <input>_toc_tree.json)\n";
    std::cout << "  --plan FILE                Also write the chapter split plan to FILE\n";
    std::cout << "  --from-json                Input is a TOC tree JSON written earlier\n";
    std::cout << "  --total-pages N            Pages in the source document (required with --plan unless --from-json)\n";
    std::cout << "  --source-name NAME         Document name recorded in the metadata\n";
    std::cout << "  --threads N                Threads for building TOC pages (default: 1)\n";
    std::cout << "  --min-filler N             Shortest dot leader between title and page (default: 3)\n";
    std::cout << "  --contents-marker TEXT     Table of contents heading (default: 목차)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i price_list_dump.txt\n";
    std::cout << "  " << program_name << " -i price_list_dump.txt --plan split_plan.json --total-pages 1120\n";
    std::cout << "  " << program_name << " -i price_list_toc_tree.json --from-json --plan split_plan.json\n";
}

void print_version() {
    std::cout << "toc-outline toc_outline_cli version 2.0.0\n";
    std::cout << "Built with C++17 and nlohmann::json\n";
}

int parse_count(const char* name, const char* value, int minimum) {
    int parsed = std::stoi(value);
    if (parsed < minimum) {
        throw std::invalid_argument(std::string(name) + " must be at least " +
                                    std::to_string(minimum));
    }
    return parsed;
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"plan", required_argument, nullptr, 1001},
        {"from-json", no_argument, nullptr, 1002},
        {"total-pages", required_argument, nullptr, 1003},
        {"source-name", required_argument, nullptr, 1004},
        {"threads", required_argument, nullptr, 1005},
        {"min-filler", required_argument, nullptr, 1006},
        {"contents-marker", required_argument, nullptr, 1007},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_file = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1001:  // plan
                options.plan_file = optarg;
                break;
            case 1002:  // from-json
                options.from_json = true;
                break;
            case 1003:  // total-pages
                options.total_pages = parse_count("total-pages", optarg, 1);
                break;
            case 1004:  // source-name
                options.source_name = optarg;
                break;
            case 1005:  // threads
                options.thread_count = parse_count("thread count", optarg, 1);
                break;
            case 1006:  // min-filler
                options.min_filler = parse_count("min-filler", optarg, 1);
                break;
            case 1007:  // contents-marker
                options.contents_marker = optarg;
                if (options.contents_marker.empty()) {
                    throw std::invalid_argument("contents-marker cannot be empty");
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
            case 1008:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_file.empty()) {
        throw std::invalid_argument("Input file is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (!options.from_json && !options.plan_file.empty() && options.total_pages == 0) {
        throw std::invalid_argument("--plan requires --total-pages when reading a page dump");
    }

    if (options.from_json && !options.output_file.empty()) {
        throw std::invalid_argument("--output has no effect with --from-json, use --plan");
    }

    fs::path input_path(options.input_file);
    fs::path output_dir = input_path.parent_path();
    if (output_dir.empty()) {
        output_dir = ".";
    }
    std::string stem = input_path.stem().string();

    if (!options.from_json && options.output_file.empty()) {
        options.output_file = (output_dir / (stem + "_toc_tree.json")).string();
    }
    if (options.from_json && options.plan_file.empty()) {
        options.plan_file = (output_dir / (stem + "_split_plan.json")).string();
    }
    if (options.source_name.empty()) {
        options.source_name = input_path.filename().string();
    }

    return options;
}

void ensure_parent_directory(const std::string& path, bool verbose) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        if (verbose) {
            std::cout << "Creating output directory: " << parent << "\n";
        }
        fs::create_directories(parent);
    }
}

void print_division_summary(const SplitPlan& plan) {
    std::cout << "\n=== Division Summary ===\n";
    for (const auto& [division, span] : plan.divisions.spans) {
        std::cout << "  " << std::left << std::setw(12) << division_name(division) << " ";
        if (!span.found()) {
            std::cout << "not found\n";
            continue;
        }
        std::cout << "pages " << *span.start_page << "-" << *span.end_page
                  << " (" << span.chapters.size() << " chapters)\n";
    }
    if (!plan.divisions.unclassified.empty()) {
        std::cout << "  unclassified: " << plan.divisions.unclassified.size() << " chapters\n";
    }

    std::cout << "\n=== Chapter Ranges ===\n";
    for (const auto& planned : plan.chapters) {
        std::cout << "  " << std::right << std::setw(5) << planned.range.start_page << "-"
                  << std::left << std::setw(5) << planned.range.end_page << " "
                  << display_title(planned.range.chapter) << "\n";
    }
}

void print_diagnostics(const std::vector<Diagnostic>& diagnostics) {
    for (const auto& diagnostic : diagnostics) {
        std::cerr << (is_rejection(diagnostic.kind) ? "REJECTED [" : "WARNING [")
                  << diagnostic_kind_name(diagnostic.kind) << "] page "
                  << diagnostic.page << ": " << diagnostic.message << "\n";
    }
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

        if (!fs::exists(options.input_file)) {
            throw std::runtime_error("Input file not found: " + options.input_file);
        }

        OutlineOptions outline_opts;
        outline_opts.min_filler_run = options.min_filler;
        outline_opts.thread_count = options.thread_count;
        outline_opts.verbose = options.verbose;
        if (!options.contents_marker.empty()) {
            outline_opts.contents_marker = options.contents_marker;
        }

        TocOutline outline(outline_opts);

        if (!options.quiet) {
            std::cout << "Processing: " << options.input_file << "\n";
            if (!options.output_file.empty()) {
                std::cout << "Output: " << options.output_file << "\n";
            }
            if (!options.plan_file.empty()) {
                std::cout << "Split plan: " << options.plan_file << "\n";
            }
            std::cout << "Configuration:\n";
            std::cout << "  Contents marker: " << outline_opts.contents_marker << "\n";
            std::cout << "  Min filler run: " << outline_opts.min_filler_run << "\n";
            std::cout << "  Threads: " << outline_opts.thread_count << "\n";
            std::cout << "\n";
        }

        auto start = std::chrono::high_resolution_clock::now();

        OutlineResult result;
        int total_pages = options.total_pages;

        if (options.from_json) {
            auto document = TocSerializer::read_file(options.input_file);
            result.forest = TocSerializer::forest_from_document(document);
            result.total_nodes = count_nodes(result.forest);
            if (document.contains("metadata")) {
                const auto& metadata = document["metadata"];
                if (total_pages == 0 && metadata.contains("total_pages") &&
                    metadata["total_pages"].is_number_integer()) {
                    total_pages = metadata["total_pages"].get<int>();
                }
                if (metadata.contains("toc_pages")) {
                    result.toc_pages = metadata["toc_pages"].get<std::set<int>>();
                }
            }
            if (total_pages <= 0) {
                throw std::invalid_argument("--total-pages is required when the JSON has none");
            }
        } else {
            auto lines = read_page_dump_file(options.input_file);
            if (options.verbose) {
                std::cout << "Read " << lines.size() << " lines, last page " << last_page(lines)
                          << "\n";
            }

            result = outline.parse(lines);

            TocMetadata metadata;
            metadata.source_name = options.source_name;
            metadata.total_pages = total_pages;
            metadata.toc_pages = result.toc_pages;

            ensure_parent_directory(options.output_file, options.verbose);
            TocSerializer::write_file(TocSerializer::to_document(result.forest, metadata),
                                      options.output_file);
        }

        const size_t chapter_count = flatten_chapters(result.forest).size();

        if (!options.quiet) {
            print_diagnostics(result.diagnostics);
        }

        bool wrote_plan = false;
        if (!options.plan_file.empty()) {
            auto plan = outline.plan(result.forest, total_pages);

            ensure_parent_directory(options.plan_file, options.verbose);
            TocSerializer::write_file(TocSerializer::split_plan_to_json(plan), options.plan_file);
            wrote_plan = true;

            if (!options.quiet) {
                print_division_summary(plan);
                print_diagnostics(plan.diagnostics);
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (!options.quiet) {
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "TOC pages: " << result.toc_pages.size() << "\n";
            std::cout << "Nodes: " << result.total_nodes << "\n";
            std::cout << "Chapters: " << chapter_count << "\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
            if (!options.output_file.empty()) {
                std::cout << "Output saved to: " << options.output_file << "\n";
            }
            if (wrote_plan) {
                std::cout << "Split plan saved to: " << options.plan_file << "\n";
            }
        } else {
            std::cout << "SUCCESS|" << options.input_file << "|"
                      << result.toc_pages.size() << "|"
                      << result.total_nodes << "|"
                      << chapter_count << "|"
                      << total_duration.count() << "\n";
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
