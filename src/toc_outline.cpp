#include "toc_outline/toc_outline.h"
#include "toc_outline/outline_tree_builder.h"
#include "toc_outline/page_dump_reader.h"
#include "toc_outline/toc_page_detector.h"
#include <chrono>
#include <iostream>

namespace toc_outline {

class TocOutline::Impl {
public:
    Impl(const OutlineOptions& options, std::vector<DivisionEntry> division_table)
        : options_(options),
          detector_(options),
          builder_(options),
          divisions_(std::move(division_table)) {
        stats_["documents_processed"] = 0;
        stats_["pages_scanned"] = 0;
        stats_["nodes_built"] = 0;
        stats_["total_processing_time_ms"] = 0;
    }

    OutlineResult parse(const std::vector<Line>& lines) {
        auto start_time = std::chrono::high_resolution_clock::now();

        require_page_order(lines);

        OutlineResult result;
        result.toc_pages = detector_.detect(lines);
        if (options_.verbose) {
            std::cout << "[TocOutline::parse] " << lines.size() << " lines, "
                      << result.toc_pages.size() << " TOC pages" << std::endl;
        }

        result.forest = builder_.build(result.toc_pages, lines, &result.diagnostics);
        result.total_nodes = count_nodes(result.forest);

        if (options_.verbose) {
            std::cout << "[TocOutline::parse] Built " << result.total_nodes << " nodes on "
                      << result.forest.size() << " pages" << std::endl;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        stats_["documents_processed"] = stats_["documents_processed"].get<int>() + 1;
        stats_["pages_scanned"] = stats_["pages_scanned"].get<int>() + count_pages(lines);
        stats_["nodes_built"] = stats_["nodes_built"].get<size_t>() + result.total_nodes;
        stats_["total_processing_time_ms"] =
            stats_["total_processing_time_ms"].get<int64_t>() + duration.count();

        return result;
    }

    OutlineResult parse_file(const std::string& dump_path, const DumpFormat& format) {
        if (options_.verbose) {
            std::cout << "[TocOutline::parse_file] Reading " << dump_path << std::endl;
        }
        return parse(read_page_dump_file(dump_path, format));
    }

    SplitPlan plan(const PageForest& forest, int total_pages) const {
        auto split_plan = build_split_plan(forest, total_pages, divisions_);
        if (options_.verbose) {
            std::cout << "[TocOutline::plan] " << split_plan.chapters.size() << " chapter ranges, "
                      << split_plan.diagnostics.size() << " diagnostics" << std::endl;
        }
        return split_plan;
    }

    nlohmann::json get_stats() const {
        nlohmann::json stats = stats_;

        if (stats["documents_processed"].get<int>() > 0) {
            stats["average_processing_time_ms"] =
                static_cast<double>(stats["total_processing_time_ms"].get<int64_t>()) /
                static_cast<double>(stats["documents_processed"].get<int>());
        }

        return stats;
    }

private:
    static int count_pages(const std::vector<Line>& lines) {
        std::set<int> pages;
        for (const auto& line : lines) {
            pages.insert(line.page);
        }
        return static_cast<int>(pages.size());
    }

    OutlineOptions options_;
    TocPageDetector detector_;
    OutlineTreeBuilder builder_;
    DivisionClassifier divisions_;
    nlohmann::json stats_;
};

TocOutline::TocOutline(const OutlineOptions& options, std::vector<DivisionEntry> division_table)
    : pImpl(std::make_unique<Impl>(options, std::move(division_table))) {}

TocOutline::~TocOutline() = default;

OutlineResult TocOutline::parse(const std::vector<Line>& lines) {
    return pImpl->parse(lines);
}

OutlineResult TocOutline::parse_file(const std::string& dump_path, const DumpFormat& format) {
    return pImpl->parse_file(dump_path, format);
}

SplitPlan TocOutline::plan(const PageForest& forest, int total_pages) const {
    return pImpl->plan(forest, total_pages);
}

nlohmann::json TocOutline::get_stats() const {
    return pImpl->get_stats();
}

} // namespace toc_outline
