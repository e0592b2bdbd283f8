#pragma once

#include <toc_outline/division_classifier.h>
#include <toc_outline/outline_options.h>
#include <toc_outline/outline_types.h>
#include <toc_outline/split_planner.h>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toc_outline {

struct OutlineResult {
    std::set<int> toc_pages;
    PageForest forest;
    std::vector<Diagnostic> diagnostics;
    size_t total_nodes = 0;
};

// Runs detection and tree building over a page dump, then plans the split on request.
class TocOutline {
public:
    explicit TocOutline(const OutlineOptions& options = OutlineOptions{},
                        std::vector<DivisionEntry> division_table = default_division_table());
    ~TocOutline();

    OutlineResult parse(const std::vector<Line>& lines);
    OutlineResult parse_file(const std::string& dump_path, const DumpFormat& format = DumpFormat{});

    SplitPlan plan(const PageForest& forest, int total_pages) const;

    // Cumulative over every parse on this instance.
    nlohmann::json get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toc_outline
