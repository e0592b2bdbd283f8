#pragma once

#include <toc_outline/outline_types.h>
#include <toc_outline/split_planner.h>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace toc_outline {

struct TocMetadata {
    std::string source_name;
    std::string generated_at;   // filled with the current local time when empty
    int total_pages = 0;        // written as null when unknown
    std::set<int> toc_pages;
    std::string version = "2.0";
};

class TocSerializer {
public:
    // {type, title, page, level, number (items only), children}
    static nlohmann::json node_to_json(const OutlineNode& node);
    static OutlineNode node_from_json(const nlohmann::json& node);

    // {metadata, toc_tree: {"<page>": [node...]}, statistics: {total_nodes}}
    static nlohmann::json to_document(const PageForest& forest, const TocMetadata& metadata);

    // Reads the toc_tree back. Throws std::runtime_error on a malformed document.
    static PageForest forest_from_document(const nlohmann::json& document);

    static nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic);
    static nlohmann::json split_plan_to_json(const SplitPlan& plan);

    // Pretty-printed, UTF-8 left unescaped. Throws std::runtime_error if unwritable.
    static void write_file(const nlohmann::json& document, const std::string& path);
    static nlohmann::json read_file(const std::string& path);

    static std::string current_timestamp();
};

} // namespace toc_outline
