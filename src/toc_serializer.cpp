#include "toc_outline/toc_serializer.h"
#include "text_utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace toc_outline {

namespace {

nlohmann::json optional_page(const std::optional<int>& page) {
    if (page) {
        return *page;
    }
    return nullptr;
}

} // namespace

nlohmann::json TocSerializer::node_to_json(const OutlineNode& node) {
    nlohmann::json json;
    json["type"] = node_kind_name(node.kind);
    json["title"] = node.title;
    json["page"] = node.page;
    json["level"] = node.level;
    if (node.kind == NodeKind::Item) {
        json["number"] = node.number;
    }

    json["children"] = nlohmann::json::array();
    for (const auto& child : node.children) {
        json["children"].push_back(node_to_json(child));
    }
    return json;
}

OutlineNode TocSerializer::node_from_json(const nlohmann::json& json) {
    const std::string type = json.at("type").get<std::string>();
    const std::string title = json.at("title").get<std::string>();
    const int page = json.at("page").get<int>();

    OutlineNode node;
    if (type == "chapter") {
        node = OutlineNode::chapter(json.value("number", std::string()), title, page);
    } else if (type == "item") {
        node = OutlineNode::item(json.at("number").get<std::string>(), title, page);
    } else if (type == "other") {
        node = OutlineNode::other(title, page);
    } else {
        throw std::runtime_error("unknown node type '" + type + "'");
    }

    if (json.contains("children")) {
        for (const auto& child : json.at("children")) {
            node.children.push_back(node_from_json(child));
        }
    }
    return node;
}

nlohmann::json TocSerializer::to_document(const PageForest& forest, const TocMetadata& metadata) {
    nlohmann::json document;
    document["metadata"] = {
        {"source_name", metadata.source_name},
        {"generated_at", metadata.generated_at.empty() ? current_timestamp()
                                                       : metadata.generated_at},
        {"total_pages", metadata.total_pages > 0 ? nlohmann::json(metadata.total_pages)
                                                 : nlohmann::json(nullptr)},
        {"version", metadata.version},
        {"toc_pages", metadata.toc_pages}
    };

    document["toc_tree"] = nlohmann::json::object();
    for (const auto& [page, roots] : forest) {
        nlohmann::json page_nodes = nlohmann::json::array();
        for (const auto& root : roots) {
            page_nodes.push_back(node_to_json(root));
        }
        document["toc_tree"][std::to_string(page)] = page_nodes;
    }

    document["statistics"] = {
        {"total_nodes", count_nodes(forest)}
    };
    return document;
}

PageForest TocSerializer::forest_from_document(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("toc_tree") ||
        !document["toc_tree"].is_object()) {
        throw std::runtime_error("TOC document has no toc_tree object");
    }

    PageForest forest;
    try {
        for (const auto& entry : document["toc_tree"].items()) {
            int page = 0;
            if (!text::parse_int(entry.key(), page)) {
                throw std::runtime_error("toc_tree key '" + entry.key() + "' is not a page number");
            }
            std::vector<OutlineNode> roots;
            for (const auto& node : entry.value()) {
                roots.push_back(node_from_json(node));
            }
            if (!roots.empty()) {
                forest[page] = std::move(roots);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed TOC node: ") + e.what());
    }
    return forest;
}

nlohmann::json TocSerializer::diagnostic_to_json(const Diagnostic& diagnostic) {
    return {
        {"kind", diagnostic_kind_name(diagnostic.kind)},
        {"page", diagnostic.page},
        {"subject", diagnostic.subject},
        {"message", diagnostic.message}
    };
}

nlohmann::json TocSerializer::split_plan_to_json(const SplitPlan& plan) {
    nlohmann::json output;
    output["total_pages"] = plan.total_pages;

    output["divisions"] = nlohmann::json::array();
    for (const auto& [division, span] : plan.divisions.spans) {
        nlohmann::json chapters = nlohmann::json::array();
        for (const auto& chapter : span.chapters) {
            chapters.push_back({{"title", display_title(chapter)}, {"page", chapter.page}});
        }
        output["divisions"].push_back({
            {"name", division_name(division)},
            {"label", division_label(division)},
            {"found", span.found()},
            {"start_page", optional_page(span.start_page)},
            {"end_page", optional_page(span.end_page)},
            {"chapters", chapters}
        });
    }

    output["chapters"] = nlohmann::json::array();
    for (const auto& planned : plan.chapters) {
        nlohmann::json division = nullptr;
        if (planned.division) {
            division = division_name(*planned.division);
        }
        output["chapters"].push_back({
            {"division", division},
            {"title", display_title(planned.range.chapter)},
            {"start_page", planned.range.start_page},
            {"end_page", planned.range.end_page},
            {"page_count", planned.range.page_count()},
            {"file_stem", planned.file_stem}
        });
    }

    output["unclassified"] = nlohmann::json::array();
    for (const auto& chapter : plan.divisions.unclassified) {
        output["unclassified"].push_back({{"title", display_title(chapter)},
                                          {"page", chapter.page}});
    }

    output["diagnostics"] = nlohmann::json::array();
    for (const auto& diagnostic : plan.diagnostics) {
        output["diagnostics"].push_back(diagnostic_to_json(diagnostic));
    }
    return output;
}

void TocSerializer::write_file(const nlohmann::json& document, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write output file: " + path);
    }
    out << document.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

nlohmann::json TocSerializer::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("JSON file not found: " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

std::string TocSerializer::current_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace toc_outline
