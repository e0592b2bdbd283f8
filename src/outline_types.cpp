#include "toc_outline/outline_types.h"
#include "toc_outline/outline_options.h"
#include <algorithm>

namespace toc_outline {

OutlineNode OutlineNode::chapter(std::string number, std::string title, int page) {
    OutlineNode node;
    node.kind = NodeKind::Chapter;
    node.number = std::move(number);
    node.title = std::move(title);
    node.page = page;
    node.level = 0;
    return node;
}

OutlineNode OutlineNode::item(std::string number, std::string title, int page) {
    OutlineNode node;
    node.kind = NodeKind::Item;
    node.level = item_level(number);
    node.number = std::move(number);
    node.title = std::move(title);
    node.page = page;
    return node;
}

OutlineNode OutlineNode::other(std::string title, int page) {
    OutlineNode node;
    node.kind = NodeKind::Other;
    node.title = std::move(title);
    node.page = page;
    node.level = 0;
    return node;
}

int item_level(const std::string& number) {
    return static_cast<int>(std::count(number.begin(), number.end(), '-'));
}

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Chapter: return "chapter";
        case NodeKind::Item: return "item";
        case NodeKind::Other: return "other";
    }
    return "other";
}

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DuplicateSibling: return "duplicate_sibling";
        case DiagnosticKind::UnclassifiedChapter: return "unclassified_chapter";
        case DiagnosticKind::DivisionOutOfOrder: return "division_out_of_order";
        case DiagnosticKind::StartBeforeDocument: return "start_before_document";
        case DiagnosticKind::StartBeyondDocument: return "start_beyond_document";
        case DiagnosticKind::EndClamped: return "end_clamped";
        case DiagnosticKind::OutOfOrderChapter: return "out_of_order_chapter";
    }
    return "unknown";
}

bool is_rejection(DiagnosticKind kind) {
    return kind == DiagnosticKind::StartBeforeDocument ||
           kind == DiagnosticKind::StartBeyondDocument ||
           kind == DiagnosticKind::OutOfOrderChapter;
}

std::string display_title(const OutlineNode& node) {
    switch (node.kind) {
        case NodeKind::Chapter: {
            if (node.number.empty()) return node.title;
            std::string label = "제" + node.number + "장";
            return node.title.empty() ? label : label + " " + node.title;
        }
        case NodeKind::Item:
            return node.title.empty() ? node.number : node.number + " " + node.title;
        case NodeKind::Other:
            break;
    }
    return node.title;
}

size_t count_nodes(const OutlineNode& node) {
    size_t total = 1;
    for (const auto& child : node.children) {
        total += count_nodes(child);
    }
    return total;
}

size_t count_nodes(const PageForest& forest) {
    size_t total = 0;
    for (const auto& [page, roots] : forest) {
        for (const auto& root : roots) {
            total += count_nodes(root);
        }
    }
    return total;
}

std::vector<OutlineNode> flatten_chapters(const PageForest& forest) {
    std::vector<OutlineNode> chapters;
    for (const auto& [page, roots] : forest) {
        for (const auto& root : roots) {
            if (root.kind == NodeKind::Chapter) {
                chapters.push_back(root);
            }
        }
    }
    return chapters;
}

void validate_options(const OutlineOptions& options) {
    if (options.contents_marker.empty()) {
        throw ContractError("contents marker cannot be empty");
    }
    if (options.chapter_prefix.empty() && options.chapter_suffix.empty()) {
        throw ContractError("chapter marker needs a prefix or a suffix");
    }
    if (options.filler_chars.empty()) {
        throw ContractError("at least one filler character is required");
    }
    for (const auto& ch : options.filler_chars) {
        if (ch.empty()) {
            throw ContractError("filler characters cannot be empty strings");
        }
    }
    if (options.min_filler_run < 1) {
        throw ContractError("min filler run must be positive");
    }
    if (options.max_line_length == 0) {
        throw ContractError("max line length must be positive");
    }
    if (options.thread_count < 1) {
        throw ContractError("thread count must be positive");
    }
}

} // namespace toc_outline
