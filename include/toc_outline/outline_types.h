#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace toc_outline {

// Thrown when a caller breaks an API contract (unordered input, missing page totals,
// unusable options). Malformed document content never throws; it becomes a Diagnostic.
class ContractError : public std::invalid_argument {
public:
    explicit ContractError(const std::string& what) : std::invalid_argument(what) {}
};

// One extracted line of the page dump. Owned by the reader, read-only afterwards.
struct Line {
    int page = 0;          // physical page in the dump
    int line_number = 0;   // 1-based within the page
    std::string text;
};

enum class NodeKind {
    Chapter,
    Item,
    Other
};

struct OutlineNode {
    NodeKind kind = NodeKind::Other;
    std::string number;   // "1" for chapters, "1-1-2" for items, empty for Other
    std::string title;
    int page = 0;         // printed target page, not the page the line appears on
    int level = 0;
    std::vector<OutlineNode> children;

    static OutlineNode chapter(std::string number, std::string title, int page);
    static OutlineNode item(std::string number, std::string title, int page);
    static OutlineNode other(std::string title, int page);
};

// Source page -> root nodes found on that page, in line order.
// Pages without any node are absent rather than mapped to an empty vector.
using PageForest = std::map<int, std::vector<OutlineNode>>;

enum class DiagnosticKind {
    DuplicateSibling,
    UnclassifiedChapter,
    DivisionOutOfOrder,
    StartBeforeDocument,
    StartBeyondDocument,
    EndClamped,
    OutOfOrderChapter
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::DuplicateSibling;
    int page = 0;
    std::string subject;
    std::string message;
};

// Depth of an item number: "1-1" -> 1, "1-1-1" -> 2.
int item_level(const std::string& number);

const char* node_kind_name(NodeKind kind);
const char* diagnostic_kind_name(DiagnosticKind kind);

// True for diagnostics that drop a chapter from the resolved ranges.
bool is_rejection(DiagnosticKind kind);

// "제1장 적용기준" for chapters, "1-1 일반사항" for items, the bare title otherwise.
std::string display_title(const OutlineNode& node);

size_t count_nodes(const OutlineNode& node);
size_t count_nodes(const PageForest& forest);

// All Chapter roots in page order, then line order within the page.
std::vector<OutlineNode> flatten_chapters(const PageForest& forest);

} // namespace toc_outline
