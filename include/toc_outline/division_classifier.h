#pragma once

#include <toc_outline/outline_types.h>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toc_outline {

// The five divisions of the price list, in document order.
enum class Division {
    Common,
    Civil,
    Architecture,
    Mechanical,
    Maintenance
};

constexpr std::array<Division, 5> kAllDivisions = {
    Division::Common, Division::Civil, Division::Architecture,
    Division::Mechanical, Division::Maintenance
};

const char* division_name(Division division);    // "common", "civil", ...
const char* division_label(Division division);   // "공통부문", "토목부문", ...

struct DivisionEntry {
    std::string title;   // chapter title as printed, without the "제N장" marker
    Division division;
};

// Chapter titles of the standard price list, keyed to their division.
std::vector<DivisionEntry> default_division_table();

struct DivisionSpan {
    Division division = Division::Common;
    std::optional<int> start_page;
    std::optional<int> end_page;
    std::vector<OutlineNode> chapters;

    bool found() const { return start_page.has_value(); }
};

struct DivisionReport {
    std::map<Division, DivisionSpan> spans;      // always holds all five divisions
    std::vector<OutlineNode> unclassified;       // chapters whose title is not in the table
    std::vector<Diagnostic> diagnostics;
};

class DivisionClassifier {
public:
    explicit DivisionClassifier(std::vector<DivisionEntry> table = default_division_table());

    // Exact title lookup; whitespace runs inside the title are treated as one space.
    std::optional<Division> lookup(const std::string& title) const;

    // `chapters` must be Chapter nodes in document order; `last_known_page` closes the
    // final populated division. Throws ContractError on a non-chapter node or a
    // non-positive last page.
    DivisionReport classify(const std::vector<OutlineNode>& chapters, int last_known_page) const;

private:
    std::map<std::string, Division> table_;
};

DivisionReport classify_divisions(const std::vector<OutlineNode>& chapters, int last_known_page);

} // namespace toc_outline
