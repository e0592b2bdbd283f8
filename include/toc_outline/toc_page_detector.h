#pragma once

#include <toc_outline/outline_options.h>
#include <toc_outline/outline_types.h>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace toc_outline {

// Finds the pages that carry printed table-of-contents text. A page qualifies when its
// contents heading sits directly above or below a bare printed page number:
//
//   목  차          12
//   12              목  차
//
// The printed number is what gets reported.
class TocPageDetector {
public:
    explicit TocPageDetector(const OutlineOptions& options = OutlineOptions{});

    // Sorted unique printed page numbers. Throws ContractError when lines are not page-ordered.
    std::set<int> detect(const std::vector<Line>& lines) const;

    bool is_contents_heading(const std::string& text) const;
    bool match_bare_number(const std::string& text, int& number) const;

private:
    std::regex heading_;
    std::regex bare_number_;
    size_t max_line_length_;
};

std::set<int> detect_toc_pages(const std::vector<Line>& lines);

// Throws ContractError unless page numbers never decrease.
void require_page_order(const std::vector<Line>& lines);

} // namespace toc_outline
