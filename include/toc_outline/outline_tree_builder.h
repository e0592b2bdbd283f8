#pragma once

#include <toc_outline/line_classifier.h>
#include <toc_outline/outline_options.h>
#include <toc_outline/outline_types.h>
#include <set>
#include <vector>

namespace toc_outline {

// Turns the classified lines of each TOC page into a forest using an open-node stack:
//
//   chapter  -> clears the stack, becomes a root
//   item (L) -> pops entries with level >= L, becomes a child of the new top
//               (or a root when nothing is open)
//   other    -> always a root, stack untouched
//
// Pages are independent of each other, so they can be built on a thread pool.
class OutlineTreeBuilder {
public:
    explicit OutlineTreeBuilder(const OutlineOptions& options = OutlineOptions{});

    // Roots for one page. `page_lines` must all belong to `page`.
    std::vector<OutlineNode> build_page(int page,
                                        const std::vector<Line>& page_lines,
                                        std::vector<Diagnostic>& diagnostics) const;

    // Forest over the pages listed in toc_pages. Empty pages are left out of the map.
    // Throws ContractError when lines are not page-ordered.
    PageForest build(const std::set<int>& toc_pages,
                     const std::vector<Line>& lines,
                     std::vector<Diagnostic>* diagnostics = nullptr) const;

private:
    OutlineOptions options_;
    LineClassifier classifier_;
};

PageForest build_page_forest(const std::set<int>& toc_pages, const std::vector<Line>& lines);

} // namespace toc_outline
