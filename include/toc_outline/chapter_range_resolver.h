#pragma once

#include <toc_outline/outline_types.h>
#include <vector>

namespace toc_outline {

struct ChapterRange {
    OutlineNode chapter;
    int start_page = 0;
    int end_page = 0;

    int page_count() const { return end_page - start_page + 1; }
};

struct RangeResolution {
    std::vector<ChapterRange> ranges;        // accepted chapters, document order
    std::vector<Diagnostic> diagnostics;     // rejections and clamps, see is_rejection()
};

// Chapter i runs from its own page to the page before chapter i+1, the last one to
// total_pages. Each chapter is validated on its own:
//   start > total_pages  -> rejected
//   end   > total_pages  -> clamped, reported
//   start > end          -> rejected (next chapter does not start later)
// Throws ContractError when total_pages is not positive.
RangeResolution resolve_chapter_ranges(const std::vector<OutlineNode>& chapters, int total_pages);

} // namespace toc_outline
