#include "toc_outline/chapter_range_resolver.h"
#include <string>

namespace toc_outline {

RangeResolution resolve_chapter_ranges(const std::vector<OutlineNode>& chapters, int total_pages) {
    if (total_pages <= 0) {
        throw ContractError("total pages must be positive, got " + std::to_string(total_pages));
    }

    RangeResolution resolution;

    for (size_t i = 0; i < chapters.size(); ++i) {
        const OutlineNode& chapter = chapters[i];
        const std::string name = display_title(chapter);
        const int start_page = chapter.page;

        int end_page = total_pages;
        if (i + 1 < chapters.size()) {
            end_page = chapters[i + 1].page - 1;
        }

        if (start_page < 1) {
            resolution.diagnostics.push_back(Diagnostic{
                DiagnosticKind::StartBeforeDocument, start_page, name,
                name + " starts at page " + std::to_string(start_page) +
                    ", before the first page"});
            continue;
        }

        if (start_page > total_pages) {
            resolution.diagnostics.push_back(Diagnostic{
                DiagnosticKind::StartBeyondDocument, start_page, name,
                name + " starts at page " + std::to_string(start_page) +
                    " beyond the document's " + std::to_string(total_pages) + " pages"});
            continue;
        }

        if (end_page > total_pages) {
            resolution.diagnostics.push_back(Diagnostic{
                DiagnosticKind::EndClamped, start_page, name,
                name + " end page " + std::to_string(end_page) + " clamped to " +
                    std::to_string(total_pages)});
            end_page = total_pages;
        }

        if (start_page > end_page) {
            const std::string next_name = display_title(chapters[i + 1]);
            resolution.diagnostics.push_back(Diagnostic{
                DiagnosticKind::OutOfOrderChapter, start_page, name,
                name + " (page " + std::to_string(start_page) + ") is not followed by a later chapter: " +
                    next_name + " starts at page " + std::to_string(chapters[i + 1].page)});
            continue;
        }

        resolution.ranges.push_back(ChapterRange{chapter, start_page, end_page});
    }

    return resolution;
}

} // namespace toc_outline
