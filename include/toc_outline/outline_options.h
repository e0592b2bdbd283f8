#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace toc_outline {

// Typography of the table of contents being parsed.
struct OutlineOptions {
    std::string contents_marker = "목차";   // matched with any spacing between characters
    std::string chapter_prefix = "제";
    std::string chapter_suffix = "장";
    std::vector<std::string> filler_chars = {".", "·", " "};
    int min_filler_run = 3;                  // shorter runs are ordinary punctuation
    size_t max_line_length = 1024;           // longer lines are extraction noise
    int thread_count = 1;                    // > 1 builds TOC pages in parallel
    bool verbose = false;
};

// Markers written by the page extractor around each page and line.
struct DumpFormat {
    std::string page_marker_suffix = "페이지";   // "=== 12페이지 ==="
    std::string line_marker_suffix = "줄";       // "5줄: text"
};

// Throws ContractError when the options cannot describe a usable layout.
void validate_options(const OutlineOptions& options);

} // namespace toc_outline
