#pragma once

#include <toc_outline/chapter_range_resolver.h>
#include <toc_outline/division_classifier.h>
#include <toc_outline/outline_types.h>
#include <optional>
#include <string>
#include <vector>

namespace toc_outline {

struct PlannedChapter {
    std::optional<Division> division;   // unset for chapters missing from the table
    ChapterRange range;
    std::string file_stem;
};

// What the external splitter needs: division spans plus one page range per chapter.
struct SplitPlan {
    int total_pages = 0;
    DivisionReport divisions;
    std::vector<PlannedChapter> chapters;
    std::vector<Diagnostic> diagnostics;   // division and range diagnostics, in that order
};

// "제6장 관부설 및 접합공사" -> "제6장_관부설_및_접합공사"
std::string safe_file_stem(const std::string& title);

SplitPlan build_split_plan(const PageForest& forest,
                           int total_pages,
                           const DivisionClassifier& classifier = DivisionClassifier());

} // namespace toc_outline
