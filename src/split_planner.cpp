#include "toc_outline/split_planner.h"

namespace toc_outline {

std::string safe_file_stem(const std::string& title) {
    static const std::string forbidden = "<>:\"/\\|?*";
    static const std::string middle_dot = "·";

    std::string stem;
    stem.reserve(title.size());
    for (size_t i = 0; i < title.size(); ++i) {
        if (title.compare(i, middle_dot.size(), middle_dot) == 0) {
            i += middle_dot.size() - 1;
            continue;
        }
        char c = title[i];
        if (forbidden.find(c) != std::string::npos) {
            continue;
        }
        stem += (c == ' ') ? '_' : c;
    }
    return stem;
}

SplitPlan build_split_plan(const PageForest& forest,
                           int total_pages,
                           const DivisionClassifier& classifier) {
    const auto chapters = flatten_chapters(forest);

    SplitPlan plan;
    plan.total_pages = total_pages;
    plan.divisions = classifier.classify(chapters, total_pages);

    auto resolution = resolve_chapter_ranges(chapters, total_pages);

    plan.chapters.reserve(resolution.ranges.size());
    for (auto& range : resolution.ranges) {
        PlannedChapter planned;
        planned.division = classifier.lookup(range.chapter.title);
        planned.file_stem = safe_file_stem(display_title(range.chapter));
        planned.range = std::move(range);
        plan.chapters.push_back(std::move(planned));
    }

    plan.diagnostics = plan.divisions.diagnostics;
    plan.diagnostics.insert(plan.diagnostics.end(),
                            resolution.diagnostics.begin(), resolution.diagnostics.end());
    return plan;
}

} // namespace toc_outline
