#include <benchmark/benchmark.h>
#include <toc_outline/line_classifier.h>
#include <toc_outline/outline_tree_builder.h>
#include <toc_outline/toc_outline.h>
#include <set>
#include <string>
#include <vector>

namespace {

const std::string kLeader = " ·······································";

// A contents section of `pages` TOC pages, each with a few chapters and nested items,
// followed by the same number of body pages.
std::vector<toc_outline::Line> make_lines(int pages) {
    std::vector<toc_outline::Line> lines;
    int chapter = 0;
    int target = 1;

    for (int page = 1; page <= pages; ++page) {
        int line_number = 0;
        auto add = [&](const std::string& text) {
            lines.push_back(toc_outline::Line{page, ++line_number, text});
        };

        add("목  차");
        add(std::to_string(page));
        for (int c = 0; c < 3; ++c) {
            ++chapter;
            add("제" + std::to_string(chapter) + "장");
            add("공사항목" + std::to_string(chapter) + kLeader + " " + std::to_string(target));
            for (int s = 1; s <= 4; ++s) {
                std::string section = std::to_string(chapter) + "-" + std::to_string(s);
                add(section + " 일반사항" + kLeader + " " + std::to_string(target));
                for (int i = 1; i <= 3; ++i) {
                    add(section + "-" + std::to_string(i) + " 세부항목" + kLeader + " " +
                        std::to_string(target++));
                }
            }
        }
        add("참 고 자 료" + kLeader + " " + std::to_string(target));
    }

    for (int page = pages + 1; page <= pages * 2; ++page) {
        lines.push_back(toc_outline::Line{page, 1, "본문 " + std::to_string(page)});
    }
    return lines;
}

} // namespace

static void BM_ClassifyLine(benchmark::State& state) {
    toc_outline::LineClassifier classifier;
    const std::string item = "1-1-2 세부항목" + kLeader + " 37";

    for (auto _ : state) {
        auto result = classifier.classify(item);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ClassifyLine);

static void BM_BuildForest(benchmark::State& state) {
    auto lines = make_lines(static_cast<int>(state.range(1)));
    std::set<int> toc_pages;
    for (int page = 1; page <= state.range(1); ++page) {
        toc_pages.insert(page);
    }

    toc_outline::OutlineOptions options;
    options.thread_count = static_cast<int>(state.range(0));
    toc_outline::OutlineTreeBuilder builder(options);

    for (auto _ : state) {
        auto forest = builder.build(toc_pages, lines);
        benchmark::DoNotOptimize(forest);
    }

    state.counters["pages"] = static_cast<double>(toc_pages.size());
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lines.size()));
}
BENCHMARK(BM_BuildForest)->Ranges({{1, 8}, {4, 64}});

static void BM_FullPipeline(benchmark::State& state) {
    auto lines = make_lines(static_cast<int>(state.range(0)));
    toc_outline::TocOutline outline;

    for (auto _ : state) {
        auto result = outline.parse(lines);
        auto plan = outline.plan(result.forest, state.range(0) * 2 * 40);
        benchmark::DoNotOptimize(plan);
    }

    auto stats = outline.get_stats();
    state.counters["nodes_built"] = stats["nodes_built"].get<double>();
}
BENCHMARK(BM_FullPipeline)->Range(4, 64);

BENCHMARK_MAIN();
