#include "toc_outline/outline_tree_builder.h"
#include "toc_outline/thread_pool.h"
#include "toc_outline/toc_page_detector.h"
#include <algorithm>
#include <iostream>
#include <utility>

namespace toc_outline {

namespace {

// Open nodes always form one chain from a root downwards, so the stack is kept as the
// index path into the page's roots. Indices stay valid when vectors reallocate.
class OpenStack {
public:
    bool empty() const { return path_.empty(); }
    int top_level() const { return levels_.back(); }

    void clear() {
        path_.clear();
        levels_.clear();
    }

    void pop() {
        path_.pop_back();
        levels_.pop_back();
    }

    void push(size_t index, int level) {
        path_.push_back(index);
        levels_.push_back(level);
    }

    OutlineNode& top(std::vector<OutlineNode>& roots) const {
        OutlineNode* node = &roots[path_.front()];
        for (size_t i = 1; i < path_.size(); ++i) {
            node = &node->children[path_[i]];
        }
        return *node;
    }

private:
    std::vector<size_t> path_;
    std::vector<int> levels_;
};

bool has_item_numbered(const std::vector<OutlineNode>& nodes, const std::string& number) {
    return std::any_of(nodes.begin(), nodes.end(), [&number](const OutlineNode& node) {
        return node.kind == NodeKind::Item && node.number == number;
    });
}

struct PageBlock {
    int page = 0;
    std::vector<Line> lines;
};

struct PageBuild {
    std::vector<OutlineNode> roots;
    std::vector<Diagnostic> diagnostics;
};

std::vector<PageBlock> collect_toc_blocks(const std::set<int>& toc_pages,
                                          const std::vector<Line>& lines) {
    std::vector<PageBlock> blocks;
    for (const auto& line : lines) {
        if (toc_pages.count(line.page) == 0) {
            continue;
        }
        if (blocks.empty() || blocks.back().page != line.page) {
            blocks.push_back(PageBlock{line.page, {}});
        }
        blocks.back().lines.push_back(line);
    }
    return blocks;
}

} // namespace

OutlineTreeBuilder::OutlineTreeBuilder(const OutlineOptions& options)
    : options_(options), classifier_(options) {
}

std::vector<OutlineNode> OutlineTreeBuilder::build_page(int page,
                                                        const std::vector<Line>& page_lines,
                                                        std::vector<Diagnostic>& diagnostics) const {
    std::vector<OutlineNode> roots;
    OpenStack stack;

    size_t i = 0;
    while (i < page_lines.size()) {
        std::optional<std::string> next_text;
        if (i + 1 < page_lines.size()) {
            next_text = page_lines[i + 1].text;
        }

        const auto classified = classifier_.classify(page_lines[i].text, next_text);

        switch (classified.kind) {
            case LineKind::Chapter: {
                // An untitled marker still opens a chapter, pointing at its own page
                int target = classified.target_page.value_or(page);
                stack.clear();
                roots.push_back(OutlineNode::chapter(classified.number, classified.title, target));
                stack.push(roots.size() - 1, 0);
                break;
            }
            case LineKind::Item: {
                OutlineNode node = OutlineNode::item(classified.number, classified.title,
                                                     classified.target_page.value_or(page));
                const int level = node.level;
                while (!stack.empty() && stack.top_level() >= level) {
                    stack.pop();
                }

                if (stack.empty()) {
                    if (has_item_numbered(roots, node.number)) {
                        diagnostics.push_back(Diagnostic{
                            DiagnosticKind::DuplicateSibling, page, node.number,
                            "item " + node.number + " appears twice at the top of page " +
                                std::to_string(page)});
                    }
                    roots.push_back(std::move(node));
                    stack.push(roots.size() - 1, level);
                    break;
                }

                OutlineNode& parent = stack.top(roots);
                if (has_item_numbered(parent.children, node.number)) {
                    diagnostics.push_back(Diagnostic{
                        DiagnosticKind::DuplicateSibling, page, node.number,
                        "item " + node.number + " appears twice under " + display_title(parent)});
                }
                parent.children.push_back(std::move(node));
                stack.push(parent.children.size() - 1, level);
                break;
            }
            case LineKind::Other:
                roots.push_back(OutlineNode::other(classified.title,
                                                   classified.target_page.value_or(page)));
                break;
            case LineKind::None:
                break;
        }

        i += classified.consumes_next ? 2 : 1;
    }

    return roots;
}

PageForest OutlineTreeBuilder::build(const std::set<int>& toc_pages,
                                     const std::vector<Line>& lines,
                                     std::vector<Diagnostic>* diagnostics) const {
    require_page_order(lines);

    auto blocks = collect_toc_blocks(toc_pages, lines);
    if (options_.verbose) {
        std::cout << "[OutlineTreeBuilder::build] " << blocks.size() << " TOC pages, "
                  << options_.thread_count << " thread(s)" << std::endl;
    }

    std::vector<PageBuild> builds(blocks.size());

    if (options_.thread_count > 1 && blocks.size() > 1) {
        size_t workers = std::min(static_cast<size_t>(options_.thread_count), blocks.size());
        ThreadPool pool(workers);
        if (options_.verbose) {
            std::cout << "[OutlineTreeBuilder::build] " << pool.worker_count()
                      << " workers" << std::endl;
        }

        std::vector<std::future<PageBuild>> futures;
        futures.reserve(blocks.size());
        for (const auto& block : blocks) {
            futures.push_back(pool.enqueue([this, &block]() {
                PageBuild result;
                result.roots = build_page(block.page, block.lines, result.diagnostics);
                return result;
            }));
        }
        // Collected in page order so the result does not depend on scheduling
        for (size_t i = 0; i < futures.size(); ++i) {
            builds[i] = futures[i].get();
        }
    } else {
        for (size_t i = 0; i < blocks.size(); ++i) {
            builds[i].roots = build_page(blocks[i].page, blocks[i].lines, builds[i].diagnostics);
        }
    }

    PageForest forest;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (diagnostics) {
            diagnostics->insert(diagnostics->end(),
                                builds[i].diagnostics.begin(), builds[i].diagnostics.end());
        }
        if (!builds[i].roots.empty()) {
            forest[blocks[i].page] = std::move(builds[i].roots);
        }
    }
    return forest;
}

PageForest build_page_forest(const std::set<int>& toc_pages, const std::vector<Line>& lines) {
    static const OutlineTreeBuilder builder;
    return builder.build(toc_pages, lines);
}

} // namespace toc_outline
