#include "toc_outline/toc_page_detector.h"
#include "text_utils.h"

namespace toc_outline {

TocPageDetector::TocPageDetector(const OutlineOptions& options)
    : max_line_length_(options.max_line_length) {
    validate_options(options);

    // "목차" becomes "목\s*차" so any spacing the typesetter used still matches
    std::string pattern = "^\\s*";
    const auto points = text::split_code_points(options.contents_marker);
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) pattern += "\\s*";
        pattern += text::regex_escape(points[i]);
    }
    pattern += "\\s*$";

    heading_ = std::regex(pattern);
    bare_number_ = std::regex("^\\s*(\\d+)\\s*$");
}

bool TocPageDetector::is_contents_heading(const std::string& text) const {
    if (text.size() > max_line_length_) {
        return false;
    }
    return std::regex_match(text, heading_);
}

bool TocPageDetector::match_bare_number(const std::string& text, int& number) const {
    std::smatch match;
    if (text.size() > max_line_length_ || !std::regex_match(text, match, bare_number_)) {
        return false;
    }
    return text::parse_int(match[1].str(), number);
}

std::set<int> TocPageDetector::detect(const std::vector<Line>& lines) const {
    require_page_order(lines);

    std::set<int> toc_pages;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        const Line& line = lines[i];
        const Line& next = lines[i + 1];
        if (line.page != next.page) {
            continue;
        }

        int number = 0;
        if (is_contents_heading(line.text) && match_bare_number(next.text, number)) {
            toc_pages.insert(number);
        } else if (match_bare_number(line.text, number) && is_contents_heading(next.text)) {
            toc_pages.insert(number);
        }
    }
    return toc_pages;
}

std::set<int> detect_toc_pages(const std::vector<Line>& lines) {
    static const TocPageDetector detector;
    return detector.detect(lines);
}

void require_page_order(const std::vector<Line>& lines) {
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].page < lines[i - 1].page) {
            throw ContractError("lines are not page-ordered: page " +
                                std::to_string(lines[i].page) + " follows page " +
                                std::to_string(lines[i - 1].page));
        }
    }
}

} // namespace toc_outline
