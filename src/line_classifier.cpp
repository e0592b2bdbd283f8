#include "toc_outline/line_classifier.h"
#include "text_utils.h"

namespace toc_outline {

namespace {

// A title captured in front of a leader may still carry single spaces or a stray dot.
std::string clean_title(const std::string& raw, const std::vector<std::string>& filler_chars) {
    std::string title = text::trim(raw);
    if (text::is_all_filler(title, filler_chars)) {
        return std::string();
    }
    return title;
}

} // namespace

LineClassifier::LineClassifier(const OutlineOptions& options) : options_(options) {
    validate_options(options_);

    const std::string filler = text::filler_run_pattern(options_.filler_chars,
                                                        options_.min_filler_run);

    // "제1장" and nothing else on the line
    chapter_marker_ = std::regex("^" + text::regex_escape(options_.chapter_prefix) +
                                 "\\s*(\\d+)\\s*" +
                                 text::regex_escape(options_.chapter_suffix) + "$");
    // "적용기준 ········· 3"
    chapter_title_ = std::regex("^(.+?)" + filler + "(\\d+)$");
    // "1-1 일반사항 ········· 3", title optional
    item_ = std::regex("^(\\d+(?:-\\d+)+)(.*?)" + filler + "(\\d+)$");
    // "참 고 자 료 ········· 901", must not open with a numeral
    other_ = std::regex("^(?!\\d)(.+?)" + filler + "(\\d+)$");
}

bool LineClassifier::match_chapter_marker(const std::string& text, std::string& number) const {
    const std::string line = text::trim(text);
    std::smatch match;
    if (!std::regex_match(line, match, chapter_marker_)) {
        return false;
    }
    number = match[1].str();
    return true;
}

std::optional<TitledEntry> LineClassifier::match_chapter_title(const std::string& text) const {
    const std::string line = text::trim(text);
    std::smatch match;
    if (!std::regex_match(line, match, chapter_title_)) {
        return std::nullopt;
    }

    TitledEntry entry;
    entry.title = clean_title(match[1].str(), options_.filler_chars);
    if (entry.title.empty() || !text::parse_int(match[2].str(), entry.page)) {
        return std::nullopt;
    }
    return entry;
}

LineClassification LineClassifier::match_item(const std::string& text) const {
    LineClassification result;
    std::smatch match;
    if (!std::regex_match(text, match, item_)) {
        return result;
    }

    int page = 0;
    if (!text::parse_int(match[3].str(), page)) {
        return result;
    }

    result.kind = LineKind::Item;
    result.number = match[1].str();
    result.title = clean_title(match[2].str(), options_.filler_chars);
    result.target_page = page;
    return result;
}

LineClassification LineClassifier::match_other(const std::string& text) const {
    LineClassification result;
    std::smatch match;
    if (!std::regex_match(text, match, other_)) {
        return result;
    }

    int page = 0;
    std::string title = clean_title(match[1].str(), options_.filler_chars);
    if (title.empty() || !text::parse_int(match[2].str(), page)) {
        return result;
    }

    result.kind = LineKind::Other;
    result.title = std::move(title);
    result.target_page = page;
    return result;
}

LineClassification LineClassifier::classify(const std::string& text,
                                            const std::optional<std::string>& next_text) const {
    const std::string line = text::trim(text);
    if (line.empty() || line.size() > options_.max_line_length) {
        return LineClassification{};
    }

    std::string number;
    if (match_chapter_marker(line, number)) {
        LineClassification result;
        result.kind = LineKind::Chapter;
        result.number = number;
        if (next_text && next_text->size() <= options_.max_line_length) {
            if (auto entry = match_chapter_title(*next_text)) {
                result.title = entry->title;
                result.target_page = entry->page;
                result.consumes_next = true;
            }
        }
        return result;
    }

    auto item = match_item(line);
    if (item) {
        return item;
    }

    return match_other(line);
}

LineClassification classify_line(const std::string& text,
                                 const std::optional<std::string>& next_text) {
    static const LineClassifier classifier;
    return classifier.classify(text, next_text);
}

} // namespace toc_outline
