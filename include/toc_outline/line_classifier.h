#pragma once

#include <toc_outline/outline_options.h>
#include <optional>
#include <regex>
#include <string>

namespace toc_outline {

enum class LineKind {
    None,      // noise: prose, headings without leaders, bare numbers
    Chapter,   // chapter marker, with its title taken from the next line when possible
    Item,      // dash-numbered entry "1-1-2 title ····· 7"
    Other      // unnumbered entry "참 고 자 료 ····· 901"
};

struct LineClassification {
    LineKind kind = LineKind::None;
    std::string number;
    std::string title;
    std::optional<int> target_page;   // unset for a chapter marker whose title line failed
    bool consumes_next = false;       // the next line was read as this chapter's title

    explicit operator bool() const { return kind != LineKind::None; }
};

// A "title ····· page" pair, as found on chapter title lines and unnumbered entries.
struct TitledEntry {
    std::string title;
    int page = 0;
};

class LineClassifier {
public:
    explicit LineClassifier(const OutlineOptions& options = OutlineOptions{});

    // Rules in precedence order: chapter marker (+ title lookahead), item, other.
    LineClassification classify(const std::string& text,
                                const std::optional<std::string>& next_text = std::nullopt) const;

    // Rule 1 alone. Writes the chapter number on success.
    bool match_chapter_marker(const std::string& text, std::string& number) const;

    // Rule 2 alone: the title line that follows a chapter marker.
    std::optional<TitledEntry> match_chapter_title(const std::string& text) const;

private:
    LineClassification match_item(const std::string& text) const;
    LineClassification match_other(const std::string& text) const;

    OutlineOptions options_;
    std::regex chapter_marker_;
    std::regex chapter_title_;
    std::regex item_;
    std::regex other_;
};

// Classification with the default typography.
LineClassification classify_line(const std::string& text,
                                 const std::optional<std::string>& next_text = std::nullopt);

} // namespace toc_outline
