#include "toc_outline/page_dump_reader.h"
#include "text_utils.h"
#include <algorithm>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace toc_outline {

std::vector<Line> read_page_dump(std::istream& input, const DumpFormat& format) {
    const std::regex page_marker("^=== (\\d+)" + text::regex_escape(format.page_marker_suffix) +
                                 " ===$");
    const std::regex line_marker("^(\\d+)" + text::regex_escape(format.line_marker_suffix) +
                                 ": ?(.*)$");

    std::vector<Line> lines;
    int current_page = 0;
    std::string raw;

    while (std::getline(input, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }

        std::smatch match;
        const std::string stripped = text::trim(raw);
        if (std::regex_match(stripped, match, page_marker)) {
            int page = 0;
            current_page = text::parse_int(match[1].str(), page) ? page : 0;
            continue;
        }
        if (current_page == 0) {
            continue;
        }
        if (std::regex_match(raw, match, line_marker)) {
            Line line;
            line.page = current_page;
            if (!text::parse_int(match[1].str(), line.line_number)) {
                continue;
            }
            line.text = match[2].str();
            lines.push_back(std::move(line));
        }
    }

    return lines;
}

std::vector<Line> read_page_dump_file(const std::string& path, const DumpFormat& format) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Dump file not found: " + path);
    }
    return read_page_dump(file, format);
}

int last_page(const std::vector<Line>& lines) {
    int last = 0;
    for (const auto& line : lines) {
        last = std::max(last, line.page);
    }
    return last;
}

} // namespace toc_outline
