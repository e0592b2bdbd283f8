#include "text_utils.h"
#include <algorithm>
#include <charconv>

namespace toc_outline::text {

namespace {

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && is_space(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string collapse_whitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += static_cast<char>(c);
    }
    return result;
}

std::vector<std::string> split_code_points(const std::string& s) {
    std::vector<std::string> points;
    for (size_t i = 0; i < s.size();) {
        unsigned char lead = static_cast<unsigned char>(s[i]);
        size_t width = 1;
        if ((lead & 0xE0) == 0xC0) {
            width = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            width = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            width = 4;
        }
        width = std::min(width, s.size() - i);
        points.push_back(s.substr(i, width));
        i += width;
    }
    return points;
}

std::string regex_escape(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string filler_run_pattern(const std::vector<std::string>& filler_chars, int min_run) {
    std::string alternation;
    for (const auto& ch : filler_chars) {
        if (!alternation.empty()) alternation += "|";
        alternation += regex_escape(ch);
    }
    return "(?:" + alternation + "){" + std::to_string(min_run) + ",}";
}

bool is_all_filler(const std::string& s, const std::vector<std::string>& filler_chars) {
    for (const auto& point : split_code_points(s)) {
        if (std::find(filler_chars.begin(), filler_chars.end(), point) == filler_chars.end()) {
            return false;
        }
    }
    return true;
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace toc_outline::text
