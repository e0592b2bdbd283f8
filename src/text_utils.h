#pragma once

#include <string>
#include <vector>

// Byte-level UTF-8 helpers shared by the matchers. All patterns are compiled against the
// raw UTF-8 bytes, so multi-byte characters are handled as literal byte sequences.
namespace toc_outline::text {

std::string trim(const std::string& s);

// Runs of ASCII whitespace collapse to one space; leading/trailing whitespace is dropped.
std::string collapse_whitespace(const std::string& s);

// Splits a UTF-8 string into one string per code point.
std::vector<std::string> split_code_points(const std::string& s);

std::string regex_escape(const std::string& s);

// "(?:\.|·| ){3,}" for the default filler set.
std::string filler_run_pattern(const std::vector<std::string>& filler_chars, int min_run);

// True when every code point of s is one of the filler characters.
bool is_all_filler(const std::string& s, const std::vector<std::string>& filler_chars);

// Parses a decimal page number without throwing; false on overflow or stray characters.
bool parse_int(const std::string& s, int& out);

} // namespace toc_outline::text
