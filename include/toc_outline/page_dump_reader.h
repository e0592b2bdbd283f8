#pragma once

#include <toc_outline/outline_options.h>
#include <toc_outline/outline_types.h>
#include <istream>
#include <string>
#include <vector>

namespace toc_outline {

// Reads the page extractor's text dump:
//
//   === 3페이지 ===
//   1줄: 목  차
//   2줄: 3
//   5줄: 제1장
//   ----
//
// Only numbered lines inside a page block become Lines; separators, blank lines and
// report text around the blocks are skipped.
std::vector<Line> read_page_dump(std::istream& input, const DumpFormat& format = DumpFormat{});

// Throws std::runtime_error when the file cannot be opened.
std::vector<Line> read_page_dump_file(const std::string& path,
                                      const DumpFormat& format = DumpFormat{});

// Highest page number present, 0 for an empty dump.
int last_page(const std::vector<Line>& lines);

} // namespace toc_outline
