#pragma once
#include <string>
#include <string_view>

#include "corvo/value.hpp"

namespace corvo {

/// Split on newlines and commas. No quoting: a cell is exactly the text
/// between two commas. A trailing '\r' is dropped and a blank line is a row
/// with one empty cell, so a one-column table with empty cells reads back
/// unchanged. Throws MalformedCsvError when a row's width differs from the
/// first row's.
Table parse_csv(std::string_view text);

/// Comma-joined rows, each terminated by '\n'. A cell holding a comma or a
/// line break would not read back as one cell, so it throws
/// InvalidArgumentError instead.
std::string format_csv(const Table& table);

Table read_csv_file(const std::string& path);
void write_csv_file(const Table& table, const std::string& path);

} // namespace corvo
