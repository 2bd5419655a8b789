#include "corvo/csv.hpp"
#include "corvo/error.hpp"
#include "corvo/io.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace corvo {

static std::vector<std::string> split_row(std::string_view line) {
    std::vector<std::string> cells;
    std::size_t start = 0;
    for (;;) {
        std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            cells.emplace_back(line.substr(start));
            break;
        }
        cells.emplace_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return cells;
}

Table parse_csv(std::string_view text) {
    Table t;
    std::size_t pos = 0;
    int line_no = 0;
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = nl == std::string_view::npos ? text.size() : nl + 1;
        ++line_no;

        // An empty line is a row with one empty cell; the text after the
        // final '\n' is not a line at all.
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        auto cells = split_row(line);
        if (!t.rows.empty() && cells.size() != t.column_count()) {
            throw MalformedCsvError(fmt::format("Line {} has {} columns but the first row has {}",
                                                line_no, cells.size(), t.column_count()));
        }
        t.rows.push_back(std::move(cells));
    }
    return t;
}

std::string format_csv(const Table& table) {
    std::string out;
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (row[c].find_first_of(",\r\n") != std::string::npos) {
                throw InvalidArgumentError(fmt::format(
                    "Cell at row {}, column {} contains a comma or line break and cannot be written as CSV",
                    r + 1, c + 1));
            }
            if (c) out += ',';
            out += row[c];
        }
        out += '\n';
    }
    return out;
}

Table read_csv_file(const std::string& path) {
    Table t = parse_csv(read_text_file(path));
    spdlog::debug("loaded csv '{}' ({} rows x {} columns)", path, t.row_count(), t.column_count());
    return t;
}

void write_csv_file(const Table& table, const std::string& path) {
    // A rejected cell must leave the target file untouched.
    std::string text = format_csv(table);
    write_text_file(path, text);
}

} // namespace corvo
