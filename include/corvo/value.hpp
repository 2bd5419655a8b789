#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace corvo {

struct List;
struct Table;

using ListPtr  = std::shared_ptr<List>;
using TablePtr = std::shared_ptr<Table>;

/// None | Number | String | List | Table. Lists and tables are shared by
/// reference, so in-place edits are visible through every name bound to them.
using Value = std::variant<std::monostate, double, std::string, ListPtr, TablePtr>;

struct List {
    std::vector<Value> items;

    List() = default;
    explicit List(std::vector<Value> values) : items(std::move(values)) {}
};

/// CSV data: every row holds the same number of cells.
struct Table {
    std::vector<std::vector<std::string>> rows;

    std::size_t row_count() const noexcept { return rows.size(); }
    std::size_t column_count() const noexcept { return rows.empty() ? 0 : rows.front().size(); }
};

inline Value make_list(std::vector<Value> items = {}) {
    return std::make_shared<List>(std::move(items));
}

inline Value make_table(std::vector<std::vector<std::string>> rows) {
    auto t = std::make_shared<Table>();
    t->rows = std::move(rows);
    return t;
}

/// "number", "string", ... for error messages.
const char* kind_name(const Value& v);

/// Canonical text: 5, 2.5, Alice, [1, 2, 3]. Throws TypeMismatchError for a
/// Table, which has no single-line rendering.
std::string to_display(const Value& v);

std::string format_number(double d);

/// Deepest list nesting deep_copy will produce.
constexpr int kMaxListNesting = 256;

/// Fresh copy of nested lists and tables; scalars are returned as-is.
/// Values placed inside a list are copied this way, so a list can never
/// contain itself. Throws InvalidArgumentError past kMaxListNesting.
Value deep_copy(const Value& v);

/// Structural equality (lists compare element-wise).
bool values_equal(const Value& a, const Value& b);

} // namespace corvo
