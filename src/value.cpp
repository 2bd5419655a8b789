#include "corvo/value.hpp"
#include "corvo/error.hpp"

#include <fmt/format.h>

#include <cmath>

namespace corvo {

const char* kind_name(const Value& v) {
    switch (v.index()) {
        case 0: return "none";
        case 1: return "number";
        case 2: return "string";
        case 3: return "list";
        case 4: return "table";
        default: return "value";
    }
}

std::string format_number(double d) {
    if (d == 0.0) return "0"; // also folds -0
    // whole numbers stay in plain digits up to 1e21
    if (d == std::trunc(d) && std::fabs(d) < 1e21) return fmt::format("{:.0f}", d);
    return fmt::format("{}", d);
}

std::string to_display(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "none";
    if (const auto* d = std::get_if<double>(&v)) return format_number(*d);
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* l = std::get_if<ListPtr>(&v)) {
        std::string out = "[";
        const auto& items = (*l)->items;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += to_display(items[i]);
        }
        out += "]";
        return out;
    }
    throw TypeMismatchError("A table cannot be displayed directly; use get column, get row or a cell");
}

static Value copy_nested(const Value& v, int depth) {
    if (const auto* l = std::get_if<ListPtr>(&v)) {
        if (depth >= kMaxListNesting) {
            throw InvalidArgumentError(
                fmt::format("Lists cannot be nested more than {} levels deep", kMaxListNesting));
        }
        std::vector<Value> items;
        items.reserve((*l)->items.size());
        for (const auto& item : (*l)->items) items.push_back(copy_nested(item, depth + 1));
        return make_list(std::move(items));
    }
    if (const auto* t = std::get_if<TablePtr>(&v)) return make_table((*t)->rows);
    return v;
}

Value deep_copy(const Value& v) {
    return copy_nested(v, 0);
}

bool values_equal(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (const auto* x = std::get_if<double>(&a)) return *x == std::get<double>(b);
    if (const auto* x = std::get_if<std::string>(&a)) return *x == std::get<std::string>(b);
    if (const auto* x = std::get_if<ListPtr>(&a)) {
        const auto& l = (*x)->items;
        const auto& r = std::get<ListPtr>(b)->items;
        if (l.size() != r.size()) return false;
        for (std::size_t i = 0; i < l.size(); ++i) {
            if (!values_equal(l[i], r[i])) return false;
        }
        return true;
    }
    const auto& l = std::get<TablePtr>(a);
    const auto& r = std::get<TablePtr>(b);
    return l == r || l->rows == r->rows;
}

} // namespace corvo
