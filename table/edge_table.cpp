#include "edge_table.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <string>
#include <type_traits>

namespace edgearc {

const char* column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::Number: return "numeric";
        case ColumnType::Logical: return "logical";
        case ColumnType::Text: return "text";
    }
    return "unknown";
}

ColumnType Column::type() const {
    switch (data.index()) {
        case 0: return ColumnType::Number;
        case 1: return ColumnType::Logical;
        default: return ColumnType::Text;
    }
}

size_t Column::size() const {
    return std::visit([](const auto& values) { return values.size(); }, data);
}

bool EdgeTable::has_column(const std::string& name) const {
    return std::any_of(columns_.begin(), columns_.end(),
                       [&](const Column& c) { return c.name == name; });
}

const Column& EdgeTable::column(const std::string& name) const {
    for (const auto& c : columns_) {
        if (c.name == name) {
            return c;
        }
    }
    throw InputValidationError("missing required column '" + name + "'");
}

std::vector<std::string> EdgeTable::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) {
        names.push_back(c.name);
    }
    return names;
}

void EdgeTable::add_column(const std::string& name, ColumnData data) {
    Column col{name, std::move(data)};

    auto existing = std::find_if(columns_.begin(), columns_.end(),
                                 [&](const Column& c) { return c.name == name; });
    bool replaces_only = existing != columns_.end() && columns_.size() == 1;

    if (columns_.empty() || replaces_only) {
        rows_ = col.size();
    } else if (col.size() != rows_) {
        throw InputValidationError("column '" + name + "' has " + std::to_string(col.size()) +
                                   " rows, table has " + std::to_string(rows_));
    }

    if (existing != columns_.end()) {
        *existing = std::move(col);
    } else {
        columns_.push_back(std::move(col));
    }
}

void EdgeTable::remove_column(const std::string& name) {
    columns_.erase(std::remove_if(columns_.begin(), columns_.end(),
                                  [&](const Column& c) { return c.name == name; }),
                   columns_.end());
    if (columns_.empty()) {
        rows_ = 0;
    }
}

namespace {

template <typename T>
const std::vector<T>& typed_values(const Column& col, ColumnType expected) {
    if (col.type() != expected) {
        throw InputValidationError("column '" + col.name + "' must be " +
                                   column_type_name(expected) + ", found " +
                                   column_type_name(col.type()));
    }
    return std::get<std::vector<T>>(col.data);
}

}  // namespace

const std::vector<double>& EdgeTable::numbers(const std::string& name) const {
    return typed_values<double>(column(name), ColumnType::Number);
}

const std::vector<bool>& EdgeTable::logicals(const std::string& name) const {
    return typed_values<bool>(column(name), ColumnType::Logical);
}

const std::vector<std::string>& EdgeTable::texts(const std::string& name) const {
    return typed_values<std::string>(column(name), ColumnType::Text);
}

ColumnData select_column_rows(const ColumnData& data, const std::vector<size_t>& rows) {
    return std::visit([&](const auto& values) -> ColumnData {
        std::decay_t<decltype(values)> picked;
        picked.reserve(rows.size());
        for (size_t r : rows) {
            picked.push_back(values.at(r));
        }
        return picked;
    }, data);
}

EdgeTable EdgeTable::select_rows(const std::vector<size_t>& rows) const {
    EdgeTable result;
    for (const auto& c : columns_) {
        result.columns_.push_back(Column{c.name, select_column_rows(c.data, rows)});
    }
    result.rows_ = columns_.empty() ? 0 : rows.size();
    return result;
}

EdgeTable EdgeTable::without_columns(const std::vector<std::string>& names) const {
    EdgeTable result;
    for (const auto& c : columns_) {
        if (std::find(names.begin(), names.end(), c.name) == names.end()) {
            result.columns_.push_back(c);
        }
    }
    result.rows_ = result.columns_.empty() ? 0 : rows_;
    return result;
}

}  // namespace edgearc
