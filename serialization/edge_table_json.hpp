#ifndef EDGEARC_SERIALIZATION_EDGE_TABLE_JSON_HPP
#define EDGEARC_SERIALIZATION_EDGE_TABLE_JSON_HPP

#include <nlohmann/json.hpp>
#include <table/edge_table.hpp>
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace edgearc {

namespace detail {

// Build a typed column from JSON cells. A null pointer is a missing cell.
inline ColumnData column_from_cells(const std::string& name,
                                    const std::vector<const nlohmann::json*>& cells) {
    bool any_number = false, any_bool = false, any_string = false;
    for (const auto* cell : cells) {
        if (cell == nullptr || cell->is_null()) continue;
        if (cell->is_number()) any_number = true;
        else if (cell->is_boolean()) any_bool = true;
        else if (cell->is_string()) any_string = true;
        else throw InputValidationError("column '" + name + "' holds a non-scalar value");
    }

    if (int(any_number) + int(any_bool) + int(any_string) > 1) {
        throw InputValidationError("column '" + name + "' mixes value types");
    }

    if (any_bool || any_string) {
        for (const auto* cell : cells) {
            if (cell == nullptr || cell->is_null()) {
                throw InputValidationError("column '" + name + "' has missing values");
            }
        }
    }

    if (any_bool) {
        std::vector<bool> values;
        values.reserve(cells.size());
        for (const auto* cell : cells) values.push_back(cell->get<bool>());
        return values;
    }
    if (any_string) {
        std::vector<std::string> values;
        values.reserve(cells.size());
        for (const auto* cell : cells) values.push_back(cell->get<std::string>());
        return values;
    }

    std::vector<double> values;
    values.reserve(cells.size());
    for (const auto* cell : cells) {
        if (cell == nullptr || cell->is_null()) {
            values.push_back(std::numeric_limits<double>::quiet_NaN());
        } else {
            values.push_back(cell->get<double>());
        }
    }
    return values;
}

inline nlohmann::json cell_to_json(const Column& column, size_t row) {
    switch (column.type()) {
        case ColumnType::Number: {
            double v = std::get<std::vector<double>>(column.data)[row];
            if (std::isnan(v)) {
                return nullptr;
            }
            return v;
        }
        case ColumnType::Logical:
            return static_cast<bool>(std::get<std::vector<bool>>(column.data)[row]);
        case ColumnType::Text:
            return std::get<std::vector<std::string>>(column.data)[row];
    }
    return nullptr;
}

}  // namespace detail

// Read a table from either an array of row objects or an object of
// equal-length column arrays. Columns are created in key order.
inline EdgeTable edge_table_from_json(const nlohmann::json& j) {
    EdgeTable table;

    if (j.is_array()) {
        std::vector<std::string> names;
        for (const auto& row : j) {
            if (!row.is_object()) {
                throw InputValidationError("edge rows must be JSON objects");
            }
            for (const auto& [key, _] : row.items()) {
                if (std::find(names.begin(), names.end(), key) == names.end()) {
                    names.push_back(key);
                }
            }
        }

        for (const auto& name : names) {
            std::vector<const nlohmann::json*> cells;
            cells.reserve(j.size());
            for (const auto& row : j) {
                auto it = row.find(name);
                cells.push_back(it == row.end() ? nullptr : &*it);
            }
            table.add_column(name, detail::column_from_cells(name, cells));
        }
        return table;
    }

    if (j.is_object()) {
        for (const auto& [name, values] : j.items()) {
            if (!values.is_array()) {
                throw InputValidationError("column '" + name + "' must be an array");
            }
            std::vector<const nlohmann::json*> cells;
            cells.reserve(values.size());
            for (const auto& v : values) {
                cells.push_back(&v);
            }
            table.add_column(name, detail::column_from_cells(name, cells));
        }
        return table;
    }

    throw InputValidationError("edge table must be a JSON array or object");
}

// Write a table as an array of row objects, NaN as null
inline nlohmann::json edge_table_to_json(const EdgeTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (size_t r = 0; r < table.row_count(); ++r) {
        nlohmann::json row = nlohmann::json::object();
        for (const auto& column : table.columns()) {
            row[column.name] = detail::cell_to_json(column, r);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace edgearc

#endif // EDGEARC_SERIALIZATION_EDGE_TABLE_JSON_HPP
