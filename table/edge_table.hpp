#ifndef EDGEARC_TABLE_EDGE_TABLE_HPP
#define EDGEARC_TABLE_EDGE_TABLE_HPP

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace edgearc {

enum class ColumnType {
    Number,   // double, NaN marks a missing value
    Logical,
    Text
};

const char* column_type_name(ColumnType type);

using ColumnData = std::variant<
    std::vector<double>,
    std::vector<bool>,
    std::vector<std::string>
>;

struct Column {
    std::string name;
    ColumnData data;

    ColumnType type() const;
    size_t size() const;
};

// Columnar table of named, typed columns of equal length.
// Used both for the edge batch handed to the assembler and for the point
// table it produces.
class EdgeTable {
public:
    EdgeTable() = default;

    size_t row_count() const { return rows_; }
    size_t column_count() const { return columns_.size(); }
    bool empty() const { return rows_ == 0; }

    bool has_column(const std::string& name) const;

    // Throws InputValidationError for an unknown column
    const Column& column(const std::string& name) const;

    const std::vector<Column>& columns() const { return columns_; }
    std::vector<std::string> column_names() const;

    // Append a column, or replace one with the same name.
    // The first column fixes the row count; later columns must match it.
    void add_column(const std::string& name, ColumnData data);

    void remove_column(const std::string& name);

    // Typed access, throws InputValidationError on a type mismatch
    const std::vector<double>& numbers(const std::string& name) const;
    const std::vector<bool>& logicals(const std::string& name) const;
    const std::vector<std::string>& texts(const std::string& name) const;

    // New table holding the given rows, in the given order
    EdgeTable select_rows(const std::vector<size_t>& rows) const;

    // New table without the named columns (names not present are ignored)
    EdgeTable without_columns(const std::vector<std::string>& names) const;

private:
    std::vector<Column> columns_;
    size_t rows_ = 0;
};

// Copy the given rows of one column, in order
ColumnData select_column_rows(const ColumnData& data, const std::vector<size_t>& rows);

}  // namespace edgearc

#endif // EDGEARC_TABLE_EDGE_TABLE_HPP
