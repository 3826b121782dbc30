#pragma once

#include <tabula/core/config.hpp>
#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tabula::ops {

/// One row given as field name -> value.
using Record = std::map<std::string, Value>;

/// Build a table from records. Columns are the sorted union of all record
/// keys; each column's type is the promotion of its non-NA values (Dynamic
/// when there are none). Missing fields become NA.
[[nodiscard]] auto from_records(const std::vector<Record>& records, TableConfig config = {})
    -> Table;

/// As above with an explicit column list and order; fields outside `keys`
/// are ignored.
[[nodiscard]] auto from_records(const std::vector<Record>& records,
                                const std::vector<std::string>& keys, TableConfig config = {})
    -> Table;

/// One record per row.
[[nodiscard]] auto to_records(const Table& table) -> std::vector<Record>;

/// Column name -> column handle, or -> cell value for a flattened one-row table.
using ColumnMap = std::map<std::string, std::variant<ColumnPtr, Value>>;

/// Name -> column map sharing the table's column handles. With `flatten` set
/// and exactly one row, each name maps to that row's value instead.
[[nodiscard]] auto to_dict(const Table& table, bool flatten = false) -> ColumnMap;

/// Row-major cell matrix: result[row][column].
[[nodiscard]] auto to_matrix(const Table& table) -> std::vector<std::vector<Value>>;

}  // namespace tabula::ops
