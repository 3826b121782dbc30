#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/selector.hpp>
#include <tabula/core/table.hpp>

#include <cstddef>
#include <vector>

namespace tabula {

/// Read dispatch over the six addressing shapes:
///   SingleColumn -> ColumnPtr (the slot's handle)
///   MultiColumn  -> Table sharing the selected columns
///   SingleCell   -> Value
///   RowSlice     -> one-row Table
///   ColumnSlice  -> gathered ColumnValue
///   Block        -> Table
[[nodiscard]] auto read(const Table& table, const Selector& selector) -> Result<Selection>;

/// Write dispatch over the six addressing shapes.
///
/// Column-only targets replace, append or (with Erase) delete whole columns and
/// may grow an empty table. Row-qualified targets write cells in place; a cell
/// that cannot hold the assigned value becomes NA. A single-cell write into a
/// table of at most one row replaces the column with a length-1 column.
[[nodiscard]] auto write(Table& table, const Selector& selector, const Assignment& value)
    -> Result<void>;

/// Write one row of existing columns in place, whatever the table's row count.
/// Never adds, replaces or retypes a column: absent targets fail with
/// NonExistentTarget. The value is distributed as for a row-slice write.
[[nodiscard]] auto write_row_in_place(Table& table, std::size_t row,
                                      const std::vector<ColumnKey>& keys,
                                      const Assignment& value) -> Result<void>;

}  // namespace tabula
