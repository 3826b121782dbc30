#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>

#include <string>
#include <vector>

namespace tabula::ops {

// ─── Vertical ─────────────────────────────────────────────────────────────────

/// Stack tables row-wise. Columns are the union of all names in order of
/// first appearance; a table lacking a column contributes NA cells. Column
/// types promote across tables. A single table is returned unchanged.
[[nodiscard]] auto vconcat(const std::vector<Table>& tables) -> Table;
[[nodiscard]] auto vconcat(const Table& top, const Table& bottom) -> Table;

// ─── Horizontal ───────────────────────────────────────────────────────────────

/// Place tables side by side, sharing column storage. Repeated names get
/// _1, _2, ... suffixes. Throws TableError(LengthMismatch) if row counts differ.
[[nodiscard]] auto hconcat(const std::vector<Table>& tables) -> Table;
[[nodiscard]] auto hconcat(const Table& left, const Table& right) -> Table;

/// Append one auto-named column.
[[nodiscard]] auto hconcat(const Table& left, const ColumnValue& column) -> Table;

/// Append one auto-named column holding `value` in every row.
[[nodiscard]] auto hconcat(const Table& left, const Value& value) -> Table;

/// Make names unique by suffixing repeats with _1, _2, ... (first occurrence
/// keeps its name; suffixes skip names already taken).
[[nodiscard]] auto make_unique_names(const std::vector<std::string>& names)
    -> std::vector<std::string>;

}  // namespace tabula::ops
