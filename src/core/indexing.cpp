#include <tabula/core/indexing.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <type_traits>

namespace tabula {

namespace {

auto check_row(std::size_t row, std::size_t row_count) -> Result<void> {
    if (row >= row_count) {
        return make_error(ErrorKind::OutOfBounds,
                          fmt::format("row {} out of bounds for {} rows", row, row_count));
    }
    return {};
}

auto check_rows(const std::vector<std::size_t>& rows, std::size_t row_count) -> Result<void> {
    for (auto row : rows) {
        if (auto ok = check_row(row, row_count); !ok) {
            return ok;
        }
    }
    return {};
}

auto row_write_shape_error() -> std::unexpected<Error> {
    return make_error(ErrorKind::ShapeMismatch, "cannot erase a row-qualified selection");
}

// Row-range writes never insert columns.
auto resolve_existing(const Table& table, const std::vector<ColumnKey>& keys)
    -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> positions;
    positions.reserve(keys.size());
    for (const auto& key : keys) {
        auto pos = table.index().position(key);
        if (!pos) {
            return make_error(ErrorKind::NonExistentTarget,
                              fmt::format("column '{}' does not exist", key.to_string()));
        }
        positions.push_back(*pos);
    }
    return positions;
}

/// Table of the given columns (shared handles), optionally restricted to rows.
auto sub_table(const Table& table, const std::vector<std::size_t>& positions,
               const std::vector<std::size_t>* rows) -> Result<Table> {
    std::vector<ColumnPtr> columns;
    std::vector<std::string> names;
    columns.reserve(positions.size());
    names.reserve(positions.size());
    for (auto pos : positions) {
        const auto& handle = table.columns()[pos];
        if (rows != nullptr) {
            columns.push_back(std::make_shared<ColumnValue>(gather(*handle, *rows)));
        } else {
            columns.push_back(handle);
        }
        names.push_back(table.index().name(pos));
    }
    auto index = ColumnIndex::make(std::move(names));
    if (!index) {
        return std::unexpected(index.error());
    }
    return Table::make(std::move(columns), std::move(*index), table.config());
}

// Scalars become full columns: one row for a table without columns, the
// current row count otherwise.
auto scalar_column(const Table& table, const Value& value) -> ColumnPtr {
    std::size_t length = table.empty() ? 1 : table.row_count();
    return std::make_shared<ColumnValue>(
        make_filled_column(value, length, table.config().default_type));
}

auto insert_single_column(Table& table, const ColumnKey& key, ColumnPtr column) -> Result<void> {
    const std::size_t length = column_size(*column);
    const bool existing = table.has_column(key);
    const bool replaces_sole = existing && table.column_count() == 1;
    if (!table.empty() && length != table.row_count() && !replaces_sole) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("cannot assign {} values to column '{}' of a table with "
                                      "{} rows",
                                      length, key.to_string(), table.row_count()));
    }
    if (existing) {
        auto pos = table.index().position(key);
        if (!pos) {
            return std::unexpected(pos.error());
        }
        return table.replace_slot(*pos, std::move(column));
    }
    if (key.is_name()) {
        return table.append_slot(key.name(), std::move(column));
    }
    if (key.position() == table.column_count()) {
        auto name = table.index().next_name(table.config().name_prefix);
        spdlog::debug("appending column at position {} as '{}'", key.position(), name);
        return table.append_slot(std::move(name), std::move(column));
    }
    return make_error(ErrorKind::NonContiguousInsert,
                      fmt::format("cannot insert column at position {} into a table of {} "
                                  "columns",
                                  key.position(), table.column_count()));
}

auto insert_single_entry(Table& table, const Value& value, std::size_t row, const ColumnKey& key)
    -> Result<void> {
    if (table.row_count() <= 1) {
        spdlog::debug("cell write into a table of {} rows replaces column '{}'",
                      table.row_count(), key.to_string());
        return insert_single_column(
            table, key,
            std::make_shared<ColumnValue>(
                make_filled_column(value, 1, table.config().default_type)));
    }
    auto pos = table.index().position(key);
    if (!pos) {
        return std::unexpected(pos.error());
    }
    if (auto ok = check_row(row, table.row_count()); !ok) {
        return ok;
    }
    ColumnValue& column = *table.columns()[*pos];
    if (!set_value(column, row, value)) {
        std::visit([row](auto& col) { col.set_na(row); }, column);
        spdlog::debug("value does not fit column '{}' of type {}; row {} set to NA",
                      table.index().name(*pos), to_string(column_type(column)), row);
    }
    return {};
}

auto erase_columns(Table& table, std::vector<std::size_t> positions) -> Result<void> {
    std::sort(positions.begin(), positions.end(), std::greater<>());
    positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
    for (auto pos : positions) {
        spdlog::debug("deleting column '{}'", table.index().name(pos));
        if (auto ok = table.erase_slot(pos); !ok) {
            return ok;
        }
    }
    return {};
}

auto log_degraded(const Table& table, std::size_t pos, std::size_t degraded) -> void {
    if (degraded > 0) {
        spdlog::debug("{} value(s) did not fit column '{}' of type {} and were set to NA",
                      degraded, table.index().name(pos),
                      to_string(column_type(*table.columns()[pos])));
    }
}

// ─── Column-only writes ───────────────────────────────────────────────────────

auto write_column(Table& table, const ColumnKey& key, const Assignment& value) -> Result<void> {
    return std::visit(
        [&](const auto& v) -> Result<void> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Erase>) {
                auto pos = table.index().position(key);
                if (!pos) {
                    return std::unexpected(pos.error());
                }
                return erase_columns(table, {*pos});
            } else if constexpr (std::is_same_v<T, Value>) {
                return insert_single_column(table, key, scalar_column(table, v));
            } else if constexpr (std::is_same_v<T, ColumnValue>) {
                return insert_single_column(table, key, std::make_shared<ColumnValue>(v));
            } else {
                if (v.column_count() != 1) {
                    return make_error(ErrorKind::ShapeMismatch,
                                      fmt::format("cannot assign a table of {} columns to one "
                                                  "column",
                                                  v.column_count()));
                }
                return insert_single_column(table, key, v.columns().front());
            }
        },
        value);
}

auto write_columns(Table& table, const std::vector<ColumnKey>& keys, const Assignment& value)
    -> Result<void> {
    if (std::holds_alternative<Erase>(value)) {
        auto positions = table.index().resolve(keys);
        if (!positions) {
            return std::unexpected(positions.error());
        }
        return erase_columns(table, std::move(*positions));
    }
    if (const auto* v = std::get_if<Table>(&value)) {
        if (v->column_count() != keys.size()) {
            return make_error(ErrorKind::ShapeMismatch,
                              fmt::format("cannot assign a table of {} columns to {} columns",
                                          v->column_count(), keys.size()));
        }
        for (std::size_t j = 0; j < keys.size(); ++j) {
            if (auto ok = insert_single_column(table, keys[j], v->columns()[j]); !ok) {
                return ok;
            }
        }
        return {};
    }
    // Scalars and sequences: each target gets its own column.
    for (const auto& key : keys) {
        if (auto ok = write_column(table, key, value); !ok) {
            return ok;
        }
    }
    return {};
}

// ─── Row-qualified writes ─────────────────────────────────────────────────────

auto write_cell(Table& table, std::size_t row, const ColumnKey& key, const Assignment& value)
    -> Result<void> {
    return std::visit(
        [&](const auto& v) -> Result<void> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Erase>) {
                return row_write_shape_error();
            } else if constexpr (std::is_same_v<T, Value>) {
                return insert_single_entry(table, v, row, key);
            } else if constexpr (std::is_same_v<T, ColumnValue>) {
                if (column_size(v) != 1) {
                    return make_error(ErrorKind::ShapeMismatch,
                                      fmt::format("cannot assign {} values to a single cell",
                                                  column_size(v)));
                }
                return insert_single_entry(table, get_value(v, 0), row, key);
            } else {
                if (v.column_count() != 1 || v.row_count() != 1) {
                    return make_error(ErrorKind::ShapeMismatch,
                                      fmt::format("cannot assign a {}x{} table to a single cell",
                                                  v.row_count(), v.column_count()));
                }
                return insert_single_entry(table, get_value(*v.columns().front(), 0), row, key);
            }
        },
        value);
}

// One value per target, copied out first; a table source may share storage
// with the targets.
auto row_cells(const Table& table, const std::vector<ColumnKey>& keys, const Assignment& value)
    -> Result<std::vector<Value>> {
    if (std::holds_alternative<Erase>(value)) {
        return row_write_shape_error();
    }
    std::vector<Value> cells;
    cells.reserve(keys.size());
    if (const auto* v = std::get_if<Value>(&value)) {
        cells.assign(keys.size(), *v);
    } else if (const auto* v = std::get_if<ColumnValue>(&value)) {
        if (column_size(*v) != keys.size()) {
            return make_error(ErrorKind::LengthMismatch,
                              fmt::format("cannot assign {} values to {} columns",
                                          column_size(*v), keys.size()));
        }
        for (std::size_t j = 0; j < keys.size(); ++j) {
            cells.push_back(get_value(*v, j));
        }
    } else {
        const auto& source = std::get<Table>(value);
        if (source.column_count() != keys.size() || source.row_count() != 1) {
            return make_error(ErrorKind::ShapeMismatch,
                              fmt::format("cannot assign a {}x{} table to one row of {} columns",
                                          source.row_count(), source.column_count(),
                                          keys.size()));
        }
        if (auto positions = resolve_existing(table, keys); !positions) {
            return std::unexpected(positions.error());
        }
        for (const auto& col : source.columns()) {
            cells.push_back(get_value(*col, 0));
        }
    }
    return cells;
}

auto write_row(Table& table, std::size_t row, const std::vector<ColumnKey>& keys,
               const Assignment& value) -> Result<void> {
    auto cells = row_cells(table, keys, value);
    if (!cells) {
        return std::unexpected(cells.error());
    }
    for (std::size_t j = 0; j < keys.size(); ++j) {
        if (auto ok = insert_single_entry(table, (*cells)[j], row, keys[j]); !ok) {
            return ok;
        }
    }
    return {};
}

auto write_range(Table& table, const std::vector<std::size_t>& rows,
                 const std::vector<ColumnKey>& keys, const Assignment& value) -> Result<void> {
    if (std::holds_alternative<Erase>(value)) {
        return row_write_shape_error();
    }
    auto positions = resolve_existing(table, keys);
    if (!positions) {
        return std::unexpected(positions.error());
    }
    if (auto ok = check_rows(rows, table.row_count()); !ok) {
        return ok;
    }
    if (const auto* v = std::get_if<Value>(&value)) {
        for (auto pos : *positions) {
            log_degraded(table, pos, fill(*table.columns()[pos], rows, *v));
        }
        return {};
    }
    if (const auto* v = std::get_if<ColumnValue>(&value)) {
        if (column_size(*v) != rows.size()) {
            return make_error(ErrorKind::LengthMismatch,
                              fmt::format("cannot assign {} values to {} rows", column_size(*v),
                                          rows.size()));
        }
        for (auto pos : *positions) {
            auto degraded = scatter(*table.columns()[pos], rows, *v);
            if (!degraded) {
                return std::unexpected(degraded.error());
            }
            log_degraded(table, pos, *degraded);
        }
        return {};
    }
    const auto& source = std::get<Table>(value);
    if (source.column_count() != positions->size()) {
        return make_error(ErrorKind::ShapeMismatch,
                          fmt::format("cannot assign a table of {} columns to {} columns",
                                      source.column_count(), positions->size()));
    }
    if (source.row_count() != rows.size()) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("cannot assign a table of {} rows to {} rows",
                                      source.row_count(), rows.size()));
    }
    // Snapshot the source columns; they may share storage with the targets.
    std::vector<ColumnValue> values;
    values.reserve(source.column_count());
    for (const auto& col : source.columns()) {
        values.push_back(*col);
    }
    for (std::size_t j = 0; j < positions->size(); ++j) {
        auto pos = (*positions)[j];
        auto degraded = scatter(*table.columns()[pos], rows, values[j]);
        if (!degraded) {
            return std::unexpected(degraded.error());
        }
        log_degraded(table, pos, *degraded);
    }
    return {};
}

}  // namespace

auto read(const Table& table, const Selector& selector) -> Result<Selection> {
    const auto& index = table.index();
    return std::visit(
        [&](const auto& s) -> Result<Selection> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, SingleColumn>) {
                auto pos = index.position(s.column);
                if (!pos) {
                    return std::unexpected(pos.error());
                }
                return Selection{table.columns()[*pos]};
            } else if constexpr (std::is_same_v<T, MultiColumn>) {
                auto positions = index.resolve(s.columns);
                if (!positions) {
                    return std::unexpected(positions.error());
                }
                auto out = sub_table(table, *positions, nullptr);
                if (!out) {
                    return std::unexpected(out.error());
                }
                return Selection{std::move(*out)};
            } else if constexpr (std::is_same_v<T, SingleCell>) {
                auto pos = index.position(s.column);
                if (!pos) {
                    return std::unexpected(pos.error());
                }
                if (auto ok = check_row(s.row, table.row_count()); !ok) {
                    return std::unexpected(ok.error());
                }
                return Selection{get_value(*table.columns()[*pos], s.row)};
            } else if constexpr (std::is_same_v<T, RowSlice>) {
                auto positions = index.resolve(s.columns);
                if (!positions) {
                    return std::unexpected(positions.error());
                }
                if (auto ok = check_row(s.row, table.row_count()); !ok) {
                    return std::unexpected(ok.error());
                }
                std::vector<std::size_t> rows{s.row};
                auto out = sub_table(table, *positions, &rows);
                if (!out) {
                    return std::unexpected(out.error());
                }
                return Selection{std::move(*out)};
            } else if constexpr (std::is_same_v<T, ColumnSlice>) {
                auto pos = index.position(s.column);
                if (!pos) {
                    return std::unexpected(pos.error());
                }
                if (auto ok = check_rows(s.rows, table.row_count()); !ok) {
                    return std::unexpected(ok.error());
                }
                return Selection{gather(*table.columns()[*pos], s.rows)};
            } else {
                auto positions = index.resolve(s.columns);
                if (!positions) {
                    return std::unexpected(positions.error());
                }
                if (auto ok = check_rows(s.rows, table.row_count()); !ok) {
                    return std::unexpected(ok.error());
                }
                auto out = sub_table(table, *positions, &s.rows);
                if (!out) {
                    return std::unexpected(out.error());
                }
                return Selection{std::move(*out)};
            }
        },
        selector);
}

auto write(Table& table, const Selector& selector, const Assignment& value) -> Result<void> {
    return std::visit(
        [&](const auto& s) -> Result<void> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, SingleColumn>) {
                return write_column(table, s.column, value);
            } else if constexpr (std::is_same_v<T, MultiColumn>) {
                return write_columns(table, s.columns, value);
            } else if constexpr (std::is_same_v<T, SingleCell>) {
                return write_cell(table, s.row, s.column, value);
            } else if constexpr (std::is_same_v<T, RowSlice>) {
                return write_row(table, s.row, s.columns, value);
            } else if constexpr (std::is_same_v<T, ColumnSlice>) {
                return write_range(table, s.rows, {s.column}, value);
            } else {
                return write_range(table, s.rows, s.columns, value);
            }
        },
        selector);
}

auto write_row_in_place(Table& table, std::size_t row, const std::vector<ColumnKey>& keys,
                        const Assignment& value) -> Result<void> {
    auto positions = resolve_existing(table, keys);
    if (!positions) {
        return std::unexpected(positions.error());
    }
    if (auto ok = check_row(row, table.row_count()); !ok) {
        return ok;
    }
    auto cells = row_cells(table, keys, value);
    if (!cells) {
        return std::unexpected(cells.error());
    }
    const std::vector<std::size_t> rows{row};
    for (std::size_t j = 0; j < positions->size(); ++j) {
        auto pos = (*positions)[j];
        log_degraded(table, pos, fill(*table.columns()[pos], rows, (*cells)[j]));
    }
    return {};
}

}  // namespace tabula
