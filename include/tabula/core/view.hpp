#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/column_index.hpp>
#include <tabula/core/selector.hpp>
#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tabula {

/// Non-owning row subset of a table.
///
/// Row positions address the parent table; reads and writes re-map view rows
/// through them and go through the parent's indexing algebra. The view must
/// not outlive its parent or be used after the parent's rows change.
class TableView {
   public:
    /// Throws TableError(OutOfBounds) if a position is not a parent row.
    TableView(Table& parent, std::vector<std::size_t> rows);

    [[nodiscard]] auto parent() const noexcept -> Table& { return *parent_; }
    [[nodiscard]] auto rows() const noexcept -> const std::vector<std::size_t>& { return rows_; }

    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_.size(); }
    [[nodiscard]] auto column_count() const noexcept -> std::size_t {
        return parent_->column_count();
    }
    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& {
        return parent_->names();
    }
    [[nodiscard]] auto index() const noexcept -> const ColumnIndex& { return parent_->index(); }

    /// The view's rows of one column, gathered.
    [[nodiscard]] auto column(const ColumnKey& key) const -> ColumnValue;
    [[nodiscard]] auto at(std::size_t row, const ColumnKey& key) const -> Value;
    [[nodiscard]] auto select(const ColumnSelector& columns) const -> Table;
    [[nodiscard]] auto select(const RowSelector& rows, const ColumnSelector& columns) const
        -> Table;

    /// Write the view's rows of existing columns.
    void set(const ColumnSelector& columns, const Assignment& value);
    void set(const RowSelector& rows, const ColumnSelector& columns, const Assignment& value);

    /// Sub-view; positions are relative to this view.
    [[nodiscard]] auto view(const RowSelector& rows) const -> TableView;
    [[nodiscard]] auto row(std::size_t position) const -> RowView;

    [[nodiscard]] auto materialize() const -> Table;

   private:
    /// View row selection -> parent row positions.
    [[nodiscard]] auto map_rows(const RowSelector& rows) const -> RowTarget;

    Table* parent_;
    std::vector<std::size_t> rows_;
};

/// Non-owning handle to one row of a table, optionally restricted to a subset
/// of its columns. Keys are resolved against the visible columns.
class RowView {
   public:
    /// Throws TableError(OutOfBounds) if `row` is not a table row.
    RowView(Table& table, std::size_t row);
    RowView(Table& table, std::size_t row, std::vector<std::size_t> columns);

    [[nodiscard]] auto table() const noexcept -> Table& { return *table_; }
    [[nodiscard]] auto row() const noexcept -> std::size_t { return row_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto get(const ColumnKey& key) const -> Value;
    void set(const ColumnKey& key, const Value& value);

    [[nodiscard]] auto values() const -> std::vector<Value>;

    /// (name, value) pairs in column order.
    [[nodiscard]] auto fields() const -> std::vector<std::pair<std::string, Value>>;

    /// Row view over a subset of the visible columns.
    [[nodiscard]] auto restrict(const ColumnSelector& columns) const -> RowView;

    /// One-row table holding a copy of the visible cells.
    [[nodiscard]] auto to_table() const -> Table;

   private:
    /// Visible key -> parent column position.
    [[nodiscard]] auto parent_position(const ColumnKey& key) const -> std::size_t;
    [[nodiscard]] auto visible_positions() const -> std::vector<std::size_t>;

    Table* table_;
    std::size_t row_;
    std::optional<std::vector<std::size_t>> columns_;
};

}  // namespace tabula
