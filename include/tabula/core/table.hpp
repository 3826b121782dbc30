#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/column_index.hpp>
#include <tabula/core/config.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/selector.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tabula {

/// Assignment marker that deletes the targeted columns.
struct Erase {};

inline constexpr Erase erase{};

class Table;
class TableView;
class RowView;

/// Right-hand side of a write.
using Assignment = std::variant<Erase, Value, ColumnValue, Table>;

/// Result of a generic read; which alternative depends on the addressing shape.
using Selection = std::variant<ColumnPtr, Table, Value, ColumnValue>;

/// Ordered collection of named, equal-length columns.
///
/// Column slots hold shared handles. Copying a Table (or shallow_copy()) shares
/// column storage; replacing a column reseats only this table's handle, while
/// in-place cell writes are visible through every table sharing the column.
/// Not thread-safe.
class Table {
   public:
    Table() = default;

    /// Throws TableError(LengthMismatch / IndexMismatch) on inconsistent input.
    Table(std::vector<ColumnPtr> columns, ColumnIndex index, TableConfig config = {});
    Table(std::vector<ColumnValue> columns, std::vector<std::string> names,
          TableConfig config = {});
    /// Columns named prefix1 .. prefixN.
    explicit Table(std::vector<ColumnValue> columns, TableConfig config = {});

    [[nodiscard]] static auto make(std::vector<ColumnPtr> columns, ColumnIndex index,
                                   TableConfig config = {}) -> Result<Table>;

    [[nodiscard]] static auto from_columns(
        std::vector<std::pair<std::string, ColumnValue>> columns, TableConfig config = {})
        -> Table;

    /// `rows` x `cols` table of NA cells of the configured default type.
    [[nodiscard]] static auto with_na(std::size_t rows, std::size_t cols,
                                      TableConfig config = {}) -> Table;

    /// All-NA table with one column per (type, name).
    [[nodiscard]] static auto with_types(const std::vector<ElementType>& types,
                                         std::vector<std::string> names, std::size_t rows,
                                         TableConfig config = {}) -> Table;

    // ─── Shape ────────────────────────────────────────────────────────────────

    /// 0 when there are no columns, otherwise the common column length.
    [[nodiscard]] auto row_count() const noexcept -> std::size_t;
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return columns_.empty(); }

    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& {
        return index_.names();
    }
    [[nodiscard]] auto index() const noexcept -> const ColumnIndex& { return index_; }
    [[nodiscard]] auto config() const noexcept -> const TableConfig& { return config_; }
    [[nodiscard]] auto types() const -> std::vector<ElementType>;
    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnPtr>& {
        return columns_;
    }
    [[nodiscard]] auto has_column(const ColumnKey& key) const -> bool {
        return index_.contains(key);
    }

    // ─── Reads ────────────────────────────────────────────────────────────────

    [[nodiscard]] auto column(const ColumnKey& key) const -> const ColumnValue&;

    /// The slot's handle itself (shared, not a copy).
    [[nodiscard]] auto column_ptr(const ColumnKey& key) const -> ColumnPtr;

    [[nodiscard]] auto at(std::size_t row, const ColumnKey& key) const -> Value;

    /// Column subset sharing storage with this table.
    [[nodiscard]] auto select(const ColumnSelector& columns) const -> Table;

    /// Row and column subset; always a table, even for a single row.
    [[nodiscard]] auto select(const RowSelector& rows, const ColumnSelector& columns) const
        -> Table;

    /// Gathered copy of the selected rows of one column.
    [[nodiscard]] auto gather(const RowSelector& rows, const ColumnKey& key) const
        -> ColumnValue;

    /// Generic read; the result alternative follows the addressing shape.
    [[nodiscard]] auto get(const ColumnSelector& columns) const -> Selection;
    [[nodiscard]] auto get(const RowSelector& rows, const ColumnSelector& columns) const
        -> Selection;

    // ─── Writes ───────────────────────────────────────────────────────────────

    void set(const ColumnSelector& columns, const Assignment& value);
    void set(const RowSelector& rows, const ColumnSelector& columns, const Assignment& value);

    /// Delete columns. Positions refer to the table before any deletion.
    void remove(const ColumnSelector& columns);

    void rename(const ColumnKey& key, std::string new_name);
    void set_names(std::vector<std::string> names);

    /// Trim surrounding whitespace and replace every character other than
    /// [A-Za-z0-9_] with '_'. Throws DuplicateColumn if cleaned names collide.
    void clean_names();

    /// Insert a column at `position` (0 ..= column_count()). Scalars broadcast.
    void insert(std::size_t position, std::string name, const Assignment& value);

    /// Assign every column of `other` by name, replacing or appending.
    void merge(const Table& other);

    /// Keep only the selected rows, in selection order.
    void keep_rows(const RowSelector& rows);

    /// Delete the selected rows.
    void delete_rows(const RowSelector& rows);

    /// Delete every row containing an NA cell.
    void drop_incomplete();

    // ─── Derived tables ───────────────────────────────────────────────────────

    /// Copy without the selected columns; throws EmptyResult if none would remain.
    [[nodiscard]] auto without(const ColumnSelector& columns) const -> Table;

    [[nodiscard]] auto shallow_copy() const -> Table { return *this; }
    [[nodiscard]] auto deep_copy() const -> Table;

    [[nodiscard]] auto head(std::size_t count) const -> Table;
    [[nodiscard]] auto tail(std::size_t count) const -> Table;

    /// Rows in reverse order.
    [[nodiscard]] auto flipped() const -> Table;

    /// Per row: true when no cell is NA.
    [[nodiscard]] auto complete_cases() const -> std::vector<bool>;

    // ─── Views ────────────────────────────────────────────────────────────────

    [[nodiscard]] auto view(const RowSelector& rows) -> TableView;
    [[nodiscard]] auto row(std::size_t position) -> RowView;

    // ─── Slot-level edits ─────────────────────────────────────────────────────
    //  Used by the indexing algebra. Columns keep equal lengths but these
    //  apply none of the assignment rules.

    /// Replace the handle at `position`. A sole column may change length.
    [[nodiscard]] auto replace_slot(std::size_t position, ColumnPtr column) -> Result<void>;
    [[nodiscard]] auto append_slot(std::string name, ColumnPtr column) -> Result<void>;
    [[nodiscard]] auto insert_slot(std::size_t position, std::string name, ColumnPtr column)
        -> Result<void>;
    [[nodiscard]] auto erase_slot(std::size_t position) -> Result<void>;

   private:
    [[nodiscard]] auto check_length(std::size_t length) const -> Result<void>;
    [[nodiscard]] auto gather_rows(std::span<const std::size_t> rows) const -> Table;

    std::vector<ColumnPtr> columns_;
    ColumnIndex index_;
    TableConfig config_;
};

}  // namespace tabula
