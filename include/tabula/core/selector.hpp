#pragma once

#include <tabula/core/column_index.hpp>
#include <tabula/core/error.hpp>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace tabula {

/// Marker selecting every row or every column.
struct All {};

inline constexpr All all{};

/// Raw column addressing argument: a key, a key list, a boolean mask or `all`.
class ColumnSelector {
   public:
    using storage_type = std::variant<ColumnKey, std::vector<ColumnKey>, std::vector<bool>, All>;

    ColumnSelector(ColumnKey key) : sel_(std::move(key)) {}
    ColumnSelector(std::string name) : sel_(ColumnKey(std::move(name))) {}
    ColumnSelector(std::string_view name) : sel_(ColumnKey(name)) {}
    ColumnSelector(const char* name) : sel_(ColumnKey(name)) {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    ColumnSelector(I position) : sel_(ColumnKey(position)) {}

    ColumnSelector(std::vector<ColumnKey> keys) : sel_(std::move(keys)) {}
    ColumnSelector(std::initializer_list<ColumnKey> keys) : sel_(std::vector<ColumnKey>(keys)) {}
    ColumnSelector(const std::vector<std::string>& names)
        : sel_(std::vector<ColumnKey>(names.begin(), names.end())) {}
    ColumnSelector(std::vector<bool> mask) : sel_(std::move(mask)) {}
    ColumnSelector(All /*all*/) : sel_(All{}) {}

    [[nodiscard]] auto storage() const noexcept -> const storage_type& { return sel_; }

   private:
    storage_type sel_;
};

/// Raw row addressing argument: a position, a position list, a boolean mask or `all`.
class RowSelector {
   public:
    using storage_type =
        std::variant<std::size_t, std::vector<std::size_t>, std::vector<bool>, All>;

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    RowSelector(I row) : sel_(checked_position(row, ErrorKind::OutOfBounds)) {}

    RowSelector(std::vector<std::size_t> rows) : sel_(std::move(rows)) {}
    RowSelector(std::initializer_list<std::size_t> rows) : sel_(std::vector<std::size_t>(rows)) {}
    RowSelector(std::vector<bool> mask) : sel_(std::move(mask)) {}
    RowSelector(All /*all*/) : sel_(All{}) {}

    [[nodiscard]] auto storage() const noexcept -> const storage_type& { return sel_; }

   private:
    storage_type sel_;
};

/// Normalised column address: one key or an ordered key list.
using ColumnTarget = std::variant<ColumnKey, std::vector<ColumnKey>>;

/// Normalised row address: one position or an ordered position list.
using RowTarget = std::variant<std::size_t, std::vector<std::size_t>>;

// ─── The six addressing shapes ────────────────────────────────────────────────

struct SingleColumn {
    ColumnKey column;
};

struct MultiColumn {
    std::vector<ColumnKey> columns;
};

struct SingleCell {
    std::size_t row;
    ColumnKey column;
};

/// One row across several columns.
struct RowSlice {
    std::size_t row;
    std::vector<ColumnKey> columns;
};

/// Several rows of one column.
struct ColumnSlice {
    std::vector<std::size_t> rows;
    ColumnKey column;
};

struct Block {
    std::vector<std::size_t> rows;
    std::vector<ColumnKey> columns;
};

using Selector = std::variant<SingleColumn, MultiColumn, SingleCell, RowSlice, ColumnSlice, Block>;

/// Masks are checked against the column count and turned into positions; `all`
/// expands to every position. Keys are not resolved, so writes may still
/// address new names.
[[nodiscard]] auto normalize(const ColumnSelector& selector, const ColumnIndex& index)
    -> Result<ColumnTarget>;

/// Masks are checked against `row_count`. Positions are not bounds-checked
/// here; the read and write paths do that.
[[nodiscard]] auto normalize(const RowSelector& selector, std::size_t row_count)
    -> Result<RowTarget>;

[[nodiscard]] auto classify(ColumnTarget columns) -> Selector;
[[nodiscard]] auto classify(RowTarget rows, ColumnTarget columns) -> Selector;

[[nodiscard]] auto make_selector(const ColumnSelector& columns, const ColumnIndex& index)
    -> Result<Selector>;
[[nodiscard]] auto make_selector(const RowSelector& rows, const ColumnSelector& columns,
                                 const ColumnIndex& index, std::size_t row_count)
    -> Result<Selector>;

}  // namespace tabula
