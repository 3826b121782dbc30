#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning, NA-capable columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values plus an
/// optional validity bitmap (true = valid). A missing bitmap means every row
/// is valid, which keeps the common case free of overhead. NA slots hold a
/// value-initialised T.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;
    using reference = typename std::vector<T>::reference;
    using const_reference = typename std::vector<T>::const_reference;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {
        if constexpr (std::is_same_v<T, Value>) {
            for (size_type i = 0; i < data_.size(); ++i) {
                if (data_[i].is_na()) {
                    set_na(i);
                }
            }
        }
    }

    Column(std::vector<T> data, std::vector<bool> validity) : Column(std::move(data)) {
        if (validity.size() != data_.size()) {
            throw TableError(Error{.kind = ErrorKind::LengthMismatch,
                                   .message = fmt::format("validity bitmap has length {} but "
                                                          "column has {} values",
                                                          validity.size(), data_.size())});
        }
        for (size_type i = 0; i < validity.size(); ++i) {
            if (!validity[i]) {
                set_na(i);
            }
        }
    }

    Column(std::initializer_list<T> init) : Column(std::vector<T>(init)) {}

    /// An all-NA column of the given length.
    [[nodiscard]] static auto na(size_type count) -> Column {
        Column col;
        col.data_.assign(count, T{});
        col.validity_.emplace(count, false);
        return col;
    }

    /// Number of elements.
    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    /// Whether the column is empty.
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Immutable element access (bounds-checked). NA slots return T{}.
    [[nodiscard]] auto at(size_type idx) const -> const_reference { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const_reference {
        return data_[idx];
    }

    [[nodiscard]] auto is_na(size_type idx) const noexcept -> bool {
        return validity_.has_value() && !(*validity_)[idx];
    }

    [[nodiscard]] auto has_na() const noexcept -> bool { return na_count() > 0; }

    [[nodiscard]] auto na_count() const noexcept -> size_type {
        if (!validity_.has_value()) {
            return 0;
        }
        size_type count = 0;
        for (bool valid : *validity_) {
            count += valid ? 0 : 1;
        }
        return count;
    }

    /// Store a value and mark the slot valid.
    void set(size_type idx, T value) {
        if constexpr (std::is_same_v<T, Value>) {
            if (value.is_na()) {
                set_na(idx);
                return;
            }
        }
        data_.at(idx) = std::move(value);
        if (validity_.has_value()) {
            (*validity_)[idx] = true;
        }
    }

    /// Mark a slot as NA.
    void set_na(size_type idx) {
        if (idx >= data_.size()) {
            throw std::out_of_range("Column::set_na index out of range");
        }
        if (!validity_.has_value()) {
            validity_.emplace(data_.size(), true);
        }
        data_[idx] = T{};
        (*validity_)[idx] = false;
    }

    /// Append a value.
    void push_back(T value) {
        if constexpr (std::is_same_v<T, Value>) {
            if (value.is_na()) {
                push_na();
                return;
            }
        }
        data_.push_back(std::move(value));
        if (validity_.has_value()) {
            validity_->push_back(true);
        }
    }

    /// Append an NA slot.
    void push_na() {
        if (!validity_.has_value()) {
            validity_.emplace(data_.size(), true);
        }
        data_.emplace_back();
        validity_->push_back(false);
    }

    /// Reserve capacity.
    void reserve(size_type capacity) {
        data_.reserve(capacity);
        if (validity_.has_value()) {
            validity_->reserve(capacity);
        }
    }

    /// Remove all elements.
    void clear() noexcept {
        data_.clear();
        validity_.reset();
    }

    /// Gather the given positions into a new column (bounds-checked).
    [[nodiscard]] auto gather(std::span<const std::size_t> positions) const -> Column {
        Column out;
        out.reserve(positions.size());
        for (auto pos : positions) {
            if (pos >= data_.size()) {
                throw std::out_of_range("Column::gather position out of range");
            }
            if (is_na(pos)) {
                out.push_na();
            } else {
                out.push_back(data_[pos]);
            }
        }
        return out;
    }

    [[nodiscard]] auto values() const noexcept -> const std::vector<T>& { return data_; }

    [[nodiscard]] auto validity() const noexcept -> const std::optional<std::vector<bool>>& {
        return validity_;
    }

    // Iterator support over raw storage (NA slots yield T{}).
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
    std::optional<std::vector<bool>> validity_;
};

/// Runtime column: one alternative per ElementType. Column<Value> is the
/// fully dynamic fallback.
using ColumnValue = std::variant<Column<bool>, Column<std::int64_t>, Column<double>,
                                 Column<std::string>, Column<Value>>;

/// Shared-ownership handle held by a table slot.
using ColumnPtr = std::shared_ptr<ColumnValue>;

// ─── Column capability ────────────────────────────────────────────────────────
//  Free functions over ColumnValue. The table layer only touches columns
//  through these.

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

[[nodiscard]] auto column_type(const ColumnValue& column) -> ElementType;

/// Bounds-checked like get_value.
[[nodiscard]] auto is_na(const ColumnValue& column, std::size_t row) -> bool;

/// Read one cell (bounds-checked, throws std::out_of_range).
[[nodiscard]] auto get_value(const ColumnValue& column, std::size_t row) -> Value;

/// Write one cell. Returns false and leaves the cell untouched when the value
/// cannot be represented in the column's element type.
[[nodiscard]] auto set_value(ColumnValue& column, std::size_t row, const Value& value) -> bool;

/// Gather positions into a new column of the same element type.
[[nodiscard]] auto gather(const ColumnValue& column, std::span<const std::size_t> rows)
    -> ColumnValue;

/// Write `values[i]` into `rows[i]`; cells whose value cannot be represented
/// become NA. Returns the number of cells degraded to NA.
[[nodiscard]] auto scatter(ColumnValue& column, std::span<const std::size_t> rows,
                           const ColumnValue& values) -> Result<std::size_t>;

/// Broadcast a scalar into the given rows; on type mismatch every targeted
/// cell becomes NA. Returns the number of cells degraded to NA.
[[nodiscard]] auto fill(ColumnValue& column, std::span<const std::size_t> rows,
                        const Value& value) -> std::size_t;

[[nodiscard]] auto make_na_column(ElementType type, std::size_t count) -> ColumnValue;

/// A column of `count` copies of `value`, typed after the value; NA values
/// produce an all-NA column of `na_type`.
[[nodiscard]] auto make_filled_column(const Value& value, std::size_t count, ElementType na_type)
    -> ColumnValue;

/// Convert a column to another element type; unrepresentable cells become NA.
[[nodiscard]] auto convert_column(const ColumnValue& column, ElementType type) -> ColumnValue;

/// Concatenate columns end to end, promoting to the least upper bound type.
[[nodiscard]] auto concat_columns(std::span<const ColumnValue* const> parts) -> ColumnValue;

/// Per-element NA-aware equality. Columns must have equal length.
[[nodiscard]] auto elementwise_equals(const ColumnValue& lhs, const ColumnValue& rhs)
    -> std::vector<Truth>;

/// Column equality: False on length mismatch or any definite inequality,
/// Unknown when NA was involved, True otherwise.
[[nodiscard]] auto column_equals(const ColumnValue& lhs, const ColumnValue& rhs) -> Truth;

/// Identity-style column equality (NA equals NA).
[[nodiscard]] auto column_equivalent(const ColumnValue& lhs, const ColumnValue& rhs) -> bool;

/// Hash consistent with column_equivalent().
[[nodiscard]] auto hash_column(const ColumnValue& column) -> std::size_t;

}  // namespace tabula
