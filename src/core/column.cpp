#include <tabula/core/column.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tabula {

// Explicit instantiations for common types to reduce compile times.
template class Column<bool>;
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Value>;

namespace {

template <typename T>
constexpr ElementType element_type_v = ElementType::Dynamic;
template <>
constexpr ElementType element_type_v<bool> = ElementType::Bool;
template <>
constexpr ElementType element_type_v<std::int64_t> = ElementType::Int;
template <>
constexpr ElementType element_type_v<double> = ElementType::Double;
template <>
constexpr ElementType element_type_v<std::string> = ElementType::String;

auto make_empty(ElementType type) -> ColumnValue {
    switch (type) {
        case ElementType::Bool:
            return Column<bool>{};
        case ElementType::Int:
            return Column<std::int64_t>{};
        case ElementType::Double:
            return Column<double>{};
        case ElementType::String:
            return Column<std::string>{};
        case ElementType::Dynamic:
            return Column<Value>{};
    }
    return Column<Value>{};
}

// Convert a non-NA value to the storage type T; nullopt if not representable.
template <typename T>
auto cell_from(const Value& value) -> std::optional<T> {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else {
        auto converted = convert(value, element_type_v<T>);
        if (!converted.has_value() || converted->is_na()) {
            return std::nullopt;
        }
        return converted->template get<T>();
    }
}

// Append a Value, degrading to NA when it cannot be stored. Returns false on
// degradation.
auto push_value(ColumnValue& column, const Value& value) -> bool {
    return std::visit(
        [&](auto& col) -> bool {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if (value.is_na()) {
                col.push_na();
                return true;
            }
            auto cell = cell_from<T>(value);
            if (!cell.has_value()) {
                col.push_na();
                return false;
            }
            col.push_back(std::move(*cell));
            return true;
        },
        column);
}

// Append every cell of `src` to `dst`; both hold the same alternative.
auto append_same(ColumnValue& dst, const ColumnValue& src) -> void {
    std::visit(
        [&](auto& dst_col) {
            using ColType = std::decay_t<decltype(dst_col)>;
            const auto* src_col = std::get_if<ColType>(&src);
            if (src_col == nullptr) {
                throw std::runtime_error("column type mismatch");
            }
            dst_col.reserve(dst_col.size() + src_col->size());
            for (std::size_t i = 0; i < src_col->size(); ++i) {
                if (src_col->is_na(i)) {
                    dst_col.push_na();
                } else {
                    dst_col.push_back((*src_col)[i]);
                }
            }
        },
        dst);
}

// Cell comparison for two columns of the same typed alternative.
template <typename T>
auto typed_equal(const T& lhs, const T& rhs, bool nan_equal) -> bool {
    if constexpr (std::is_same_v<T, double>) {
        if (nan_equal && std::isnan(lhs) && std::isnan(rhs)) {
            return true;
        }
    }
    return lhs == rhs;
}

}  // namespace

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_type(const ColumnValue& column) -> ElementType {
    return std::visit(
        [](const auto& col) -> ElementType {
            using T = typename std::decay_t<decltype(col)>::value_type;
            return element_type_v<T>;
        },
        column);
}

auto is_na(const ColumnValue& column, std::size_t row) -> bool {
    return std::visit(
        [row](const auto& col) -> bool {
            if (row >= col.size()) {
                throw std::out_of_range(
                    fmt::format("row {} out of range for column of length {}", row, col.size()));
            }
            return col.is_na(row);
        },
        column);
}

auto get_value(const ColumnValue& column, std::size_t row) -> Value {
    return std::visit(
        [row](const auto& col) -> Value {
            if (row >= col.size()) {
                throw std::out_of_range(
                    fmt::format("row {} out of range for column of length {}", row, col.size()));
            }
            if (col.is_na(row)) {
                return Value{};
            }
            return Value{col[row]};
        },
        column);
}

auto set_value(ColumnValue& column, std::size_t row, const Value& value) -> bool {
    return std::visit(
        [&](auto& col) -> bool {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if (row >= col.size()) {
                throw std::out_of_range(
                    fmt::format("row {} out of range for column of length {}", row, col.size()));
            }
            if (value.is_na()) {
                col.set_na(row);
                return true;
            }
            auto cell = cell_from<T>(value);
            if (!cell.has_value()) {
                return false;
            }
            col.set(row, std::move(*cell));
            return true;
        },
        column);
}

auto gather(const ColumnValue& column, std::span<const std::size_t> rows) -> ColumnValue {
    return std::visit([&](const auto& col) -> ColumnValue { return col.gather(rows); }, column);
}

auto scatter(ColumnValue& column, std::span<const std::size_t> rows, const ColumnValue& values)
    -> Result<std::size_t> {
    if (column_size(values) != rows.size()) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("cannot assign {} values to {} rows", column_size(values),
                                      rows.size()));
    }
    std::size_t degraded = 0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (!set_value(column, rows[i], get_value(values, i))) {
            std::visit([&](auto& col) { col.set_na(rows[i]); }, column);
            ++degraded;
        }
    }
    return degraded;
}

auto fill(ColumnValue& column, std::span<const std::size_t> rows, const Value& value)
    -> std::size_t {
    std::size_t degraded = 0;
    for (auto row : rows) {
        if (!set_value(column, row, value)) {
            std::visit([row](auto& col) { col.set_na(row); }, column);
            ++degraded;
        }
    }
    return degraded;
}

auto make_na_column(ElementType type, std::size_t count) -> ColumnValue {
    return std::visit(
        [count](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            return ColType::na(count);
        },
        make_empty(type));
}

auto make_filled_column(const Value& value, std::size_t count, ElementType na_type)
    -> ColumnValue {
    if (value.is_na()) {
        return make_na_column(na_type, count);
    }
    return std::visit(
        [count](const auto& v) -> ColumnValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NAType>) {
                return Column<Value>::na(count);
            } else {
                return Column<T>(std::vector<T>(count, v));
            }
        },
        value.storage());
}

auto convert_column(const ColumnValue& column, ElementType type) -> ColumnValue {
    if (column_type(column) == type) {
        return column;
    }
    ColumnValue out = make_empty(type);
    std::size_t rows = column_size(column);
    std::visit([rows](auto& col) { col.reserve(rows); }, out);
    for (std::size_t i = 0; i < rows; ++i) {
        // Promotion targets always accept the source cells; demotions degrade to NA.
        static_cast<void>(push_value(out, get_value(column, i)));
    }
    return out;
}

auto concat_columns(std::span<const ColumnValue* const> parts) -> ColumnValue {
    if (parts.empty()) {
        return Column<Value>{};
    }
    ElementType type = column_type(*parts.front());
    for (const auto* part : parts.subspan(1)) {
        type = promote(type, column_type(*part));
    }
    ColumnValue out = make_empty(type);
    for (const auto* part : parts) {
        if (column_type(*part) == type) {
            append_same(out, *part);
        } else {
            append_same(out, convert_column(*part, type));
        }
    }
    return out;
}

auto elementwise_equals(const ColumnValue& lhs, const ColumnValue& rhs) -> std::vector<Truth> {
    std::size_t rows = column_size(lhs);
    if (column_size(rhs) != rows) {
        throw TableError(Error{.kind = ErrorKind::LengthMismatch,
                               .message = fmt::format("elementwise comparison of columns with "
                                                      "lengths {} and {}",
                                                      rows, column_size(rhs))});
    }
    std::vector<Truth> out;
    out.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        out.push_back(equals(get_value(lhs, i), get_value(rhs, i)));
    }
    return out;
}

auto column_equals(const ColumnValue& lhs, const ColumnValue& rhs) -> Truth {
    std::size_t rows = column_size(lhs);
    if (column_size(rhs) != rows) {
        return Truth::False;
    }
    if (lhs.index() == rhs.index() && !std::holds_alternative<Column<Value>>(lhs)) {
        return std::visit(
            [&](const auto& l) -> Truth {
                using ColType = std::decay_t<decltype(l)>;
                const auto& r = std::get<ColType>(rhs);
                bool saw_na = false;
                for (std::size_t i = 0; i < rows; ++i) {
                    if (l.is_na(i) || r.is_na(i)) {
                        saw_na = true;
                    } else if (!typed_equal(l[i], r[i], false)) {
                        return Truth::False;
                    }
                }
                return saw_na ? Truth::Unknown : Truth::True;
            },
            lhs);
    }
    bool saw_na = false;
    for (std::size_t i = 0; i < rows; ++i) {
        Truth cell = equals(get_value(lhs, i), get_value(rhs, i));
        if (cell == Truth::False) {
            return Truth::False;
        }
        saw_na = saw_na || cell == Truth::Unknown;
    }
    return saw_na ? Truth::Unknown : Truth::True;
}

auto column_equivalent(const ColumnValue& lhs, const ColumnValue& rhs) -> bool {
    std::size_t rows = column_size(lhs);
    if (column_size(rhs) != rows) {
        return false;
    }
    if (lhs.index() == rhs.index() && !std::holds_alternative<Column<Value>>(lhs)) {
        return std::visit(
            [&](const auto& l) -> bool {
                using ColType = std::decay_t<decltype(l)>;
                const auto& r = std::get<ColType>(rhs);
                for (std::size_t i = 0; i < rows; ++i) {
                    if (l.is_na(i) != r.is_na(i)) {
                        return false;
                    }
                    if (!l.is_na(i) && !typed_equal(l[i], r[i], true)) {
                        return false;
                    }
                }
                return true;
            },
            lhs);
    }
    for (std::size_t i = 0; i < rows; ++i) {
        if (!equivalent(get_value(lhs, i), get_value(rhs, i))) {
            return false;
        }
    }
    return true;
}

auto hash_column(const ColumnValue& column) -> std::size_t {
    std::size_t rows = column_size(column);
    std::size_t seed = std::hash<std::size_t>{}(rows);
    for (std::size_t i = 0; i < rows; ++i) {
        seed = hash_combine(seed, hash_value(get_value(column, i)));
    }
    return seed;
}

}  // namespace tabula
