#pragma once

#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace tabula::ops {

/// NA-propagating table equality. False on differing names or shape, or any
/// definitely unequal cell; Unknown when only NA comparisons stand in the way.
[[nodiscard]] auto equals(const Table& lhs, const Table& rhs) -> Truth;

/// Identity-style equality: NA equals NA.
[[nodiscard]] auto is_equivalent(const Table& lhs, const Table& rhs) -> bool;

/// Hash consistent with is_equivalent().
[[nodiscard]] auto hash_table(const Table& table) -> std::size_t;

/// Per row: true when an earlier row holds an equivalent value tuple.
[[nodiscard]] auto duplicated(const Table& table) -> std::vector<bool>;

/// Copy keeping the first occurrence of each distinct row.
[[nodiscard]] auto unique(const Table& table) -> Table;

/// Remove repeated rows in place.
void drop_duplicates(Table& table);

}  // namespace tabula::ops

namespace std {

template <>
struct hash<tabula::Table> {
    auto operator()(const tabula::Table& table) const -> std::size_t {
        return tabula::ops::hash_table(table);
    }
};

}  // namespace std
