#include <tabula/ops/compare.hpp>

#include <robin_hood.h>

namespace tabula::ops {

namespace {

struct RowKey {
    std::vector<Value> values;
};

struct RowKeyHash {
    auto operator()(const RowKey& key) const -> std::size_t {
        std::size_t seed = 0;
        for (const auto& value : key.values) {
            seed = hash_combine(seed, hash_value(value));
        }
        return seed;
    }
};

// NA matches NA so that rows with missing cells still deduplicate.
struct RowKeyEq {
    auto operator()(const RowKey& a, const RowKey& b) const -> bool {
        if (a.values.size() != b.values.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.values.size(); ++i) {
            if (!equivalent(a.values[i], b.values[i])) {
                return false;
            }
        }
        return true;
    }
};

auto row_key(const Table& table, std::size_t row) -> RowKey {
    RowKey key;
    key.values.reserve(table.column_count());
    for (const auto& col : table.columns()) {
        key.values.push_back(get_value(*col, row));
    }
    return key;
}

}  // namespace

auto equals(const Table& lhs, const Table& rhs) -> Truth {
    if (lhs.column_count() != rhs.column_count() || lhs.names() != rhs.names()) {
        return Truth::False;
    }
    Truth result = Truth::True;
    for (std::size_t j = 0; j < lhs.column_count(); ++j) {
        result = truth_and(result, column_equals(*lhs.columns()[j], *rhs.columns()[j]));
        if (result == Truth::False) {
            return result;
        }
    }
    return result;
}

auto is_equivalent(const Table& lhs, const Table& rhs) -> bool {
    if (lhs.column_count() != rhs.column_count() || lhs.names() != rhs.names()) {
        return false;
    }
    for (std::size_t j = 0; j < lhs.column_count(); ++j) {
        if (!column_equivalent(*lhs.columns()[j], *rhs.columns()[j])) {
            return false;
        }
    }
    return true;
}

auto hash_table(const Table& table) -> std::size_t {
    std::size_t seed =
        hash_combine(std::hash<std::size_t>{}(table.row_count()), table.column_count()) + 1;
    for (const auto& col : table.columns()) {
        seed = hash_combine(seed, hash_column(*col));
    }
    return seed;
}

auto duplicated(const Table& table) -> std::vector<bool> {
    const std::size_t rows = table.row_count();
    std::vector<bool> out(rows, false);
    robin_hood::unordered_flat_set<RowKey, RowKeyHash, RowKeyEq> seen;
    seen.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        if (!seen.insert(row_key(table, row)).second) {
            out[row] = true;
        }
    }
    return out;
}

auto unique(const Table& table) -> Table {
    Table out = table;
    drop_duplicates(out);
    return out;
}

void drop_duplicates(Table& table) {
    auto dups = duplicated(table);
    dups.flip();
    table.keep_rows(RowSelector(std::move(dups)));
}

}  // namespace tabula::ops
