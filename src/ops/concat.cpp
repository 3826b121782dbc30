#include <tabula/ops/concat.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace tabula::ops {

auto make_unique_names(const std::vector<std::string>& names) -> std::vector<std::string> {
    std::vector<std::string> out = names;
    std::unordered_set<std::string> seen;
    std::vector<std::size_t> dups;
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (!seen.insert(out[i]).second) {
            dups.push_back(i);
        }
    }
    for (auto i : dups) {
        for (std::size_t k = 1;; ++k) {
            auto candidate = fmt::format("{}_{}", out[i], k);
            if (seen.insert(candidate).second) {
                out[i] = std::move(candidate);
                break;
            }
        }
    }
    return out;
}

// ─── Vertical ─────────────────────────────────────────────────────────────────

auto vconcat(const std::vector<Table>& tables) -> Table {
    if (tables.empty()) {
        return Table{};
    }
    if (tables.size() == 1) {
        return tables.front();
    }

    // Union of names by first appearance, with the promoted type of each.
    std::vector<std::string> names;
    std::unordered_map<std::string, ElementType> types;
    for (const auto& t : tables) {
        for (std::size_t j = 0; j < t.column_count(); ++j) {
            const auto& name = t.index().name(j);
            auto type = column_type(*t.columns()[j]);
            auto [it, inserted] = types.try_emplace(name, type);
            if (inserted) {
                names.push_back(name);
            } else {
                it->second = promote(it->second, type);
            }
        }
    }

    std::vector<ColumnPtr> columns;
    columns.reserve(names.size());
    for (const auto& name : names) {
        const auto type = types.at(name);
        std::vector<ColumnValue> fills;
        std::vector<const ColumnValue*> parts;
        fills.reserve(tables.size());
        parts.reserve(tables.size());
        for (const auto& t : tables) {
            if (auto pos = t.index().find(name)) {
                parts.push_back(t.columns()[*pos].get());
            } else {
                fills.push_back(make_na_column(type, t.row_count()));
                parts.push_back(&fills.back());
            }
        }
        columns.push_back(std::make_shared<ColumnValue>(concat_columns(parts)));
    }

    spdlog::debug("vconcat: {} tables -> {} columns", tables.size(), names.size());
    return unwrap(Table::make(std::move(columns), ColumnIndex(std::move(names)),
                              tables.front().config()));
}

auto vconcat(const Table& top, const Table& bottom) -> Table {
    return vconcat(std::vector<Table>{top, bottom});
}

// ─── Horizontal ───────────────────────────────────────────────────────────────

auto hconcat(const std::vector<Table>& tables) -> Table {
    if (tables.empty()) {
        return Table{};
    }
    std::vector<ColumnPtr> columns;
    std::vector<std::string> names;
    const Table* first = nullptr;
    for (const auto& t : tables) {
        if (t.empty()) {
            continue;
        }
        if (first == nullptr) {
            first = &t;
        } else if (t.row_count() != first->row_count()) {
            throw TableError(Error{.kind = ErrorKind::LengthMismatch,
                                   .message = fmt::format("cannot hconcat tables with {} and {} "
                                                          "rows",
                                                          first->row_count(), t.row_count())});
        }
        columns.insert(columns.end(), t.columns().begin(), t.columns().end());
        names.insert(names.end(), t.names().begin(), t.names().end());
    }
    return unwrap(Table::make(std::move(columns), ColumnIndex(make_unique_names(names)),
                              tables.front().config()));
}

auto hconcat(const Table& left, const Table& right) -> Table {
    return hconcat(std::vector<Table>{left, right});
}

auto hconcat(const Table& left, const ColumnValue& column) -> Table {
    Table out = left;
    out.set(out.column_count(), column);
    return out;
}

auto hconcat(const Table& left, const Value& value) -> Table {
    Table out = left;
    out.set(out.column_count(), value);
    return out;
}

}  // namespace tabula::ops
