#include <tabula/ops/records.hpp>

#include <optional>
#include <set>

namespace tabula::ops {

auto from_records(const std::vector<Record>& records, TableConfig config) -> Table {
    std::set<std::string> keys;
    for (const auto& record : records) {
        for (const auto& [name, value] : record) {
            keys.insert(name);
        }
    }
    return from_records(records, std::vector<std::string>(keys.begin(), keys.end()),
                        std::move(config));
}

auto from_records(const std::vector<Record>& records, const std::vector<std::string>& keys,
                  TableConfig config) -> Table {
    std::vector<ColumnValue> columns;
    columns.reserve(keys.size());
    for (const auto& key : keys) {
        std::optional<ElementType> type;
        for (const auto& record : records) {
            auto it = record.find(key);
            if (it != record.end() && !it->second.is_na()) {
                type = promote(type, *it->second.type());
            }
        }
        ColumnValue column = make_na_column(type.value_or(ElementType::Dynamic), records.size());
        for (std::size_t row = 0; row < records.size(); ++row) {
            auto it = records[row].find(key);
            if (it == records[row].end() || it->second.is_na()) {
                continue;
            }
            // The promoted type holds every value that took part in promotion.
            if (!set_value(column, row, it->second)) {
                throw TableError(Error{.kind = ErrorKind::ShapeMismatch,
                                       .message = "record value does not fit its promoted "
                                                  "column type"});
            }
        }
        columns.push_back(std::move(column));
    }
    return Table(std::move(columns), keys, std::move(config));
}

auto to_records(const Table& table) -> std::vector<Record> {
    std::vector<Record> out(table.row_count());
    for (std::size_t j = 0; j < table.column_count(); ++j) {
        const auto& name = table.index().name(j);
        const auto& column = *table.columns()[j];
        for (std::size_t row = 0; row < out.size(); ++row) {
            out[row].emplace(name, get_value(column, row));
        }
    }
    return out;
}

auto to_dict(const Table& table, bool flatten) -> ColumnMap {
    const bool single_row = flatten && table.row_count() == 1;
    ColumnMap out;
    for (std::size_t j = 0; j < table.column_count(); ++j) {
        const auto& handle = table.columns()[j];
        if (single_row) {
            out.emplace(table.index().name(j), get_value(*handle, 0));
        } else {
            out.emplace(table.index().name(j), handle);
        }
    }
    return out;
}

auto to_matrix(const Table& table) -> std::vector<std::vector<Value>> {
    const std::size_t rows = table.row_count();
    std::vector<std::vector<Value>> out(rows, std::vector<Value>(table.column_count()));
    for (std::size_t j = 0; j < table.column_count(); ++j) {
        const auto& column = *table.columns()[j];
        for (std::size_t row = 0; row < rows; ++row) {
            out[row][j] = get_value(column, row);
        }
    }
    return out;
}

}  // namespace tabula::ops
