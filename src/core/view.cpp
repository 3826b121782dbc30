#include <tabula/core/indexing.hpp>
#include <tabula/core/view.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace tabula {

namespace {

auto out_of_bounds(std::size_t row, std::size_t row_count) -> TableError {
    return TableError(Error{.kind = ErrorKind::OutOfBounds,
                            .message = fmt::format("row {} out of bounds for {} rows", row,
                                                   row_count)});
}

auto target_keys(ColumnTarget target) -> std::vector<ColumnKey> {
    if (auto* key = std::get_if<ColumnKey>(&target)) {
        return {std::move(*key)};
    }
    return std::get<std::vector<ColumnKey>>(std::move(target));
}

}  // namespace

// ─── TableView ────────────────────────────────────────────────────────────────

TableView::TableView(Table& parent, std::vector<std::size_t> rows)
    : parent_(&parent), rows_(std::move(rows)) {
    const std::size_t row_count = parent_->row_count();
    for (auto row : rows_) {
        if (row >= row_count) {
            throw out_of_bounds(row, row_count);
        }
    }
}

auto TableView::map_rows(const RowSelector& rows) const -> RowTarget {
    auto target = unwrap(normalize(rows, rows_.size()));
    if (auto* single = std::get_if<std::size_t>(&target)) {
        if (*single >= rows_.size()) {
            throw out_of_bounds(*single, rows_.size());
        }
        return rows_[*single];
    }
    auto positions = std::get<std::vector<std::size_t>>(std::move(target));
    for (auto& pos : positions) {
        if (pos >= rows_.size()) {
            throw out_of_bounds(pos, rows_.size());
        }
        pos = rows_[pos];
    }
    return positions;
}

auto TableView::column(const ColumnKey& key) const -> ColumnValue {
    return parent_->gather(rows_, key);
}

auto TableView::at(std::size_t row, const ColumnKey& key) const -> Value {
    if (row >= rows_.size()) {
        throw out_of_bounds(row, rows_.size());
    }
    return parent_->at(rows_[row], key);
}

auto TableView::select(const ColumnSelector& columns) const -> Table {
    return parent_->select(rows_, columns);
}

auto TableView::select(const RowSelector& rows, const ColumnSelector& columns) const -> Table {
    auto target = map_rows(rows);
    if (const auto* single = std::get_if<std::size_t>(&target)) {
        return parent_->select(*single, columns);
    }
    return parent_->select(std::get<std::vector<std::size_t>>(target), columns);
}

void TableView::set(const ColumnSelector& columns, const Assignment& value) {
    parent_->set(rows_, columns, value);
}

void TableView::set(const RowSelector& rows, const ColumnSelector& columns,
                    const Assignment& value) {
    auto target = map_rows(rows);
    if (const auto* single = std::get_if<std::size_t>(&target)) {
        // A single parent row is written in place; the parent's columns stay as they are.
        auto keys = target_keys(unwrap(normalize(columns, parent_->index())));
        unwrap(write_row_in_place(*parent_, *single, keys, value));
        return;
    }
    parent_->set(std::get<std::vector<std::size_t>>(target), columns, value);
}

auto TableView::view(const RowSelector& rows) const -> TableView {
    auto target = map_rows(rows);
    if (const auto* single = std::get_if<std::size_t>(&target)) {
        return TableView(*parent_, {*single});
    }
    return TableView(*parent_, std::get<std::vector<std::size_t>>(std::move(target)));
}

auto TableView::row(std::size_t position) const -> RowView {
    if (position >= rows_.size()) {
        throw out_of_bounds(position, rows_.size());
    }
    return RowView(*parent_, rows_[position]);
}

auto TableView::materialize() const -> Table {
    return parent_->select(rows_, all);
}

// ─── RowView ──────────────────────────────────────────────────────────────────

RowView::RowView(Table& table, std::size_t row) : table_(&table), row_(row) {
    if (row_ >= table_->row_count()) {
        throw out_of_bounds(row_, table_->row_count());
    }
}

RowView::RowView(Table& table, std::size_t row, std::vector<std::size_t> columns)
    : RowView(table, row) {
    for (auto pos : columns) {
        if (pos >= table_->column_count()) {
            throw TableError(Error{.kind = ErrorKind::UnknownColumn,
                                   .message = fmt::format("column position {} out of range "
                                                          "for {} columns",
                                                          pos, table_->column_count())});
        }
    }
    columns_ = std::move(columns);
}

auto RowView::size() const noexcept -> std::size_t {
    return columns_.has_value() ? columns_->size() : table_->column_count();
}

auto RowView::visible_positions() const -> std::vector<std::size_t> {
    if (columns_.has_value()) {
        return *columns_;
    }
    std::vector<std::size_t> positions(table_->column_count());
    std::iota(positions.begin(), positions.end(), std::size_t{0});
    return positions;
}

auto RowView::parent_position(const ColumnKey& key) const -> std::size_t {
    if (!columns_.has_value()) {
        return unwrap(table_->index().position(key));
    }
    if (key.is_position()) {
        if (key.position() >= columns_->size()) {
            throw TableError(Error{.kind = ErrorKind::UnknownColumn,
                                   .message = fmt::format("column position {} out of range "
                                                          "for {} columns",
                                                          key.position(), columns_->size())});
        }
        return (*columns_)[key.position()];
    }
    auto pos = unwrap(table_->index().position(key));
    if (std::find(columns_->begin(), columns_->end(), pos) == columns_->end()) {
        throw TableError(Error{.kind = ErrorKind::UnknownColumn,
                               .message = fmt::format("column '{}' is not part of this row view",
                                                      key.name())});
    }
    return pos;
}

auto RowView::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto pos : visible_positions()) {
        out.push_back(table_->index().name(pos));
    }
    return out;
}

auto RowView::get(const ColumnKey& key) const -> Value {
    return table_->at(row_, parent_position(key));
}

void RowView::set(const ColumnKey& key, const Value& value) {
    ColumnKey target = columns_.has_value() ? ColumnKey(parent_position(key)) : key;
    unwrap(write_row_in_place(*table_, row_, {std::move(target)}, value));
}

auto RowView::values() const -> std::vector<Value> {
    std::vector<Value> out;
    for (auto pos : visible_positions()) {
        out.push_back(table_->at(row_, pos));
    }
    return out;
}

auto RowView::fields() const -> std::vector<std::pair<std::string, Value>> {
    std::vector<std::pair<std::string, Value>> out;
    for (auto pos : visible_positions()) {
        out.emplace_back(table_->index().name(pos), table_->at(row_, pos));
    }
    return out;
}

auto RowView::restrict(const ColumnSelector& columns) const -> RowView {
    auto visible = visible_positions();
    std::vector<std::string> visible_names;
    visible_names.reserve(visible.size());
    for (auto pos : visible) {
        visible_names.push_back(table_->index().name(pos));
    }
    ColumnIndex local(std::move(visible_names));
    auto target = unwrap(normalize(columns, local));
    std::vector<ColumnKey> keys;
    if (auto* key = std::get_if<ColumnKey>(&target)) {
        keys.push_back(std::move(*key));
    } else {
        keys = std::get<std::vector<ColumnKey>>(std::move(target));
    }
    std::vector<std::size_t> positions;
    positions.reserve(keys.size());
    for (auto local_pos : unwrap(local.resolve(keys))) {
        positions.push_back(visible[local_pos]);
    }
    return RowView(*table_, row_, std::move(positions));
}

auto RowView::to_table() const -> Table {
    std::vector<ColumnKey> keys;
    for (auto pos : visible_positions()) {
        keys.emplace_back(pos);
    }
    return table_->select(row_, keys);
}

}  // namespace tabula
