#include <tabula/core/indexing.hpp>
#include <tabula/core/table.hpp>
#include <tabula/core/view.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <numeric>

namespace tabula {

namespace {

auto share(std::vector<ColumnValue> columns) -> std::vector<ColumnPtr> {
    std::vector<ColumnPtr> out;
    out.reserve(columns.size());
    for (auto& col : columns) {
        out.push_back(std::make_shared<ColumnValue>(std::move(col)));
    }
    return out;
}

auto to_positions(const RowTarget& target) -> std::vector<std::size_t> {
    if (const auto* single = std::get_if<std::size_t>(&target)) {
        return {*single};
    }
    return std::get<std::vector<std::size_t>>(target);
}

auto check_rows(std::span<const std::size_t> rows, std::size_t row_count) -> Result<void> {
    for (auto row : rows) {
        if (row >= row_count) {
            return make_error(ErrorKind::OutOfBounds,
                              fmt::format("row {} out of bounds for {} rows", row, row_count));
        }
    }
    return {};
}

}  // namespace

Table::Table(std::vector<ColumnPtr> columns, ColumnIndex index, TableConfig config) {
    *this = unwrap(make(std::move(columns), std::move(index), std::move(config)));
}

Table::Table(std::vector<ColumnValue> columns, std::vector<std::string> names,
             TableConfig config)
    : Table(share(std::move(columns)), ColumnIndex(std::move(names)), std::move(config)) {}

Table::Table(std::vector<ColumnValue> columns, TableConfig config) {
    auto names = generate_names(columns.size(), config.name_prefix);
    *this = Table(std::move(columns), std::move(names), std::move(config));
}

auto Table::make(std::vector<ColumnPtr> columns, ColumnIndex index, TableConfig config)
    -> Result<Table> {
    if (index.size() != columns.size()) {
        return make_error(ErrorKind::IndexMismatch,
                          fmt::format("index has {} names but {} columns were given",
                                      index.size(), columns.size()));
    }
    for (std::size_t i = 1; i < columns.size(); ++i) {
        if (column_size(*columns[i]) != column_size(*columns[0])) {
            return make_error(ErrorKind::LengthMismatch,
                              fmt::format("column '{}' has length {} but '{}' has length {}",
                                          index.name(i), column_size(*columns[i]),
                                          index.name(0), column_size(*columns[0])));
        }
    }
    Table table;
    table.columns_ = std::move(columns);
    table.index_ = std::move(index);
    table.config_ = std::move(config);
    return table;
}

auto Table::from_columns(std::vector<std::pair<std::string, ColumnValue>> columns,
                         TableConfig config) -> Table {
    std::vector<ColumnValue> values;
    std::vector<std::string> names;
    values.reserve(columns.size());
    names.reserve(columns.size());
    for (auto& [name, column] : columns) {
        names.push_back(std::move(name));
        values.push_back(std::move(column));
    }
    return Table(std::move(values), std::move(names), std::move(config));
}

auto Table::with_na(std::size_t rows, std::size_t cols, TableConfig config) -> Table {
    std::vector<ColumnValue> columns;
    columns.reserve(cols);
    for (std::size_t i = 0; i < cols; ++i) {
        columns.push_back(make_na_column(config.default_type, rows));
    }
    return Table(std::move(columns), std::move(config));
}

auto Table::with_types(const std::vector<ElementType>& types, std::vector<std::string> names,
                       std::size_t rows, TableConfig config) -> Table {
    if (types.size() != names.size()) {
        throw TableError(Error{.kind = ErrorKind::IndexMismatch,
                               .message = fmt::format("{} types given for {} names",
                                                      types.size(), names.size())});
    }
    std::vector<ColumnValue> columns;
    columns.reserve(types.size());
    for (auto type : types) {
        columns.push_back(make_na_column(type, rows));
    }
    return Table(std::move(columns), std::move(names), std::move(config));
}

auto Table::row_count() const noexcept -> std::size_t {
    if (columns_.empty()) {
        return 0;
    }
    return column_size(*columns_.front());
}

auto Table::types() const -> std::vector<ElementType> {
    std::vector<ElementType> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) {
        out.push_back(column_type(*col));
    }
    return out;
}

auto Table::column(const ColumnKey& key) const -> const ColumnValue& {
    return *columns_[unwrap(index_.position(key))];
}

auto Table::column_ptr(const ColumnKey& key) const -> ColumnPtr {
    return columns_[unwrap(index_.position(key))];
}

auto Table::at(std::size_t row, const ColumnKey& key) const -> Value {
    return std::get<Value>(get(row, key));
}

auto Table::select(const ColumnSelector& columns) const -> Table {
    auto target = unwrap(normalize(columns, index_));
    if (auto* key = std::get_if<ColumnKey>(&target)) {
        target = std::vector<ColumnKey>{*key};
    }
    return std::get<Table>(unwrap(read(*this, classify(std::move(target)))));
}

auto Table::select(const RowSelector& rows, const ColumnSelector& columns) const -> Table {
    auto row_target = unwrap(normalize(rows, row_count()));
    auto column_target = unwrap(normalize(columns, index_));
    if (auto* key = std::get_if<ColumnKey>(&column_target)) {
        column_target = std::vector<ColumnKey>{*key};
    }
    if (auto* single = std::get_if<std::size_t>(&row_target)) {
        row_target = std::vector<std::size_t>{*single};
    }
    return std::get<Table>(
        unwrap(read(*this, classify(std::move(row_target), std::move(column_target)))));
}

auto Table::gather(const RowSelector& rows, const ColumnKey& key) const -> ColumnValue {
    auto row_target = unwrap(normalize(rows, row_count()));
    auto positions = to_positions(row_target);
    return std::get<ColumnValue>(
        unwrap(read(*this, ColumnSlice{std::move(positions), key})));
}

auto Table::get(const ColumnSelector& columns) const -> Selection {
    return unwrap(read(*this, unwrap(make_selector(columns, index_))));
}

auto Table::get(const RowSelector& rows, const ColumnSelector& columns) const -> Selection {
    return unwrap(read(*this, unwrap(make_selector(rows, columns, index_, row_count()))));
}

void Table::set(const ColumnSelector& columns, const Assignment& value) {
    unwrap(write(*this, unwrap(make_selector(columns, index_)), value));
}

void Table::set(const RowSelector& rows, const ColumnSelector& columns, const Assignment& value) {
    unwrap(write(*this, unwrap(make_selector(rows, columns, index_, row_count())), value));
}

void Table::remove(const ColumnSelector& columns) {
    auto target = unwrap(normalize(columns, index_));
    if (auto* key = std::get_if<ColumnKey>(&target)) {
        unwrap(write(*this, SingleColumn{*key}, Assignment{erase}));
        return;
    }
    unwrap(write(*this, MultiColumn{std::get<std::vector<ColumnKey>>(std::move(target))},
                 Assignment{erase}));
}

void Table::rename(const ColumnKey& key, std::string new_name) {
    unwrap(index_.rename(key, std::move(new_name)));
}

void Table::set_names(std::vector<std::string> names) {
    unwrap(index_.set_names(std::move(names)));
}

void Table::clean_names() {
    std::vector<std::string> cleaned;
    cleaned.reserve(column_count());
    for (const auto& name : index_.names()) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        auto first = std::find_if_not(name.begin(), name.end(), is_space);
        auto last = std::find_if_not(name.rbegin(), std::make_reverse_iterator(first), is_space)
                        .base();
        std::string out(first, last);
        for (auto& c : out) {
            if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
                c = '_';
            }
        }
        cleaned.push_back(std::move(out));
    }
    unwrap(index_.set_names(std::move(cleaned)));
}

void Table::insert(std::size_t position, std::string name, const Assignment& value) {
    ColumnPtr column = std::visit(
        [&](const auto& v) -> ColumnPtr {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, Value>) {
                std::size_t length = columns_.empty() ? 1 : row_count();
                return std::make_shared<ColumnValue>(
                    make_filled_column(v, length, config_.default_type));
            } else if constexpr (std::is_same_v<V, ColumnValue>) {
                return std::make_shared<ColumnValue>(v);
            } else if constexpr (std::is_same_v<V, Table>) {
                if (v.column_count() != 1) {
                    throw TableError(
                        Error{.kind = ErrorKind::ShapeMismatch,
                              .message = fmt::format("cannot insert a table of {} columns as "
                                                     "one column",
                                                     v.column_count())});
                }
                return v.columns().front();
            } else {
                throw TableError(Error{.kind = ErrorKind::ShapeMismatch,
                                       .message = "cannot insert an erase marker"});
            }
        },
        value);
    unwrap(insert_slot(position, std::move(name), std::move(column)));
}

void Table::merge(const Table& other) {
    for (std::size_t j = 0; j < other.column_count(); ++j) {
        const auto& name = other.index().name(j);
        if (auto pos = index_.find(name)) {
            unwrap(replace_slot(*pos, other.columns()[j]));
        } else {
            unwrap(append_slot(name, other.columns()[j]));
        }
    }
}

void Table::keep_rows(const RowSelector& rows) {
    auto positions = to_positions(unwrap(normalize(rows, row_count())));
    unwrap(check_rows(positions, row_count()));
    for (auto& col : columns_) {
        col = std::make_shared<ColumnValue>(tabula::gather(*col, positions));
    }
}

void Table::delete_rows(const RowSelector& rows) {
    auto positions = to_positions(unwrap(normalize(rows, row_count())));
    unwrap(check_rows(positions, row_count()));
    std::vector<bool> keep(row_count(), true);
    for (auto row : positions) {
        keep[row] = false;
    }
    keep_rows(RowSelector(std::move(keep)));
}

void Table::drop_incomplete() {
    keep_rows(RowSelector(complete_cases()));
}

auto Table::without(const ColumnSelector& columns) const -> Table {
    Table out = *this;
    out.remove(columns);
    if (out.empty() && !empty()) {
        throw TableError(Error{.kind = ErrorKind::EmptyResult,
                               .message = "removing the selected columns leaves no columns"});
    }
    return out;
}

auto Table::deep_copy() const -> Table {
    Table out = *this;
    for (auto& col : out.columns_) {
        col = std::make_shared<ColumnValue>(*col);
    }
    return out;
}

auto Table::gather_rows(std::span<const std::size_t> rows) const -> Table {
    Table out = *this;
    for (auto& col : out.columns_) {
        col = std::make_shared<ColumnValue>(tabula::gather(*col, rows));
    }
    return out;
}

auto Table::head(std::size_t count) const -> Table {
    std::vector<std::size_t> rows(std::min(count, row_count()));
    std::iota(rows.begin(), rows.end(), std::size_t{0});
    return gather_rows(rows);
}

auto Table::tail(std::size_t count) const -> Table {
    std::size_t n = std::min(count, row_count());
    std::vector<std::size_t> rows(n);
    std::iota(rows.begin(), rows.end(), row_count() - n);
    return gather_rows(rows);
}

auto Table::flipped() const -> Table {
    std::vector<std::size_t> rows(row_count());
    std::iota(rows.rbegin(), rows.rend(), std::size_t{0});
    return gather_rows(rows);
}

auto Table::complete_cases() const -> std::vector<bool> {
    std::vector<bool> out(row_count(), true);
    for (const auto& col : columns_) {
        for (std::size_t i = 0; i < out.size(); ++i) {
            if (out[i] && is_na(*col, i)) {
                out[i] = false;
            }
        }
    }
    return out;
}

auto Table::view(const RowSelector& rows) -> TableView {
    return TableView(*this, to_positions(unwrap(normalize(rows, row_count()))));
}

auto Table::row(std::size_t position) -> RowView {
    return RowView(*this, position);
}

auto Table::check_length(std::size_t length) const -> Result<void> {
    if (!columns_.empty() && length != row_count()) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("column of length {} does not match {} rows", length,
                                      row_count()));
    }
    return {};
}

auto Table::replace_slot(std::size_t position, ColumnPtr column) -> Result<void> {
    if (position >= columns_.size()) {
        return make_error(ErrorKind::UnknownColumn,
                          fmt::format("column position {} out of range for {} columns",
                                      position, columns_.size()));
    }
    if (columns_.size() > 1) {
        if (auto ok = check_length(column_size(*column)); !ok) {
            return ok;
        }
    }
    columns_[position] = std::move(column);
    return {};
}

auto Table::append_slot(std::string name, ColumnPtr column) -> Result<void> {
    return insert_slot(columns_.size(), std::move(name), std::move(column));
}

auto Table::insert_slot(std::size_t position, std::string name, ColumnPtr column)
    -> Result<void> {
    if (auto ok = check_length(column_size(*column)); !ok) {
        return ok;
    }
    if (auto ok = index_.insert_at(position, std::move(name)); !ok) {
        return ok;
    }
    columns_.insert(columns_.begin() + static_cast<std::ptrdiff_t>(position), std::move(column));
    return {};
}

auto Table::erase_slot(std::size_t position) -> Result<void> {
    if (auto ok = index_.remove(position); !ok) {
        return ok;
    }
    columns_.erase(columns_.begin() + static_cast<std::ptrdiff_t>(position));
    return {};
}

}  // namespace tabula
