#include <tabula/core/selector.hpp>

#include <fmt/format.h>

#include <numeric>
#include <type_traits>

namespace tabula {

namespace {

auto positions_as_keys(const std::vector<std::size_t>& positions) -> std::vector<ColumnKey> {
    return std::vector<ColumnKey>(positions.begin(), positions.end());
}

}  // namespace

auto normalize(const ColumnSelector& selector, const ColumnIndex& index) -> Result<ColumnTarget> {
    return std::visit(
        [&](const auto& sel) -> Result<ColumnTarget> {
            using T = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<T, ColumnKey> ||
                          std::is_same_v<T, std::vector<ColumnKey>>) {
                return ColumnTarget{sel};
            } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
                auto positions = index.resolve(sel);
                if (!positions) {
                    return std::unexpected(positions.error());
                }
                return ColumnTarget{positions_as_keys(*positions)};
            } else {
                std::vector<std::size_t> positions(index.size());
                std::iota(positions.begin(), positions.end(), std::size_t{0});
                return ColumnTarget{positions_as_keys(positions)};
            }
        },
        selector.storage());
}

auto normalize(const RowSelector& selector, std::size_t row_count) -> Result<RowTarget> {
    return std::visit(
        [&](const auto& sel) -> Result<RowTarget> {
            using T = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<T, std::size_t> ||
                          std::is_same_v<T, std::vector<std::size_t>>) {
                return RowTarget{sel};
            } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
                if (sel.size() != row_count) {
                    return make_error(ErrorKind::LengthMismatch,
                                      fmt::format("row mask has length {} but table has {} rows",
                                                  sel.size(), row_count));
                }
                return RowTarget{mask_positions(sel)};
            } else {
                std::vector<std::size_t> rows(row_count);
                std::iota(rows.begin(), rows.end(), std::size_t{0});
                return RowTarget{std::move(rows)};
            }
        },
        selector.storage());
}

auto classify(ColumnTarget columns) -> Selector {
    if (auto* key = std::get_if<ColumnKey>(&columns)) {
        return SingleColumn{std::move(*key)};
    }
    return MultiColumn{std::get<std::vector<ColumnKey>>(std::move(columns))};
}

auto classify(RowTarget rows, ColumnTarget columns) -> Selector {
    auto* row = std::get_if<std::size_t>(&rows);
    auto* key = std::get_if<ColumnKey>(&columns);
    if (row != nullptr && key != nullptr) {
        return SingleCell{*row, std::move(*key)};
    }
    if (row != nullptr) {
        return RowSlice{*row, std::get<std::vector<ColumnKey>>(std::move(columns))};
    }
    auto row_list = std::get<std::vector<std::size_t>>(std::move(rows));
    if (key != nullptr) {
        return ColumnSlice{std::move(row_list), std::move(*key)};
    }
    return Block{std::move(row_list), std::get<std::vector<ColumnKey>>(std::move(columns))};
}

auto make_selector(const ColumnSelector& columns, const ColumnIndex& index) -> Result<Selector> {
    auto target = normalize(columns, index);
    if (!target) {
        return std::unexpected(target.error());
    }
    return classify(std::move(*target));
}

auto make_selector(const RowSelector& rows, const ColumnSelector& columns,
                   const ColumnIndex& index, std::size_t row_count) -> Result<Selector> {
    auto row_target = normalize(rows, row_count);
    if (!row_target) {
        return std::unexpected(row_target.error());
    }
    auto column_target = normalize(columns, index);
    if (!column_target) {
        return std::unexpected(column_target.error());
    }
    return classify(std::move(*row_target), std::move(*column_target));
}

}  // namespace tabula
