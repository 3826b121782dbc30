#pragma once
// Synthetic table generator for the benchmark harness.
//
// Column j cycles through Int, Double and String element types. Every
// `na_every`-th cell of the Double columns is NA (0 disables NA cells).

#include <tabula/core/column.hpp>
#include <tabula/core/table.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

inline auto gen_table_data(std::int64_t rows, std::int64_t cols, std::int64_t na_every = 0)
    -> tabula::Table {
    if (rows < 0 || cols < 0)
        throw std::invalid_argument("gen_table_data: rows and cols must be non-negative");
    auto n = static_cast<std::size_t>(rows);

    std::vector<std::pair<std::string, tabula::ColumnValue>> columns;
    for (std::int64_t j = 0; j < cols; ++j) {
        auto name = fmt::format("c{}", j);
        switch (j % 3) {
            case 0: {
                tabula::Column<std::int64_t> col;
                col.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    col.push_back(static_cast<std::int64_t>(i % 1000));
                }
                columns.emplace_back(std::move(name), std::move(col));
                break;
            }
            case 1: {
                tabula::Column<double> col;
                col.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    if (na_every > 0 && i % static_cast<std::size_t>(na_every) == 0) {
                        col.push_na();
                    } else {
                        col.push_back(100.0 + static_cast<double>(i % 100));
                    }
                }
                columns.emplace_back(std::move(name), std::move(col));
                break;
            }
            default: {
                tabula::Column<std::string> col;
                col.reserve(n);
                for (std::size_t i = 0; i < n; ++i) {
                    col.push_back(fmt::format("SYM{}", i % 50));
                }
                columns.emplace_back(std::move(name), std::move(col));
                break;
            }
        }
    }
    return tabula::Table::from_columns(std::move(columns));
}
