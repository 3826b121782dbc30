#include <tabula/tabula.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>

auto main() -> int {
    using tabula::Column;

    // Build a table of trades
    auto trades = tabula::Table::from_columns({
        {"symbol", Column<std::string>{"AAPL", "MSFT", "AAPL", "GOOG"}},
        {"price", Column<double>{100.5, 200.3, 101.0, 175.8}},
        {"qty", Column<std::int64_t>{10, 5, 7, 3}},
    });

    fmt::print("=== Table ===\n");
    fmt::print("{} rows x {} columns\n", trades.row_count(), trades.column_count());
    tabula::ops::print(trades);

    // Scalar broadcast into a new column, then a masked row selection
    trades.set("venue", "XNAS");
    auto expensive = trades.select(std::vector<bool>{false, true, false, true}, {"symbol", "price"});
    fmt::print("\n=== price > 150 ===\n");
    tabula::ops::print(expensive);

    // Cell write through a view; a double does not fit an Int column and becomes NA
    auto view = trades.view({0, 2});
    view.set(1, "qty", 2.5);
    fmt::print("\nqty[2] after writing 2.5: {}\n",
               tabula::ops::format_value(trades.at(2, "qty")));

    // Vertical concatenation with a column the first table lacks
    auto extra = tabula::Table::from_columns({
        {"symbol", Column<std::string>{"TSLA"}},
        {"price", Column<std::int64_t>{250}},
        {"side", Column<std::string>{"buy"}},
    });
    auto combined = tabula::ops::vconcat(trades, extra);
    fmt::print("\n=== vconcat ===\n");
    tabula::ops::print(combined);
    fmt::print("price column type: {}\n",
               tabula::to_string(tabula::column_type(combined.column("price"))));

    return 0;
}
