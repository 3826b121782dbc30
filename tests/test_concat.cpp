#include <tabula/ops/compare.hpp>
#include <tabula/ops/concat.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using tabula::Column;
using tabula::ColumnValue;
using tabula::ElementType;
using tabula::ErrorKind;
using tabula::Table;
using tabula::TableError;
using tabula::Value;

namespace {

template <typename F>
auto error_kind(F&& fn) -> std::optional<ErrorKind> {
    try {
        fn();
    } catch (const TableError& e) {
        return e.kind();
    }
    return std::nullopt;
}

}  // namespace

TEST_CASE("vconcat of a single table is the table", "[ops][concat]") {
    auto t = Table::from_columns({{"a", Column<std::int64_t>{1, 2}}});
    auto out = tabula::ops::vconcat(std::vector<Table>{t});
    REQUIRE(tabula::ops::is_equivalent(out, t));
    REQUIRE(tabula::ops::vconcat(std::vector<Table>{}).empty());
}

TEST_CASE("vconcat unions columns and fills gaps with NA", "[ops][concat]") {
    auto first = Table::from_columns({
        {"A", Column<std::int64_t>{1, 2}},
        {"B", Column<std::string>{"p", "q"}},
    });
    auto second = Table::from_columns({
        {"B", Column<std::string>{"r"}},
        {"C", Column<double>{0.5}},
    });

    auto out = tabula::ops::vconcat(first, second);

    REQUIRE(out.names() == std::vector<std::string>{"A", "B", "C"});
    REQUIRE(out.row_count() == 3);
    REQUIRE(out.at(2, "A").is_na());
    REQUIRE(out.at(2, "B") == Value{"r"});
    REQUIRE(out.at(0, "C").is_na());
    REQUIRE(out.at(1, "C").is_na());
    REQUIRE(out.at(2, "C") == Value{0.5});
    REQUIRE(tabula::column_type(out.column("A")) == ElementType::Int);
    REQUIRE(tabula::column_type(out.column("C")) == ElementType::Double);
}

TEST_CASE("vconcat promotes column types", "[ops][concat]") {
    auto ints = Table::from_columns({{"x", Column<std::int64_t>{1}}});
    auto dbls = Table::from_columns({{"x", Column<double>{2.5}}});
    auto strs = Table::from_columns({{"x", Column<std::string>{"s"}}});

    auto numeric = tabula::ops::vconcat(ints, dbls);
    REQUIRE(tabula::column_type(numeric.column("x")) == ElementType::Double);
    REQUIRE(numeric.at(0, "x") == Value{1.0});

    auto mixed = tabula::ops::vconcat(std::vector<Table>{ints, dbls, strs});
    REQUIRE(tabula::column_type(mixed.column("x")) == ElementType::Dynamic);
    REQUIRE(mixed.at(2, "x") == Value{"s"});
}

TEST_CASE("vconcat copies rather than shares storage", "[ops][concat]") {
    auto t = Table::from_columns({{"a", Column<std::int64_t>{1, 2}}});
    auto out = tabula::ops::vconcat(t, t);
    REQUIRE(out.row_count() == 4);
    t.set(0, "a", Value{9});
    REQUIRE(out.at(0, "a") == Value{1});
}

TEST_CASE("hconcat places tables side by side", "[ops][concat]") {
    auto left = Table::from_columns({
        {"A", Column<std::int64_t>{1, 2}},
        {"B", Column<std::int64_t>{3, 4}},
    });
    auto right = Table::from_columns({{"A", Column<std::string>{"u", "v"}}});

    SECTION("repeated names are suffixed") {
        auto out = tabula::ops::hconcat(left, right);
        REQUIRE(out.names() == std::vector<std::string>{"A", "B", "A_1"});
        REQUIRE(out.at(1, "A_1") == Value{"v"});
    }

    SECTION("columns are shared with the inputs") {
        auto out = tabula::ops::hconcat(left, right);
        REQUIRE(out.column_ptr("B") == left.column_ptr("B"));
    }

    SECTION("row counts must match") {
        auto shorter = Table::from_columns({{"C", Column<std::int64_t>{1}}});
        auto kind = error_kind([&] { auto out = tabula::ops::hconcat(left, shorter); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("tables without columns are skipped") {
        auto out = tabula::ops::hconcat(std::vector<Table>{Table{}, left});
        REQUIRE(out.names() == std::vector<std::string>{"A", "B"});
    }

    SECTION("a column is appended under a generated name") {
        auto out = tabula::ops::hconcat(left, ColumnValue{Column<double>{0.1, 0.2}});
        REQUIRE(out.names() == std::vector<std::string>{"A", "B", "x3"});
        REQUIRE(left.column_count() == 2);
    }

    SECTION("a scalar is broadcast") {
        auto out = tabula::ops::hconcat(left, Value{"tag"});
        REQUIRE(out.at(1, "x3") == Value{"tag"});
    }
}

TEST_CASE("hconcat renames only the repeated column", "[ops][concat]") {
    auto first = Table::from_columns({
        {"A", Column<std::int64_t>{1, 2, 3}},
        {"B", Column<std::int64_t>{4, 5, 6}},
    });
    auto second = Table::from_columns({
        {"A", Column<double>{0.1, 0.2, 0.3}},
        {"C", Column<std::string>{"p", "q", "r"}},
    });

    auto out = tabula::ops::hconcat(first, second);

    REQUIRE(out.row_count() == 3);
    REQUIRE(out.names() == std::vector<std::string>{"A", "B", "A_1", "C"});
    REQUIRE(out.at(2, "A") == Value{3});
    REQUIRE(out.at(2, "A_1") == Value{0.3});
}

TEST_CASE("make_unique_names", "[ops][concat]") {
    using tabula::ops::make_unique_names;

    REQUIRE(make_unique_names({"a", "b", "a", "a"}) ==
            std::vector<std::string>{"a", "b", "a_1", "a_2"});
    REQUIRE(make_unique_names({"a", "a_1", "a"}) ==
            std::vector<std::string>{"a", "a_1", "a_2"});
    REQUIRE(make_unique_names({}).empty());
}
