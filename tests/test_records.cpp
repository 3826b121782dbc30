#include <tabula/ops/format.hpp>
#include <tabula/ops/records.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using tabula::Column;
using tabula::ElementType;
using tabula::Table;
using tabula::Value;
using tabula::ops::Record;

TEST_CASE("from_records builds sorted, promoted columns", "[ops][records]") {
    std::vector<Record> records{
        {{"name", Value{"a"}}, {"qty", Value{1}}},
        {{"qty", Value{2.5}}, {"flag", Value{true}}},
        {{"name", Value{}}, {"qty", Value{3}}},
    };

    auto t = tabula::ops::from_records(records);

    REQUIRE(t.names() == std::vector<std::string>{"flag", "name", "qty"});
    REQUIRE(t.row_count() == 3);
    REQUIRE(t.types() ==
            std::vector<ElementType>{ElementType::Bool, ElementType::String, ElementType::Double});
    REQUIRE(t.at(0, "flag").is_na());
    REQUIRE(t.at(1, "name").is_na());
    REQUIRE(t.at(2, "name").is_na());
    REQUIRE(t.at(0, "qty") == Value{1.0});
}

TEST_CASE("from_records with explicit keys", "[ops][records]") {
    std::vector<Record> records{
        {{"b", Value{"x"}}, {"a", Value{1}}, {"ignored", Value{0}}},
        {{"a", Value{"mixed"}}},
    };

    auto t = tabula::ops::from_records(records, {"b", "a", "none"});

    REQUIRE(t.names() == std::vector<std::string>{"b", "a", "none"});
    REQUIRE(tabula::column_type(t.column("a")) == ElementType::Dynamic);
    REQUIRE(t.at(1, "a") == Value{"mixed"});
    REQUIRE(tabula::column_type(t.column("none")) == ElementType::Dynamic);
    REQUIRE(t.at(0, "none").is_na());
}

TEST_CASE("to_records returns one record per row", "[ops][records]") {
    auto t = Table::from_columns({
        {"k", Column<std::int64_t>({1, 2}, {true, false})},
        {"v", Column<std::string>{"p", "q"}},
    });

    auto records = tabula::ops::to_records(t);

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].at("k") == Value{1});
    REQUIRE(records[1].at("k").is_na());
    REQUIRE(records[1].at("v") == Value{"q"});

    auto back = tabula::ops::from_records(records, {"k", "v"});
    REQUIRE(back.at(0, "k") == Value{1});
    REQUIRE(back.at(1, "k").is_na());
}

TEST_CASE("to_dict maps names to shared columns", "[ops][records]") {
    auto t = Table::from_columns({
        {"k", Column<std::int64_t>{1, 2}},
        {"v", Column<std::string>{"p", "q"}},
    });

    auto dict = tabula::ops::to_dict(t);
    REQUIRE(dict.size() == 2);
    REQUIRE(std::get<tabula::ColumnPtr>(dict.at("k")) == t.column_ptr("k"));

    SECTION("flatten only applies to a single row") {
        auto kept = tabula::ops::to_dict(t, true);
        REQUIRE(std::holds_alternative<tabula::ColumnPtr>(kept.at("v")));

        auto one = t.head(1);
        auto flat = tabula::ops::to_dict(one, true);
        REQUIRE(std::get<Value>(flat.at("k")) == Value{1});
        REQUIRE(std::get<Value>(flat.at("v")) == Value{"p"});
    }
}

TEST_CASE("to_matrix is row-major", "[ops][records]") {
    auto t = Table::from_columns({
        {"k", Column<std::int64_t>({1, 2, 3}, {true, false, true})},
        {"v", Column<std::string>{"p", "q", "r"}},
    });

    auto cells = tabula::ops::to_matrix(t);

    REQUIRE(cells.size() == 3);
    REQUIRE(cells[0] == std::vector<Value>{Value{1}, Value{"p"}});
    REQUIRE(cells[1][0].is_na());
    REQUIRE(cells[2][1] == Value{"r"});
    REQUIRE(tabula::ops::to_matrix(Table{}).empty());
}

TEST_CASE("from_records on no records", "[ops][records]") {
    auto t = tabula::ops::from_records({});
    REQUIRE(t.empty());
}

TEST_CASE("format_value", "[ops][format]") {
    using tabula::ops::format_value;

    REQUIRE(format_value(Value{}) == "NA");
    REQUIRE(format_value(Value{true}) == "true");
    REQUIRE(format_value(Value{42}) == "42");
    REQUIRE(format_value(Value{2.5}) == "2.5");
    REQUIRE(format_value(Value{"s"}) == "s");
    REQUIRE(format_value(Value{std::numeric_limits<double>::infinity()}) == "inf");
}

TEST_CASE("print writes a header and one line per row", "[ops][format]") {
    auto t = Table::from_columns({
        {"id", Column<std::int64_t>({1, 22}, {true, false})},
        {"name", Column<std::string>{"a", "bb"}},
    });

    std::ostringstream out;
    tabula::ops::print(t, out);
    auto text = out.str();

    REQUIRE(text.find("id") != std::string::npos);
    REQUIRE(text.find("name") != std::string::npos);
    REQUIRE(text.find("NA") != std::string::npos);
    REQUIRE(std::count(text.begin(), text.end(), '\n') == 4);

    std::ostringstream empty;
    tabula::ops::print(Table{}, empty);
    REQUIRE(empty.str() == "(empty table)\n");
}
