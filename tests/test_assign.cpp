#include <tabula/core/indexing.hpp>
#include <tabula/core/table.hpp>

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

auto make_sample() -> Table {
    return Table::from_columns({
        {"a", Column<std::int64_t>{1, 2, 3}},
        {"b", Column<double>{0.5, 1.5, 2.5}},
        {"c", Column<std::string>{"x", "y", "z"}},
    });
}

auto ints(const ColumnValue& column) -> std::vector<std::int64_t> {
    const auto* values = std::get_if<Column<std::int64_t>>(&column);
    REQUIRE(values != nullptr);
    return values->values();
}

}  // namespace

TEST_CASE("column writes grow an empty table", "[core][assign]") {
    Table t;

    t.set("x", Value{5});
    REQUIRE(t.row_count() == 1);
    REQUIRE(t.column_count() == 1);
    REQUIRE(t.at(0, "x") == Value{5});

    SECTION("a longer column cannot join a one-row table") {
        auto kind = error_kind([&] { t.set("y", Column<std::int64_t>{1, 2, 3}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("replacing the sole column may change the row count") {
        t.set("x", Column<std::int64_t>{1, 2, 3});
        REQUIRE(t.row_count() == 3);
        t.set("y", Column<std::int64_t>{4, 5, 6});
        REQUIRE(t.column_count() == 2);
    }

    SECTION("the first column of an empty table sets the row count") {
        Table fresh;
        fresh.set("v", Column<double>{1.0, 2.0});
        REQUIRE(fresh.row_count() == 2);
    }
}

TEST_CASE("single-column writes", "[core][assign]") {
    auto t = make_sample();

    SECTION("reassigning a column with itself changes nothing") {
        auto before = t.column_ptr("b");
        t.set("b", t.column("b"));
        REQUIRE(t.names() == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(t.at(2, "b") == Value{2.5});
        REQUIRE(before != t.column_ptr("b"));
    }

    SECTION("a scalar broadcasts to every row") {
        t.set("d", Value{"k"});
        REQUIRE(t.column_count() == 4);
        REQUIRE(t.at(2, "d") == Value{"k"});
        REQUIRE(tabula::column_type(t.column("d")) == ElementType::String);
    }

    SECTION("a column replaces by position") {
        t.set(0, Column<std::int64_t>{7, 8, 9});
        REQUIRE(ints(t.column("a")) == std::vector<std::int64_t>{7, 8, 9});
    }

    SECTION("a one-column table shares its storage") {
        auto source = Table::from_columns({{"q", Column<std::int64_t>{0, 0, 0}}});
        t.set("a", source);
        REQUIRE(t.column_ptr("a") == source.column_ptr("q"));
    }

    SECTION("a wider table is rejected") {
        auto kind = error_kind([&] { t.set("a", t.select({"a", "b"})); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("wrong length") {
        auto kind = error_kind([&] { t.set("d", Column<std::int64_t>{1}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("a position equal to the column count appends with a generated name") {
        t.set(3, Value{0});
        REQUIRE(t.names().back() == "x4");
    }

    SECTION("a position past the end is not contiguous") {
        auto kind = error_kind([&] { t.set(5, Value{0}); });
        REQUIRE(kind == ErrorKind::NonContiguousInsert);
    }

    SECTION("removing by position then writing at the end generates a fresh name") {
        t.remove(1);
        REQUIRE(t.names() == std::vector<std::string>{"a", "c"});
        t.set(2, Value{1.0});
        REQUIRE(t.names() == std::vector<std::string>{"a", "c", "x3"});
    }

    SECTION("erase deletes") {
        t.set("b", tabula::erase);
        REQUIRE(t.names() == std::vector<std::string>{"a", "c"});
    }

    SECTION("erasing an unknown column fails") {
        auto kind = error_kind([&] { t.set("zz", tabula::erase); });
        REQUIRE(kind == ErrorKind::UnknownColumn);
    }
}

TEST_CASE("multi-column writes", "[core][assign]") {
    auto t = make_sample();

    SECTION("a scalar gives each target its own column") {
        t.set({"p", "q"}, Value{1});
        REQUIRE(t.column_count() == 5);
        REQUIRE(t.column_ptr("p") != t.column_ptr("q"));
        t.set(0, "p", Value{9});
        REQUIRE(t.at(0, "q") == Value{1});
    }

    SECTION("a table assigns column by column") {
        auto source = t.select({"c", "a"});
        t.set({"a", "c"}, source);
        REQUIRE(t.at(0, "a") == Value{"x"});
        REQUIRE(t.at(0, "c") == Value{1});
    }

    SECTION("a table of the wrong width is rejected") {
        auto source = t.select({"a"});
        auto kind = error_kind([&] { t.set({"a", "b"}, source); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("a mask erases the selected columns") {
        t.set(std::vector<bool>{true, false, true}, tabula::erase);
        REQUIRE(t.names() == std::vector<std::string>{"b"});
    }

    SECTION("remove with repeated keys deletes once") {
        t.remove({"a", "a", 2});
        REQUIRE(t.names() == std::vector<std::string>{"b"});
    }
}

TEST_CASE("single-cell writes", "[core][assign]") {
    auto t = make_sample();

    SECTION("a fitting value is stored") {
        t.set(1, "a", Value{20});
        REQUIRE(t.at(1, "a") == Value{20});
    }

    SECTION("a convertible value is stored after conversion") {
        t.set(1, "b", Value{4});
        REQUIRE(t.at(1, "b") == Value{4.0});
    }

    SECTION("a value the column cannot hold becomes NA") {
        t.set(1, "a", Value{"text"});
        REQUIRE(t.at(1, "a").is_na());
        REQUIRE(tabula::column_type(t.column("a")) == ElementType::Int);
    }

    SECTION("a length-1 column is unwrapped") {
        t.set(2, "a", Column<std::int64_t>{42});
        REQUIRE(t.at(2, "a") == Value{42});
    }

    SECTION("a longer column is a shape error") {
        auto kind = error_kind([&] { t.set(2, "a", Column<std::int64_t>{1, 2}); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("erase is a shape error") {
        auto kind = error_kind([&] { t.set(0, "a", tabula::erase); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("row out of bounds") {
        auto kind = error_kind([&] { t.set(3, "a", Value{1}); });
        REQUIRE(kind == ErrorKind::OutOfBounds);
    }

    SECTION("unknown column") {
        auto kind = error_kind([&] { t.set(0, "zz", Value{1}); });
        REQUIRE(kind == ErrorKind::UnknownColumn);
    }

    SECTION("a one-row table replaces the column") {
        auto single = Table::from_columns({{"a", Column<std::int64_t>{1}}});
        single.set(0, "a", Value{"now a string"});
        REQUIRE(tabula::column_type(single.column("a")) == ElementType::String);
        single.set(0, "b", Value{2.5});
        REQUIRE(single.names() == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("row slice writes", "[core][assign]") {
    auto t = make_sample();

    SECTION("a scalar goes to every target") {
        t.set(0, {"a", "b"}, Value{0});
        REQUIRE(t.at(0, "a") == Value{0});
        REQUIRE(t.at(0, "b") == Value{0.0});
    }

    SECTION("a column is distributed across the targets") {
        t.set(2, {"a", "c"}, Column<Value>{Value{30}, Value{"w"}});
        REQUIRE(t.at(2, "a") == Value{30});
        REQUIRE(t.at(2, "c") == Value{"w"});
    }

    SECTION("a column of the wrong length") {
        auto kind = error_kind([&] { t.set(2, {"a", "c"}, Column<std::int64_t>{1}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("a one-row table copies its cells") {
        auto source = t.select(0, {"a", "b"});
        t.set(2, {"a", "b"}, source);
        REQUIRE(t.at(2, "a") == Value{1});
        REQUIRE(t.at(2, "b") == Value{0.5});
    }

    SECTION("table targets must exist") {
        auto source = t.select(0, {"a", "b"});
        auto kind = error_kind([&] { t.set(2, {"a", "nope"}, source); });
        REQUIRE(kind == ErrorKind::NonExistentTarget);
    }

    SECTION("a multi-row table is a shape error") {
        auto source = t.select({0, 1}, {"a", "b"});
        auto kind = error_kind([&] { t.set(2, {"a", "b"}, source); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }
}

TEST_CASE("range writes", "[core][assign]") {
    auto t = make_sample();

    SECTION("a scalar fills the rows") {
        t.set({0, 2}, "a", Value{-1});
        REQUIRE(ints(t.column("a")) == std::vector<std::int64_t>{-1, 2, -1});
    }

    SECTION("a mismatched scalar degrades the targeted cells") {
        t.set({0, 1}, "a", Value{0.5});
        REQUIRE(t.at(0, "a").is_na());
        REQUIRE(t.at(1, "a").is_na());
        REQUIRE(t.at(2, "a") == Value{3});
    }

    SECTION("a column scatters element-wise") {
        t.set(std::vector<bool>{true, false, true}, "c", Column<std::string>{"p", "q"});
        REQUIRE(t.at(0, "c") == Value{"p"});
        REQUIRE(t.at(2, "c") == Value{"q"});
    }

    SECTION("a column of the wrong length") {
        auto kind = error_kind([&] { t.set({0, 1}, "a", Column<std::int64_t>{1}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("a block takes a table of the same shape") {
        auto source = t.select({1, 2}, {"a", "b"});
        t.set({0, 1}, {"a", "b"}, source);
        REQUIRE(ints(t.column("a")) == std::vector<std::int64_t>{2, 3, 3});
        REQUIRE(t.at(1, "b") == Value{2.5});
    }

    SECTION("a block with a table of the wrong row count") {
        auto source = t.select({0}, {"a", "b"});
        auto kind = error_kind([&] { t.set({0, 1}, {"a", "b"}, source); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }

    SECTION("a block with a table of the wrong width") {
        auto source = t.select({0, 1}, {"a"});
        auto kind = error_kind([&] { t.set({0, 1}, {"a", "b"}, source); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("range writes never add columns") {
        auto kind = error_kind([&] { t.set({0, 1}, "new", Value{1}); });
        REQUIRE(kind == ErrorKind::NonExistentTarget);
    }

    SECTION("range writes reject erase") {
        auto kind = error_kind([&] { t.set(tabula::all, "a", tabula::erase); });
        REQUIRE(kind == ErrorKind::ShapeMismatch);
    }

    SECTION("rows out of bounds") {
        auto kind = error_kind([&] { t.set({0, 5}, "a", Value{1}); });
        REQUIRE(kind == ErrorKind::OutOfBounds);
    }

    SECTION("a wrong-length row mask") {
        auto kind = error_kind([&] { t.set(std::vector<bool>{true}, "a", Value{1}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }
}

TEST_CASE("write and read return errors instead of throwing", "[core][assign]") {
    auto t = make_sample();

    auto result = tabula::write(t, tabula::SingleCell{9, "a"}, Value{1});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::OutOfBounds);

    auto slice = tabula::read(t, tabula::ColumnSlice{{2, 0}, "a"});
    REQUIRE(slice.has_value());
    REQUIRE(ints(std::get<ColumnValue>(*slice)) == std::vector<std::int64_t>{3, 1});
}

TEST_CASE("negative positions leave the table untouched", "[core][assign]") {
    auto t = make_sample();
    const auto names = t.names();

    REQUIRE(error_kind([&] { t.set(-1, Value{5}); }) == ErrorKind::UnknownColumn);
    REQUIRE(error_kind([&] { t.set(-1, "a", Value{5}); }) == ErrorKind::OutOfBounds);
    REQUIRE(t.names() == names);
}
