#include <tabula/core/table.hpp>
#include <tabula/core/view.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using tabula::Column;
using tabula::ColumnValue;
using tabula::ErrorKind;
using tabula::RowView;
using tabula::Table;
using tabula::TableError;
using tabula::TableView;
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
        {"k", Column<std::int64_t>{10, 20, 30, 40, 50}},
        {"v", Column<std::string>{"a", "b", "c", "d", "e"}},
    });
}

}  // namespace

TEST_CASE("TableView maps rows onto the parent", "[core][view]") {
    auto t = make_sample();
    auto view = t.view({4, 1, 2});

    REQUIRE(view.row_count() == 3);
    REQUIRE(view.column_count() == 2);
    REQUIRE(view.names() == t.names());
    REQUIRE(view.at(0, "k") == Value{50});

    SECTION("column gathers the view rows") {
        auto col = view.column("v");
        const auto& strings = std::get<Column<std::string>>(col);
        REQUIRE(strings.values() == std::vector<std::string>{"e", "b", "c"});
    }

    SECTION("select and materialize copy the view rows") {
        auto sub = view.select({"k"});
        REQUIRE(sub.row_count() == 3);
        auto whole = view.materialize();
        REQUIRE(whole.at(1, "v") == Value{"b"});
        REQUIRE(view.select(2, "v").at(0, "v") == Value{"c"});
    }

    SECTION("cell writes reach the parent") {
        view.set(1, "k", Value{0});
        REQUIRE(t.at(1, "k") == Value{0});
    }

    SECTION("a value the column cannot hold becomes NA in the parent") {
        view.set(0, "k", Value{2.5});
        REQUIRE(t.at(4, "k").is_na());
    }

    SECTION("column writes cover only the view rows") {
        view.set("v", Value{"z"});
        REQUIRE(t.at(0, "v") == Value{"a"});
        REQUIRE(t.at(1, "v") == Value{"z"});
        REQUIRE(t.at(4, "v") == Value{"z"});
    }

    SECTION("views cannot add columns") {
        auto kind = error_kind([&] { view.set("new", Value{1}); });
        REQUIRE(kind == ErrorKind::NonExistentTarget);
    }

    SECTION("sub-views compose positions") {
        auto inner = view.view({2, 0});
        REQUIRE(inner.rows() == std::vector<std::size_t>{2, 4});
        inner.set(0, "v", Value{"q"});
        REQUIRE(t.at(2, "v") == Value{"q"});
    }

    SECTION("view rows out of bounds") {
        auto kind = error_kind([&] { auto v = view.at(3, "k"); });
        REQUIRE(kind == ErrorKind::OutOfBounds);
    }

    SECTION("a view mask is checked against the view's row count") {
        auto sub = view.select(std::vector<bool>{true, false, true}, "k");
        REQUIRE(sub.at(1, "k") == Value{30});
        auto kind = error_kind([&] { auto bad = view.view(std::vector<bool>{true}); });
        REQUIRE(kind == ErrorKind::LengthMismatch);
    }
}

TEST_CASE("views of a one-row table write cells in place", "[core][view]") {
    auto one = Table::from_columns({
        {"a", Column<std::int64_t>{1}},
        {"b", Column<std::string>{"s"}},
    });
    auto view = one.view({0});
    auto row = one.row(0);

    SECTION("an unknown column is not added to the parent") {
        auto kind = error_kind([&] { view.set(0, "zz", Value{5}); });
        REQUIRE(kind == ErrorKind::NonExistentTarget);
        kind = error_kind([&] { row.set("zz", Value{5}); });
        REQUIRE(kind == ErrorKind::NonExistentTarget);
        REQUIRE(one.names() == std::vector<std::string>{"a", "b"});
    }

    SECTION("the column keeps its type and handle") {
        auto handle = one.column_ptr("a");
        view.set(0, "a", Value{2.5});
        REQUIRE(one.column_ptr("a") == handle);
        REQUIRE(tabula::column_type(one.column("a")) == tabula::ElementType::Int);
        REQUIRE(one.at(0, "a").is_na());

        row.set("a", Value{7});
        REQUIRE(one.column_ptr("a") == handle);
        REQUIRE(one.at(0, "a") == Value{7});
    }

    SECTION("a row slice through the view") {
        view.set(0, {"a", "b"}, ColumnValue{Column<Value>{Value{3}, Value{"t"}}});
        REQUIRE(one.at(0, "a") == Value{3});
        REQUIRE(one.at(0, "b") == Value{"t"});
        REQUIRE(one.column_count() == 2);
    }
}

TEST_CASE("TableView rejects rows outside the parent", "[core][view]") {
    auto t = make_sample();
    auto kind = error_kind([&] { auto v = t.view({1, 5}); });
    REQUIRE(kind == ErrorKind::OutOfBounds);
}

TEST_CASE("RowView reads and writes one row", "[core][view]") {
    auto t = make_sample();
    auto row = t.row(2);

    REQUIRE(row.row() == 2);
    REQUIRE(row.size() == 2);
    REQUIRE(row.get("k") == Value{30});
    REQUIRE(row.get(1) == Value{"c"});
    REQUIRE(row.values() == std::vector<Value>{Value{30}, Value{"c"}});

    SECTION("fields pair names with values") {
        auto fields = row.fields();
        REQUIRE(fields.size() == 2);
        REQUIRE(fields[0].first == "k");
        REQUIRE(fields[1].second == Value{"c"});
    }

    SECTION("set writes through to the table") {
        row.set("v", Value{"changed"});
        REQUIRE(t.at(2, "v") == Value{"changed"});
    }

    SECTION("every row reads back cell by cell") {
        for (std::size_t r = 0; r < t.row_count(); ++r) {
            auto single = t.select(r, tabula::all);
            auto fields = t.row(r).fields();
            REQUIRE(single.row_count() == 1);
            REQUIRE(fields.size() == t.column_count());
            for (std::size_t j = 0; j < t.column_count(); ++j) {
                const auto& name = t.names()[j];
                REQUIRE(single.at(0, name) == t.at(r, name));
                REQUIRE(fields[j].second == t.at(r, name));
            }
        }
    }

    SECTION("to_table round trips through a one-row table") {
        auto single = row.to_table();
        REQUIRE(single.row_count() == 1);
        REQUIRE(single.names() == t.names());
        t.set(2, tabula::all, single);
        REQUIRE(t.at(2, "k") == Value{30});
        REQUIRE(t.at(2, "v") == Value{"c"});
    }

    SECTION("restrict narrows the visible columns") {
        auto narrow = row.restrict({"v"});
        REQUIRE(narrow.size() == 1);
        REQUIRE(narrow.names() == std::vector<std::string>{"v"});
        REQUIRE(narrow.get(0) == Value{"c"});
        narrow.set(0, Value{"w"});
        REQUIRE(t.at(2, "v") == Value{"w"});

        auto kind = error_kind([&] { auto v = narrow.get("k"); });
        REQUIRE(kind == ErrorKind::UnknownColumn);
    }

    SECTION("rows out of bounds") {
        auto kind = error_kind([&] { auto r = t.row(5); });
        REQUIRE(kind == ErrorKind::OutOfBounds);
    }

    SECTION("rows of a view address the parent") {
        auto view = t.view({4, 3});
        auto last = view.row(0);
        REQUIRE(last.row() == 4);
        REQUIRE(last.get("v") == Value{"e"});
    }
}
