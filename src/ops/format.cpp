#include <tabula/ops/format.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace tabula::ops {

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NAType>) {
                return "NA";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return "nan";
                }
                if (std::isinf(v)) {
                    return v > 0 ? "inf" : "-inf";
                }
                return fmt::format("{:g}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v);
            }
        },
        value.storage());
}

namespace {

// Cells left-aligned to their column widths, two spaces apart.
void write_line(std::ostream& out, const std::vector<std::string>& cells,
                const std::vector<std::size_t>& widths) {
    std::string line;
    for (std::size_t c = 0; c < cells.size(); ++c) {
        line += fmt::format("{}{:<{}}", c == 0 ? "" : "  ", cells[c], widths[c]);
    }
    out << line << '\n';
}

}  // namespace

void print(const Table& table, std::ostream& out) {
    if (table.empty()) {
        out << "(empty table)\n";
        return;
    }

    // Line 0 is the header; the separator is inserted once widths are known.
    std::vector<std::vector<std::string>> lines;
    lines.reserve(table.row_count() + 1);
    lines.push_back(table.names());
    for (std::size_t r = 0; r < table.row_count(); ++r) {
        std::vector<std::string> line;
        line.reserve(table.column_count());
        for (const auto& column : table.columns()) {
            line.push_back(format_value(get_value(*column, r)));
        }
        lines.push_back(std::move(line));
    }

    std::vector<std::size_t> widths(table.column_count(), 0);
    for (const auto& line : lines) {
        for (std::size_t c = 0; c < line.size(); ++c) {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    std::vector<std::string> rule;
    rule.reserve(widths.size());
    for (auto width : widths) {
        rule.emplace_back(width, '-');
    }
    lines.insert(lines.begin() + 1, std::move(rule));

    for (const auto& line : lines) {
        write_line(out, line, widths);
    }
}

}  // namespace tabula::ops
