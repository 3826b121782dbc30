#pragma once

#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>

#include <iostream>
#include <string>

namespace tabula::ops {

/// Text form of one cell: NA prints as "NA", doubles use {:g}.
[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Aligned plain-text dump: header, separator, one line per row.
void print(const Table& table, std::ostream& out = std::cout);

}  // namespace tabula::ops
