#pragma once

#include <tabula/core/value.hpp>

#include <string>

namespace tabula {

/// Construction-time settings carried by every Table.
struct TableConfig {
    /// Element type used when a column must be created without a typed value:
    /// pre-allocated all-NA tables and NA scalar assignment.
    ElementType default_type = ElementType::Double;
    /// Prefix for auto-generated column names (x1, x2, ...).
    std::string name_prefix = "x";
};

}  // namespace tabula
