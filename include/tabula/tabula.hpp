#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/core/column.hpp>
#include <tabula/core/column_index.hpp>
#include <tabula/core/config.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/indexing.hpp>
#include <tabula/core/selector.hpp>
#include <tabula/core/table.hpp>
#include <tabula/core/value.hpp>
#include <tabula/core/view.hpp>
#include <tabula/ops/compare.hpp>
#include <tabula/ops/concat.hpp>
#include <tabula/ops/format.hpp>
#include <tabula/ops/records.hpp>
