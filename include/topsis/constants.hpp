#pragma once

#include <cstddef>
#include <string_view>

/// @file include/topsis/constants.hpp
/// @brief Table-shape and symbol constants for the TOPSIS pipeline.

namespace topsis::constants {

// ─── Table Shape ──────────────────────────────────────────────────────────────

/// Minimum column count of an input table: one identifier column plus at
/// least two criterion columns.
static constexpr std::size_t MIN_TABLE_COLUMNS = 3;

/// Index of the identifier column. Every other column is a criterion.
static constexpr std::size_t IDENTIFIER_COLUMN = 0;

// ─── Symbols ──────────────────────────────────────────────────────────────────

/// Impact symbol for a benefit criterion (higher is better).
static constexpr std::string_view BENEFIT_SYMBOL = "+";

/// Impact symbol for a cost criterion (lower is better).
static constexpr std::string_view COST_SYMBOL = "-";

/// Separator between entries of the weight and impact argument lists.
static constexpr char LIST_SEPARATOR = ',';

/// Default field delimiter for input and output tables.
static constexpr char DEFAULT_DELIMITER = ',';

// ─── Output Columns ───────────────────────────────────────────────────────────

/// Name of the appended score column.
static constexpr std::string_view SCORE_COLUMN = "TOPSIS Score";

/// Name of the appended rank column.
static constexpr std::string_view RANK_COLUMN = "Rank";

} // namespace topsis::constants
