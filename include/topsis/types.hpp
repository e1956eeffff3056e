#pragma once

/// @file include/topsis/types.hpp
/// @brief Shared value types for the TOPSIS decision-analysis pipeline.
///
/// Every pipeline stage takes its inputs by const-reference and returns a new
/// value. Nothing here is mutated after construction, and no stage keeps a
/// buffer shared with another.
///
/// Matrix layout: one row per alternative, one column per criterion.

#include "topsis/constants.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topsis {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Alternatives × criteria matrix of doubles.
using Matrix = Eigen::MatrixXd;

/// Column vector; one entry per alternative or per criterion depending on use.
using Vector = Eigen::VectorXd;

// ─── Impact ───────────────────────────────────────────────────────────────────

/// Direction of preference for one criterion column.
enum class Impact {
    Benefit,  ///< Higher values are better ('+')
    Cost,     ///< Lower values are better ('-')
};

/// Convert an Impact to its command-line symbol.
[[nodiscard]] constexpr std::string_view to_symbol(Impact impact) noexcept {
    return impact == Impact::Benefit ? constants::BENEFIT_SYMBOL
                                     : constants::COST_SYMBOL;
}

/// Map a command-line symbol to an Impact.
///
/// Only the exact symbols "+" and "-" are accepted: no surrounding
/// whitespace, no words, no case folding.
[[nodiscard]] constexpr std::optional<Impact>
impact_from_symbol(std::string_view symbol) noexcept {
    if (symbol == constants::BENEFIT_SYMBOL) return Impact::Benefit;
    if (symbol == constants::COST_SYMBOL)    return Impact::Cost;
    return std::nullopt;
}

// ─── Tables ───────────────────────────────────────────────────────────────────

/// A delimited table as read from disk: header plus rows of verbatim cells.
///
/// Column 0 is the identifier; columns 1..N are criteria. Every row has
/// exactly `header.size()` cells.
struct RawTable {
    std::vector<std::string>              header;
    std::vector<std::vector<std::string>> rows;

    [[nodiscard]] std::size_t column_count() const noexcept { return header.size(); }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows.size(); }
};

/// The typed view of a RawTable: identifiers kept aside, criteria parsed.
struct DecisionMatrix {
    std::vector<std::string> identifiers;  ///< Column 0, input row order
    Matrix                   criteria;     ///< rows × N criterion values
};

// ─── Pipeline Stage Outputs ───────────────────────────────────────────────────

/// Positive and negative ideal solutions, one entry per criterion.
struct IdealSolutions {
    Vector positive;  ///< PIS: best achievable weighted value per criterion
    Vector negative;  ///< NIS: worst achievable weighted value per criterion
};

/// Euclidean separation of each alternative from the ideal solutions.
struct Separations {
    Vector to_positive;  ///< distance to PIS, one entry per alternative
    Vector to_negative;  ///< distance to NIS, one entry per alternative
};

/// Every intermediate and final output of one TOPSIS evaluation.
struct TopsisResult {
    Matrix                   normalized;   ///< column-wise L2-normalized criteria
    Matrix                   weighted;     ///< normalized × weights
    IdealSolutions           ideals;
    Separations              separations;
    Vector                   scores;       ///< closeness coefficient per alternative
    std::vector<std::size_t> ranks;        ///< 1 = best, input row order
};

} // namespace topsis
