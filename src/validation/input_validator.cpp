/// @file src/validation/input_validator.cpp
/// @brief Input Validator — table shape, numeric columns, weights, impacts.

#include "topsis/validator.hpp"
#include "topsis/data_loader.hpp"
#include "topsis/error.hpp"

#include <fmt/core.h>

namespace topsis::validation {

// ─── InputValidator::validate (path) ──────────────────────────────────────────

void InputValidator::validate(const std::string& table_path,
                              std::span<const double> weights,
                              std::span<const std::string> impacts,
                              char delimiter) {
    // Throws MissingFile / MalformedTable.
    const RawTable table = core::DataLoader::load_csv(table_path, delimiter);
    validate(table, weights, impacts);
}

// ─── InputValidator::validate (table) ─────────────────────────────────────────

void InputValidator::validate(const RawTable& table,
                              std::span<const double> weights,
                              std::span<const std::string> impacts) {
    const std::size_t n_cols = table.column_count();
    if (n_cols < constants::MIN_TABLE_COLUMNS) {
        throw TopsisError(ErrorKind::InsufficientColumns,
            fmt::format("the input file must have at least {} columns (Name + Criteria), found {}",
                        constants::MIN_TABLE_COLUMNS, n_cols));
    }

    if (table.row_count() == 0) {
        throw TopsisError(ErrorKind::MalformedTable,
                          "the input file has a header but no data rows");
    }

    // Full-column numeric check; the parsed matrix itself is discarded.
    (void)core::DataLoader::to_decision_matrix(table);

    const std::size_t n_criteria = n_cols - 1;
    if (weights.size() != impacts.size() || weights.size() != n_criteria) {
        throw TopsisError(ErrorKind::DimensionMismatch,
            fmt::format("the number of weights ({}), impacts ({}) and numeric columns ({}) "
                        "must be the same",
                        weights.size(), impacts.size(), n_criteria));
    }

    for (std::size_t i = 0; i < impacts.size(); ++i) {
        if (!impact_from_symbol(impacts[i])) {
            throw TopsisError(ErrorKind::InvalidImpact,
                fmt::format("impact '{}' at position {} is invalid; impacts must be '{}' or '{}'",
                            impacts[i], i + 1,
                            constants::BENEFIT_SYMBOL, constants::COST_SYMBOL));
        }
    }
}

}  // namespace topsis::validation
