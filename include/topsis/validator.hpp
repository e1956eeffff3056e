#pragma once

/// @file include/topsis/validator.hpp
/// @brief Input Validator — preconditions checked before the engine runs.
///
/// # Module: Input Validator
///
/// ## Checks, in order
/// 1. `MissingFile`         — the table path names an existing, readable file
/// 2. `MalformedTable`      — the table parses (header, consistent rows)
/// 3. `InsufficientColumns` — at least identifier + 2 criterion columns
/// 4. `MalformedTable`      — at least one data row
/// 5. `NonNumericCriterion` — every cell of every criterion column is numeric
/// 6. `DimensionMismatch`   — #weights == #impacts == #criterion columns
/// 7. `InvalidImpact`       — every impact symbol is exactly "+" or "-"
///
/// The first failing check throws; success is the absence of an exception.
/// The validator has no side effects beyond reading the input file and never
/// writes output.

#include "topsis/constants.hpp"
#include "topsis/types.hpp"

#include <span>
#include <string>

namespace topsis::validation {

class InputValidator {
public:
    /// Load the table at `table_path` and validate it against the weights
    /// and raw impact symbols.
    ///
    /// # Errors
    /// `TopsisError` of the first failing check listed above.
    static void validate(const std::string& table_path,
                         std::span<const double> weights,
                         std::span<const std::string> impacts,
                         char delimiter = constants::DEFAULT_DELIMITER);

    /// Validate an already-loaded table (checks 3–7).
    static void validate(const RawTable& table,
                         std::span<const double> weights,
                         std::span<const std::string> impacts);
};

}  // namespace topsis::validation
