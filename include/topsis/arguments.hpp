#pragma once

/// @file include/topsis/arguments.hpp
/// @brief Parsing of the weight and impact command-line lists.
///
/// Both lists are separated by `constants::LIST_SEPARATOR` and aligned by
/// position with the criterion columns of the input table.

#include "topsis/types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace topsis::cli {

/// Split a separator-delimited list into verbatim tokens.
///
/// Empty tokens are preserved: "+,,-" yields {"+", "", "-"} and "" yields
/// {""}.
[[nodiscard]] std::vector<std::string> split_symbols(std::string_view text);

/// Parse a comma-separated weight list such as "1,1,0.5,2".
///
/// Each token may carry surrounding whitespace. Weights are not required to
/// be positive.
///
/// # Errors
/// `InvalidWeight` naming the first token that is not a finite number.
[[nodiscard]] std::vector<double> parse_weights(std::string_view text);

/// Convert impact symbols to Impacts.
///
/// # Errors
/// `InvalidImpact` naming the first symbol that is not exactly "+" or "-".
[[nodiscard]] std::vector<Impact>
parse_impacts(std::span<const std::string> symbols);

}  // namespace topsis::cli
