/// @file src/cli/arguments.cpp
/// @brief Parsing of the weight and impact command-line lists.

#include "topsis/arguments.hpp"
#include "topsis/constants.hpp"
#include "topsis/data_loader.hpp"
#include "topsis/error.hpp"

#include <fmt/core.h>

namespace topsis::cli {

std::vector<std::string> split_symbols(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(constants::LIST_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(text.substr(start));
            break;
        }
        tokens.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

std::vector<double> parse_weights(std::string_view text) {
    const auto tokens = split_symbols(text);

    std::vector<double> weights;
    weights.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto value = core::DataLoader::parse_number(tokens[i]);
        if (!value) {
            throw TopsisError(ErrorKind::InvalidWeight,
                fmt::format("weight '{}' at position {} is not a number; "
                            "weights must be comma-separated numbers, e.g. \"1,1,1,2\"",
                            tokens[i], i + 1));
        }
        weights.push_back(*value);
    }
    return weights;
}

std::vector<Impact> parse_impacts(std::span<const std::string> symbols) {
    std::vector<Impact> impacts;
    impacts.reserve(symbols.size());
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        const auto impact = impact_from_symbol(symbols[i]);
        if (!impact) {
            throw TopsisError(ErrorKind::InvalidImpact,
                fmt::format("impact '{}' at position {} is invalid; impacts must be '{}' or '{}'",
                            symbols[i], i + 1,
                            constants::BENEFIT_SYMBOL, constants::COST_SYMBOL));
        }
        impacts.push_back(*impact);
    }
    return impacts;
}

}  // namespace topsis::cli
