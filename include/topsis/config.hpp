#pragma once

/// @file include/topsis/config.hpp
/// @brief Engine configuration and its environment overrides.

#include "topsis/constants.hpp"

#include <string>

namespace topsis::core {

/// Configuration parameters for the TOPSIS engine and its table writer.
///
/// Defaults reproduce the command-line tool's behaviour.
struct EngineConfig {
    /// Header of the appended score column.
    std::string score_column{constants::SCORE_COLUMN};

    /// Header of the appended rank column.
    std::string rank_column{constants::RANK_COLUMN};

    /// Field delimiter used to read the input and write the output table.
    char delimiter = constants::DEFAULT_DELIMITER;

    /// If true, emit per-stage diagnostics to stderr.
    bool verbose = false;
};

/// Build a configuration from defaults plus environment overrides.
///
/// Recognised variables:
/// - `TOPSIS_VERBOSE` — "1", "true", "yes" or "on" enables `verbose`.
[[nodiscard]] EngineConfig config_from_environment();

}  // namespace topsis::core
