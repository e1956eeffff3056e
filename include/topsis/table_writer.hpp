#pragma once

/// @file include/topsis/table_writer.hpp
/// @brief Writes the input table back out with score and rank columns.
///
/// Original cells are written verbatim and quoted only when they contain the
/// delimiter, a double quote or a line break. Scores use the shortest decimal
/// form that round-trips to the same double; a NaN score is written as an
/// empty field. Rows keep their input order.

#include "topsis/config.hpp"
#include "topsis/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace topsis::core {

class TableWriter {
public:
    /// Render `table` plus the score and rank columns as delimited text.
    ///
    /// # Errors
    /// `DimensionMismatch` if `scores` or `ranks` does not have one entry per
    /// table row.
    [[nodiscard]] static std::string
    to_csv_string(const RawTable& table,
                  const Vector& scores,
                  const std::vector<std::size_t>& ranks,
                  const EngineConfig& config = EngineConfig{});

    /// Write the augmented table to `filepath`, replacing any existing file.
    ///
    /// # Errors
    /// - `DimensionMismatch` as for `to_csv_string`
    /// - `OutputWriteFailure` if the file cannot be opened or written
    static void write_csv(const std::string& filepath,
                          const RawTable& table,
                          const Vector& scores,
                          const std::vector<std::size_t>& ranks,
                          const EngineConfig& config = EngineConfig{});

    /// Format one score: shortest round-trip decimal, empty for NaN.
    [[nodiscard]] static std::string format_score(double score);

private:
    /// Quote `cell` if it contains the delimiter, a quote or a line break.
    [[nodiscard]] static std::string quote_cell(const std::string& cell,
                                                char delimiter);
};

}  // namespace topsis::core
