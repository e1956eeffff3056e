#pragma once

/// @file include/topsis/data_loader.hpp
/// @brief Delimited-table loader for decision tables.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Read a delimited text table into a RawTable of verbatim string cells, and
/// convert its criterion columns into a typed DecisionMatrix.
///
/// ## Expected Format
/// ```
/// Model,Price,Storage,Camera,Looks
/// M1,250,16,12,5
/// M2,200,16,8,3
/// ```
/// The first non-blank line is the header. Column 0 identifies the
/// alternative; every other column is a numeric criterion.
///
/// ## Quoting
/// A field may be wrapped in double quotes; inside quotes the delimiter is
/// literal and `""` is an escaped quote. Quoted fields do not span lines.
/// A quote that is not the first character of a field is an ordinary
/// character (`12" Pizza`).
///
/// ## Errors
/// All failures are thrown as `TopsisError`:
/// - `MissingFile`         — path is not a readable regular file
/// - `MalformedTable`      — no header, ragged row, unterminated quote
/// - `NonNumericCriterion` — from `to_decision_matrix` only

#include "topsis/constants.hpp"
#include "topsis/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace topsis::core {

/// Loads decision tables from files and strings.
class DataLoader {
public:
    /// Load a table from a file on disk.
    ///
    /// # Errors
    /// - `MissingFile` if `filepath` does not name an existing regular file
    ///   or it cannot be opened for reading
    /// - `MalformedTable` as for `parse_csv_string`
    [[nodiscard]] static RawTable
    load_csv(const std::string& filepath,
             char delimiter = constants::DEFAULT_DELIMITER);

    /// Parse a table from delimited text (useful for testing).
    ///
    /// Blank lines are skipped and a trailing '\r' is stripped from every
    /// line. Cells are kept verbatim, without trimming.
    ///
    /// # Errors
    /// `MalformedTable` if there is no header line, a quote is unterminated,
    /// or a data row's field count differs from the header's.
    [[nodiscard]] static RawTable
    parse_csv_string(const std::string& csv_content,
                     char delimiter = constants::DEFAULT_DELIMITER);

    /// Parse every criterion cell of `table` into a DecisionMatrix.
    ///
    /// Columns are checked in order, each over every row, so the error names
    /// the first criterion column holding a non-numeric cell.
    ///
    /// # Errors
    /// `NonNumericCriterion` if any criterion cell is not a finite number.
    [[nodiscard]] static DecisionMatrix
    to_decision_matrix(const RawTable& table);

    /// Parse a single numeric token.
    ///
    /// Surrounding whitespace is ignored and a leading '+' is accepted. The
    /// whole token must be consumed.
    ///
    /// # Returns
    /// `nullopt` for empty, partially numeric, or non-finite ("nan", "inf")
    /// tokens.
    [[nodiscard]] static std::optional<double>
    parse_number(std::string_view token) noexcept;

private:
    /// Split one line into fields, honouring double quotes.
    /// Returns `nullopt` if a quoted field is left unterminated.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    split_record(std::string_view line, char delimiter);
};

}  // namespace topsis::core
