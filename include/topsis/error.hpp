#pragma once

/// @file include/topsis/error.hpp
/// @brief Error taxonomy for input validation, table I/O and evaluation.
///
/// Every failure the pipeline reports is a TopsisError carrying one
/// ErrorKind. The message is user-facing: the CLI prints it verbatim after
/// an "Error: " prefix.

#include <stdexcept>
#include <string>

namespace topsis {

/// Flat classification of every reportable failure.
enum class ErrorKind {
    MissingFile,          ///< Input path is not an existing, readable file
    MalformedTable,       ///< No header, ragged rows, no data rows, bad quoting
    InsufficientColumns,  ///< Fewer than identifier + 2 criterion columns
    NonNumericCriterion,  ///< A criterion cell does not parse as a finite number
    DimensionMismatch,    ///< weights / impacts / criteria counts differ
    InvalidImpact,        ///< Impact symbol other than '+' or '-'
    InvalidWeight,        ///< Weight token that is not a finite number
    OutputWriteFailure,   ///< Result table could not be written
    ComputationFailure,   ///< Evaluation could not proceed on the given values
};

/// Stable name of an ErrorKind, e.g. "InsufficientColumns".
[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// Exception raised for every failure in the ErrorKind taxonomy.
class TopsisError : public std::runtime_error {
public:
    TopsisError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace topsis
