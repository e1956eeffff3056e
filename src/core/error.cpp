/// @file src/core/error.cpp
/// @brief TopsisError and ErrorKind names.

#include "topsis/error.hpp"

namespace topsis {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingFile:         return "MissingFile";
        case ErrorKind::MalformedTable:      return "MalformedTable";
        case ErrorKind::InsufficientColumns: return "InsufficientColumns";
        case ErrorKind::NonNumericCriterion: return "NonNumericCriterion";
        case ErrorKind::DimensionMismatch:   return "DimensionMismatch";
        case ErrorKind::InvalidImpact:       return "InvalidImpact";
        case ErrorKind::InvalidWeight:       return "InvalidWeight";
        case ErrorKind::OutputWriteFailure:  return "OutputWriteFailure";
        case ErrorKind::ComputationFailure:  return "ComputationFailure";
    }
    return "Unknown";
}

TopsisError::TopsisError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{}

} // namespace topsis
