/// @file src/core/data_loader.cpp
/// @brief Delimited-table loader for decision tables.

#include "topsis/data_loader.hpp"
#include "topsis/error.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace topsis::core {

// ─── DataLoader::parse_number ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_number(std::string_view token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::nullopt;  // empty or all whitespace
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    token = token.substr(first, last - first + 1);

    // from_chars rejects an explicit plus sign.
    if (token.front() == '+') {
        token.remove_prefix(1);
        if (token.empty() || token.front() == '+' || token.front() == '-') {
            return std::nullopt;
        }
    }

    double value = 0.0;
    const char* begin = token.data();
    const char* end   = begin + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─── DataLoader::split_record ─────────────────────────────────────────────────

std::optional<std::vector<std::string>>
DataLoader::split_record(std::string_view line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    // `""` is an empty quoted field, so emptiness alone does not mean unstarted.
    bool field_started = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c != '"') {
                field += c;
            } else if (i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';  // escaped quote
                ++i;
            } else {
                in_quotes = false;
            }
        } else if (c == '"' && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == delimiter) {
            fields.push_back(std::move(field));
            field.clear();
            field_started = false;
        } else {
            // A quote after the first character is literal: 12" Pizza.
            field += c;
            field_started = true;
        }
    }

    if (in_quotes) {
        return std::nullopt;
    }
    fields.push_back(std::move(field));
    return fields;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

RawTable DataLoader::parse_csv_string(const std::string& csv_content,
                                      char delimiter) {
    RawTable table;
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t line_no = 0;
    bool header_read = false;

    while (std::getline(stream, line)) {
        ++line_no;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto fields = split_record(line, delimiter);
        if (!fields) {
            throw TopsisError(ErrorKind::MalformedTable,
                fmt::format("unterminated quoted field on line {}", line_no));
        }

        if (!header_read) {
            table.header = std::move(*fields);
            header_read = true;
            continue;
        }

        if (fields->size() != table.header.size()) {
            throw TopsisError(ErrorKind::MalformedTable,
                fmt::format("line {} has {} fields, expected {} (one per header column)",
                            line_no, fields->size(), table.header.size()));
        }
        table.rows.push_back(std::move(*fields));
    }

    if (!header_read) {
        throw TopsisError(ErrorKind::MalformedTable,
                          "the input file is empty: no header row found");
    }
    return table;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

RawTable DataLoader::load_csv(const std::string& filepath, char delimiter) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        throw TopsisError(ErrorKind::MissingFile,
            fmt::format("the input file '{}' does not exist. Please provide a valid file path.",
                        filepath));
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw TopsisError(ErrorKind::MissingFile,
            fmt::format("the input file '{}' cannot be opened for reading", filepath));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw TopsisError(ErrorKind::MissingFile,
            fmt::format("failed while reading the input file '{}'", filepath));
    }

    return parse_csv_string(contents.str(), delimiter);
}

// ─── DataLoader::to_decision_matrix ───────────────────────────────────────────

DecisionMatrix DataLoader::to_decision_matrix(const RawTable& table) {
    const std::size_t n_rows = table.row_count();
    const std::size_t n_cols = table.column_count();
    const std::size_t n_criteria = n_cols > 0 ? n_cols - 1 : 0;

    DecisionMatrix decision;
    decision.identifiers.reserve(n_rows);
    decision.criteria = Matrix(static_cast<Eigen::Index>(n_rows),
                               static_cast<Eigen::Index>(n_criteria));

    for (const auto& row : table.rows) {
        decision.identifiers.push_back(row[constants::IDENTIFIER_COLUMN]);
    }

    // Column-major walk so the error names the first offending column.
    for (std::size_t j = 0; j < n_criteria; ++j) {
        const std::size_t col = j + 1;
        for (std::size_t i = 0; i < n_rows; ++i) {
            const std::string& cell = table.rows[i][col];
            const auto value = parse_number(cell);
            if (!value) {
                throw TopsisError(ErrorKind::NonNumericCriterion,
                    fmt::format("all columns from the 2nd to the last must contain numeric "
                                "values: column '{}' has '{}' in data row {}",
                                table.header[col], cell, i + 1));
            }
            decision.criteria(static_cast<Eigen::Index>(i),
                              static_cast<Eigen::Index>(j)) = *value;
        }
    }

    return decision;
}

}  // namespace topsis::core
