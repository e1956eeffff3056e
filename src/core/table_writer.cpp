/// @file src/core/table_writer.cpp
/// @brief Writes the augmented decision table.

#include "topsis/table_writer.hpp"
#include "topsis/error.hpp"

#include <fmt/core.h>

#include <cmath>
#include <fstream>

namespace topsis::core {

// ─── TableWriter::format_score ────────────────────────────────────────────────

std::string TableWriter::format_score(double score) {
    if (std::isnan(score)) {
        return {};
    }
    // "{}" is the shortest representation that round-trips to the same double.
    return fmt::format("{}", score);
}

// ─── TableWriter::quote_cell ──────────────────────────────────────────────────

std::string TableWriter::quote_cell(const std::string& cell, char delimiter) {
    if (cell.find_first_of(std::string{delimiter, '"', '\n', '\r'}) == std::string::npos) {
        return cell;
    }
    std::string quoted;
    quoted.reserve(cell.size() + 2);
    quoted += '"';
    for (const char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ─── TableWriter::to_csv_string ───────────────────────────────────────────────

std::string TableWriter::to_csv_string(const RawTable& table,
                                       const Vector& scores,
                                       const std::vector<std::size_t>& ranks,
                                       const EngineConfig& config) {
    const std::size_t n_rows = table.row_count();
    if (static_cast<std::size_t>(scores.size()) != n_rows || ranks.size() != n_rows) {
        throw TopsisError(ErrorKind::DimensionMismatch,
            fmt::format("cannot append {} scores and {} ranks to a table of {} rows",
                        scores.size(), ranks.size(), n_rows));
    }

    const char delim = config.delimiter;
    std::string out;

    auto write_record = [&](const std::vector<std::string>& cells,
                            const std::string& score_cell,
                            const std::string& rank_cell) {
        for (const auto& cell : cells) {
            out += quote_cell(cell, delim);
            out += delim;
        }
        out += score_cell;
        out += delim;
        out += rank_cell;
        out += '\n';
    };

    write_record(table.header,
                 quote_cell(config.score_column, delim),
                 quote_cell(config.rank_column, delim));

    for (std::size_t i = 0; i < n_rows; ++i) {
        write_record(table.rows[i],
                     format_score(scores(static_cast<Eigen::Index>(i))),
                     fmt::format("{}", ranks[i]));
    }

    return out;
}

// ─── TableWriter::write_csv ───────────────────────────────────────────────────

void TableWriter::write_csv(const std::string& filepath,
                            const RawTable& table,
                            const Vector& scores,
                            const std::vector<std::size_t>& ranks,
                            const EngineConfig& config) {
    // Render first so a shape error leaves the destination untouched.
    const std::string contents = to_csv_string(table, scores, ranks, config);

    std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw TopsisError(ErrorKind::OutputWriteFailure,
            fmt::format("cannot open output file '{}' for writing", filepath));
    }

    out << contents;
    out.flush();
    if (!out) {
        throw TopsisError(ErrorKind::OutputWriteFailure,
            fmt::format("failed while writing output file '{}'", filepath));
    }
}

}  // namespace topsis::core
