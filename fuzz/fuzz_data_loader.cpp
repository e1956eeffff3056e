/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader parsing and the TOPSIS evaluation behind it
 *
 * Build:
 *   cmake -DTOPSIS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Parsing either throws TopsisError or returns a rectangular table:
 *      every row has exactly header.size() cells.
 *   3. If the table converts to a DecisionMatrix:
 *      a. one identifier per row
 *      b. criteria is rows × (columns − 1) and every value is finite
 *   4. If evaluation runs with unit weights and Benefit impacts:
 *      a. ranks are a permutation of 1..rows
 *      b. every non-NaN score lies in [0, 1]
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • Unbalanced and escaped quotes
 *     • CR, CRLF and blank lines
 *     • "NaN", "inf", "1e309" and other non-finite tokens
 *     • Ragged rows
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include "topsis/data_loader.hpp"
#include "topsis/engine.hpp"
#include "topsis/error.hpp"

using namespace topsis;
using namespace topsis::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    RawTable table;
    try {
        table = DataLoader::parse_csv_string(std::string(input));
    } catch (const TopsisError& ex) {
        assert(ex.kind() == ErrorKind::MalformedTable);
        return 0;
    }

    // Invariant 2: rectangular
    for (const auto& row : table.rows) {
        assert(row.size() == table.column_count());
    }

    if (table.column_count() < 2 || table.row_count() == 0) return 0;

    DecisionMatrix matrix;
    try {
        matrix = DataLoader::to_decision_matrix(table);
    } catch (const TopsisError& ex) {
        assert(ex.kind() == ErrorKind::NonNumericCriterion);
        return 0;
    }

    // Invariant 3a / 3b
    const auto rows = static_cast<Eigen::Index>(table.row_count());
    const auto cols = static_cast<Eigen::Index>(table.column_count() - 1);
    assert(matrix.identifiers.size() == table.row_count());
    assert(matrix.criteria.rows() == rows);
    assert(matrix.criteria.cols() == cols);
    assert(matrix.criteria.allFinite());

    const std::vector<double> weights(static_cast<std::size_t>(cols), 1.0);
    const std::vector<Impact> impacts(static_cast<std::size_t>(cols), Impact::Benefit);
    const auto result = Engine{}.evaluate(matrix.criteria, weights, impacts);

    // Invariant 4a: permutation of 1..rows
    std::vector<std::size_t> sorted = result.ranks;
    std::sort(sorted.begin(), sorted.end());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        assert(sorted[i] == i + 1);
    }

    // Invariant 4b: bounded scores. Huge finite inputs can overflow the
    // column norm, so only non-NaN scores are checked.
    for (Eigen::Index i = 0; i < result.scores.size(); ++i) {
        const double s = result.scores(i);
        if (!std::isnan(s)) {
            assert(s >= -1e-12);
            assert(s <= 1.0 + 1e-12);
        }
    }

    return 0;
}
