/**
 * @file  bench/bench_topsis.cpp
 * @brief Google Benchmark suite for the TOPSIS pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize            — column-norm division only
 *   BM_Evaluate             — full pipeline, rows × 8 criteria
 *   BM_Rank                 — stable ranking of a score vector
 *   BM_ParseCsvString       — text table → RawTable → DecisionMatrix
 *
 * Build (CMake):
 *   cmake -DTOPSIS_BENCH=ON ..
 *   cmake --build build --target bench_topsis
 *   ./build/bench_topsis --benchmark_format=json
 *
 * Throughput units: items/second (matrix cells or rows processed).
 */

#include "benchmark/benchmark.h"

#include "topsis/data_loader.hpp"
#include "topsis/engine.hpp"
#include "topsis/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static constexpr Eigen::Index kCriteria = 8;

/// Deterministic positive matrix with every column distinct.
static topsis::Matrix make_criteria(Eigen::Index rows) {
    topsis::Matrix m(rows, kCriteria);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < kCriteria; ++j) {
            m(i, j) = 1.0 + static_cast<double>((i * 37 + j * 11) % 101);
        }
    }
    return m;
}

/// CSV text of `rows` alternatives over kCriteria columns.
static std::string make_csv(Eigen::Index rows) {
    std::string csv = "Name";
    for (Eigen::Index j = 0; j < kCriteria; ++j) csv += ",C" + std::to_string(j);
    csv += '\n';
    for (Eigen::Index i = 0; i < rows; ++i) {
        csv += "A" + std::to_string(i);
        for (Eigen::Index j = 0; j < kCriteria; ++j) {
            csv += ',' + std::to_string((i * 37 + j * 11) % 101) + ".25";
        }
        csv += '\n';
    }
    return csv;
}

// ── Pipeline benchmarks ────────────────────────────────────────────────────────

static void BM_Normalize(benchmark::State& state) {
    const auto criteria = make_criteria(state.range(0));
    for (auto _ : state) {
        auto normalized = topsis::core::Engine::normalize(criteria);
        benchmark::DoNotOptimize(normalized.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * criteria.size());
}
BENCHMARK(BM_Normalize)->RangeMultiplier(8)->Range(8, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Evaluate(benchmark::State& state) {
    const auto criteria = make_criteria(state.range(0));
    const std::vector<double> weights(kCriteria, 1.0);
    std::vector<topsis::Impact> impacts(kCriteria, topsis::Impact::Benefit);
    impacts[0] = topsis::Impact::Cost;

    const topsis::core::Engine engine;
    for (auto _ : state) {
        auto result = engine.evaluate(criteria, weights, impacts);
        benchmark::DoNotOptimize(result.scores.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * criteria.size());
}
BENCHMARK(BM_Evaluate)->RangeMultiplier(8)->Range(8, 32768)->Unit(benchmark::kMicrosecond);

static void BM_Rank(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    topsis::Vector scores(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        // Repeating pattern so ties are exercised.
        scores(i) = static_cast<double>((i * 7919) % 257) / 257.0;
    }
    for (auto _ : state) {
        auto ranks = topsis::core::Engine::rank(scores);
        benchmark::DoNotOptimize(ranks.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * n);
}
BENCHMARK(BM_Rank)->RangeMultiplier(8)->Range(8, 32768)->Unit(benchmark::kMicrosecond);

// ── Loader benchmark ───────────────────────────────────────────────────────────

static void BM_ParseCsvString(benchmark::State& state) {
    const auto csv = make_csv(state.range(0));
    for (auto _ : state) {
        auto table  = topsis::core::DataLoader::parse_csv_string(csv);
        auto matrix = topsis::core::DataLoader::to_decision_matrix(table);
        benchmark::DoNotOptimize(matrix.criteria.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_ParseCsvString)->RangeMultiplier(8)->Range(8, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
