#pragma once

/// @file include/topsis/engine.hpp
/// @brief TOPSIS Engine — public API.
///
/// # Module: TOPSIS Engine
///
/// ## Responsibility
/// Run the TOPSIS pipeline over a decision matrix:
///   criteria → normalize → apply_weights → ideal_solutions →
///   separations → scores → rank
/// and, in `run`, read the input table and write the augmented result table.
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// const std::vector<double> weights{1.0, 1.0, 1.0, 2.0};
/// const std::vector<Impact> impacts{Impact::Benefit, Impact::Benefit,
///                                   Impact::Benefit, Impact::Cost};
/// engine.run("data.csv", weights, impacts, "result.csv");
/// ```
///
/// ## Numeric Behaviour
/// The engine assumes InputValidator has passed and does not re-check the
/// values themselves. A criterion column whose norm is zero divides by zero;
/// the resulting NaN/inf values propagate into scores and are written out
/// rather than rejected.
///
/// ## Ranking
/// Ranks are 1..rows, each used once, by descending score. Equal scores keep
/// input row order (the earlier row ranks better). NaN scores rank last.
///
/// ## Guarantees
/// - Stage functions are pure: inputs by const-reference, new value out
/// - `evaluate` and `run` are const; the engine holds only its configuration
/// - Mismatched vector lengths throw `DimensionMismatch` instead of reaching
///   Eigen with inconsistent shapes

#include "topsis/config.hpp"
#include "topsis/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace topsis::core {

/// Orchestrates the TOPSIS pipeline.
class Engine {
public:
    /// Construct with optional configuration.
    explicit Engine(EngineConfig config = EngineConfig{});

    // ── Pipeline stages ──────────────────────────────────────────────────────

    /// Divide every column by its Euclidean norm sqrt(Σ_i x_ij²).
    [[nodiscard]] static Matrix normalize(const Matrix& criteria);

    /// Scale column j by `weights[j]`.
    ///
    /// # Errors
    /// `DimensionMismatch` if `weights.size() != normalized.cols()`.
    [[nodiscard]] static Matrix
    apply_weights(const Matrix& normalized, std::span<const double> weights);

    /// Per-column extremes of the weighted matrix.
    ///
    /// Benefit: PIS = column max, NIS = column min.
    /// Cost:    PIS = column min, NIS = column max.
    /// A NaN anywhere in a column makes both extremes of that column NaN.
    ///
    /// # Errors
    /// - `DimensionMismatch` if `impacts.size() != weighted.cols()`
    /// - `ComputationFailure` if `weighted` has no rows
    [[nodiscard]] static IdealSolutions
    ideal_solutions(const Matrix& weighted, std::span<const Impact> impacts);

    /// Euclidean distance of every row to PIS and to NIS.
    ///
    /// # Errors
    /// `DimensionMismatch` if the ideal vectors do not have one entry per
    /// column of `weighted`.
    [[nodiscard]] static Separations
    separations(const Matrix& weighted, const IdealSolutions& ideals);

    /// Closeness coefficient distN / (distP + distN) per row.
    [[nodiscard]] static Vector scores(const Separations& separations);

    /// Dense 1-based ranking by descending score; see "Ranking" above.
    [[nodiscard]] static std::vector<std::size_t> rank(const Vector& scores);

    // ── Orchestration ────────────────────────────────────────────────────────

    /// Run every stage over `criteria` and collect the outputs.
    ///
    /// # Errors
    /// As for the individual stages.
    [[nodiscard]] TopsisResult evaluate(const Matrix& criteria,
                                        std::span<const double> weights,
                                        std::span<const Impact> impacts) const;

    /// Load `table_path`, evaluate it, append score and rank columns in the
    /// original row order, write the result to `output_path`, and print a
    /// success notice naming the output path.
    ///
    /// # Errors
    /// `TopsisError` from loading, evaluation or writing. Nothing is written
    /// if loading or evaluation fails.
    void run(const std::string& table_path,
             std::span<const double> weights,
             std::span<const Impact> impacts,
             const std::string& output_path) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Print per-stage diagnostics to stderr (verbose mode only).
    void log_result(const Matrix& criteria, const TopsisResult& result) const;

    EngineConfig config_;
};

}  // namespace topsis::core
