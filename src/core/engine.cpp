/// @file src/core/engine.cpp
/// @brief TOPSIS Engine — stage functions and orchestration.

#include "topsis/engine.hpp"
#include "topsis/data_loader.hpp"
#include "topsis/error.hpp"
#include "topsis/table_writer.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace topsis::core {

namespace {

/// Throw DimensionMismatch unless `actual == expected`.
void require_length(std::size_t actual, Eigen::Index expected, const char* what) {
    if (actual != static_cast<std::size_t>(expected)) {
        throw TopsisError(ErrorKind::DimensionMismatch,
            fmt::format("{} has {} entries but the decision matrix has {} criteria",
                        what, actual, expected));
    }
}

/// "[a, b, c]" with 6 significant digits, for diagnostics.
std::string format_vector(const Vector& v) {
    return fmt::format("[{:.6g}]", fmt::join(v.begin(), v.end(), ", "));
}

}  // anonymous namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::normalize ────────────────────────────────────────────────────────

Matrix Engine::normalize(const Matrix& criteria) {
    // A zero-norm column yields 0/0 = NaN; it is propagated, not rejected.
    const Eigen::RowVectorXd norms = criteria.colwise().norm();
    return (criteria.array().rowwise() / norms.array()).matrix();
}

// ─── Engine::apply_weights ────────────────────────────────────────────────────

Matrix Engine::apply_weights(const Matrix& normalized,
                             std::span<const double> weights) {
    require_length(weights.size(), normalized.cols(), "weight vector");
    const Eigen::Map<const Eigen::RowVectorXd> w(
        weights.data(), static_cast<Eigen::Index>(weights.size()));
    return (normalized.array().rowwise() * w.array()).matrix();
}

// ─── Engine::ideal_solutions ──────────────────────────────────────────────────

IdealSolutions Engine::ideal_solutions(const Matrix& weighted,
                                       std::span<const Impact> impacts) {
    require_length(impacts.size(), weighted.cols(), "impact vector");
    if (weighted.rows() == 0) {
        throw TopsisError(ErrorKind::ComputationFailure,
                          "cannot compute ideal solutions: there are no alternatives");
    }

    const Eigen::Index n = weighted.cols();
    IdealSolutions ideals{Vector(n), Vector(n)};

    for (Eigen::Index j = 0; j < n; ++j) {
        const auto column = weighted.col(j);
        const double hi = column.maxCoeff<Eigen::PropagateNaN>();
        const double lo = column.minCoeff<Eigen::PropagateNaN>();

        if (impacts[static_cast<std::size_t>(j)] == Impact::Benefit) {
            ideals.positive(j) = hi;
            ideals.negative(j) = lo;
        } else {
            ideals.positive(j) = lo;
            ideals.negative(j) = hi;
        }
    }

    return ideals;
}

// ─── Engine::separations ──────────────────────────────────────────────────────

Separations Engine::separations(const Matrix& weighted,
                                const IdealSolutions& ideals) {
    require_length(static_cast<std::size_t>(ideals.positive.size()),
                   weighted.cols(), "positive ideal solution");
    require_length(static_cast<std::size_t>(ideals.negative.size()),
                   weighted.cols(), "negative ideal solution");

    return Separations{
        (weighted.rowwise() - ideals.positive.transpose()).rowwise().norm(),
        (weighted.rowwise() - ideals.negative.transpose()).rowwise().norm(),
    };
}

// ─── Engine::scores ───────────────────────────────────────────────────────────

Vector Engine::scores(const Separations& separations) {
    const auto d_pos = separations.to_positive.array();
    const auto d_neg = separations.to_negative.array();
    // An alternative at distance 0 from both ideals yields 0/0 = NaN.
    return (d_neg / (d_pos + d_neg)).matrix();
}

// ─── Engine::rank ─────────────────────────────────────────────────────────────

std::vector<std::size_t> Engine::rank(const Vector& scores) {
    const auto n = static_cast<std::size_t>(scores.size());

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});

    // Descending score, NaN after every number. stable_sort keeps input order
    // among equal scores, so the earlier row takes the better rank.
    std::stable_sort(order.begin(), order.end(),
        [&scores](std::size_t a, std::size_t b) {
            const double sa = scores(static_cast<Eigen::Index>(a));
            const double sb = scores(static_cast<Eigen::Index>(b));
            if (std::isnan(sa)) return false;
            if (std::isnan(sb)) return true;
            return sa > sb;
        });

    std::vector<std::size_t> ranks(n);
    for (std::size_t position = 0; position < n; ++position) {
        ranks[order[position]] = position + 1;
    }
    return ranks;
}

// ─── Engine::evaluate ─────────────────────────────────────────────────────────

TopsisResult Engine::evaluate(const Matrix& criteria,
                              std::span<const double> weights,
                              std::span<const Impact> impacts) const {
    TopsisResult result;

    // ── Step 1: Column-wise L2 normalization ─────────────────────────────────
    result.normalized = normalize(criteria);

    // ── Step 2: Weighting ────────────────────────────────────────────────────
    result.weighted = apply_weights(result.normalized, weights);

    // ── Step 3: Positive / negative ideal solutions ──────────────────────────
    result.ideals = ideal_solutions(result.weighted, impacts);

    // ── Step 4: Separations from each ideal ──────────────────────────────────
    result.separations = separations(result.weighted, result.ideals);

    // ── Step 5: Closeness scores ─────────────────────────────────────────────
    result.scores = scores(result.separations);

    // ── Step 6: Ranking ──────────────────────────────────────────────────────
    result.ranks = rank(result.scores);

    if (config_.verbose) {
        log_result(criteria, result);
    }
    return result;
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

void Engine::run(const std::string& table_path,
                 std::span<const double> weights,
                 std::span<const Impact> impacts,
                 const std::string& output_path) const {
    const RawTable table = DataLoader::load_csv(table_path, config_.delimiter);
    const DecisionMatrix decision = DataLoader::to_decision_matrix(table);

    if (config_.verbose) {
        fmt::print(stderr, "[topsis] Loaded {} alternatives x {} criteria from '{}'\n",
                   decision.criteria.rows(), decision.criteria.cols(), table_path);
    }

    const TopsisResult result = evaluate(decision.criteria, weights, impacts);

    TableWriter::write_csv(output_path, table, result.scores, result.ranks, config_);
    fmt::print("Results saved to {}\n", output_path);
}

// ─── Engine::log_result ───────────────────────────────────────────────────────

void Engine::log_result(const Matrix& criteria, const TopsisResult& result) const {
    const Vector norms = criteria.colwise().norm().transpose();
    fmt::print(stderr, "[topsis] column norms: {}\n", format_vector(norms));
    fmt::print(stderr, "[topsis] PIS: {}\n", format_vector(result.ideals.positive));
    fmt::print(stderr, "[topsis] NIS: {}\n", format_vector(result.ideals.negative));
    fmt::print(stderr, "[topsis] distance to PIS: {}\n",
               format_vector(result.separations.to_positive));
    fmt::print(stderr, "[topsis] distance to NIS: {}\n",
               format_vector(result.separations.to_negative));
    fmt::print(stderr, "[topsis] scores: {}\n", format_vector(result.scores));
    fmt::print(stderr, "[topsis] ranks: [{}]\n", fmt::join(result.ranks, ", "));
}

}  // namespace topsis::core
