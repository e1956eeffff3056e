/**
 * @file  prop_scale_invariance.cpp
 * @brief Property: ∀ column j, ∀ k > 0: scores(M with col j × k) == scores(M)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_scale_invariance
 *
 * Mathematical basis:
 *   Column normalization divides col j by ||col j||₂. Scaling the column by
 *   k > 0 scales its norm by k, so the normalized matrix, and every stage
 *   after it, is unchanged.
 *
 * Also checked: uniform scaling of the weight vector leaves scores unchanged,
 * since PIS, NIS and every row scale together and the ratio cancels.
 */

#include <rapidcheck.h>

#include <cmath>
#include <vector>

#include "topsis/engine.hpp"

using namespace topsis;
using namespace topsis::core;

namespace {

/// Random decision problem with strictly positive criteria (no zero columns).
struct Problem {
    Matrix              criteria;
    std::vector<double> weights;
    std::vector<Impact> impacts;
};

Problem gen_problem() {
    const int rows = *rc::gen::inRange(2, 10);
    const int cols = *rc::gen::inRange(2, 6);

    Problem p;
    p.criteria = Matrix(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            p.criteria(i, j) = static_cast<double>(*rc::gen::inRange(1, 10000)) / 100.0;
        }
    }
    for (int j = 0; j < cols; ++j) {
        p.weights.push_back(static_cast<double>(*rc::gen::inRange(1, 100)) / 10.0);
        p.impacts.push_back(*rc::gen::arbitrary<bool>() ? Impact::Benefit : Impact::Cost);
    }
    return p;
}

}  // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: column scale does not change scores ─────────────────────
    ok &= rc::check(
        "scale_invariance: scaling one criterion column by k > 0 keeps every score",
        [] {
            const Problem p = gen_problem();
            const int col = *rc::gen::inRange(0, static_cast<int>(p.criteria.cols()));
            const double k = static_cast<double>(*rc::gen::inRange(1, 100000)) / 1000.0;

            Matrix scaled = p.criteria;
            scaled.col(col) *= k;

            const Engine engine;
            const auto base   = engine.evaluate(p.criteria, p.weights, p.impacts);
            const auto result = engine.evaluate(scaled, p.weights, p.impacts);

            for (Eigen::Index i = 0; i < base.scores.size(); ++i) {
                if (std::isnan(base.scores(i))) {
                    RC_ASSERT(std::isnan(result.scores(i)));
                } else {
                    RC_ASSERT(std::abs(base.scores(i) - result.scores(i)) < 1e-9);
                }
            }
        }
    );

    // ── Property 2: uniform weight scale does not change scores ─────────────
    ok &= rc::check(
        "scale_invariance: multiplying every weight by k > 0 keeps every score",
        [] {
            const Problem p = gen_problem();
            const double k = static_cast<double>(*rc::gen::inRange(1, 10000)) / 100.0;

            std::vector<double> scaled = p.weights;
            for (double& w : scaled) w *= k;

            const Engine engine;
            const auto base   = engine.evaluate(p.criteria, p.weights, p.impacts);
            const auto result = engine.evaluate(p.criteria, scaled, p.impacts);

            for (Eigen::Index i = 0; i < base.scores.size(); ++i) {
                if (std::isnan(base.scores(i))) {
                    RC_ASSERT(std::isnan(result.scores(i)));
                } else {
                    RC_ASSERT(std::abs(base.scores(i) - result.scores(i)) < 1e-9);
                }
            }
        }
    );

    return ok ? 0 : 1;
}
