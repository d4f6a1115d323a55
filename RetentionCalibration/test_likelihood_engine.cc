/**
 * @file test_likelihood_engine.cc
 * @brief Test program for the base and extended negative log-likelihood
 *
 * Checks:
 * 1. Hand-computed values for small tables
 * 2. Extended model at alpha = 0 reduces to the base model
 * 3. Infeasible parameters return a finite penalty, never throw
 * 4. Clipping of the per-period exponent max(0, 1 + alpha*t)
 * 5. Stability for extreme shape parameters and long histories
 * 6. Concurrent evaluation from OpenMP threads matches serial evaluation
 */

#include "LikelihoodEngine.hh"
#include "MathUtilities.hh"
#include "SurvivalTable.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <limits>
#include <string>
#include <vector>

using namespace RetentionCalibration;

static int g_failures = 0;

static void check(bool ok, const std::string& name) {
    std::cout << "  " << std::left << std::setw(60) << name << std::right
              << std::setw(6) << (ok ? "PASS" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static bool isPenalty(double v) {
    return std::isfinite(v) && v == kInfeasiblePenalty;
}

int main() {
    std::cout << "========================================\n";
    std::cout << "LikelihoodEngine Test\n";
    std::cout << "========================================\n\n";

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    //------------------------------------------------------------------
    // 1. Hand-computed values
    //------------------------------------------------------------------
    std::cout << "Hand-computed values:\n";

    // gamma = delta = 1: P(churn in 1) = B(2,1)/B(1,1) = 1/2, S(1) = B(1,2)/B(1,1) = 1/2
    LikelihoodEngine one_period(SurvivalTable(std::vector<double>{100, 60}));
    check(std::abs(one_period.base(1.0, 1.0) - 100.0 * std::log(2.0)) < 1e-12,
          "base NLL of [100, 60] at (1, 1) is 100 ln 2");

    // alpha = -0.5: exponents 0.5, 0 -> C = [0, 0.5, 0.5]
    // P(churn in 1) = 1 - B(1,1.5)/B(1,1) = 1/3, S(2) = 2/3
    LikelihoodEngine clipped(SurvivalTable(std::vector<double>{100, 60, 60}));
    double expected = 40.0 * std::log(3.0) + 60.0 * std::log(1.5);
    double value = clipped.extended(1.0, 1.0, -0.5);
    std::cout << "    extended NLL = " << std::setprecision(12) << value
              << " (expected " << expected << ")\n";
    check(std::abs(value - expected) < 1e-10, "extended NLL of [100, 60, 60] at (1, 1, -0.5)");

    ModelParameters base_params(1.0, 1.0);
    check(one_period.negativeLogLikelihood(base_params) == one_period.base(1.0, 1.0),
          "negativeLogLikelihood dispatches to base");
    ModelParameters ext_params(1.0, 1.0, -0.5);
    check(clipped.negativeLogLikelihood(ext_params) == value,
          "negativeLogLikelihood dispatches to extended");
    std::cout << "\n";

    //------------------------------------------------------------------
    // 2. Reduction property: extended(gamma, delta, 0) == base(gamma, delta)
    //------------------------------------------------------------------
    std::cout << "Reduction at alpha = 0:\n";
    std::vector<std::vector<double>> tables = {
        {1000, 800, 275, 250, 220},
        {1000, 631, 468, 382, 326, 289, 262, 241, 223, 207, 194, 183, 173},
        {500, 500, 499, 300, 0},
        {12.5, 10.0, 9.5}
    };
    const double shapes[] = {1e-3, 0.05, 0.3, 1.0, 2.7, 11.0, 150.0, 4e3};

    double worst = 0.0;
    for (size_t k = 0; k < tables.size(); ++k) {
        LikelihoodEngine engine((SurvivalTable(tables[k])));
        for (double g : shapes) {
            for (double d : shapes) {
                double b = engine.base(g, d);
                double e = engine.extended(g, d, 0.0);
                double rel = std::abs(b - e) / std::max(1.0, std::abs(b));
                worst = std::max(worst, rel);
            }
        }
    }
    std::cout << "    worst relative difference: " << std::scientific << worst << std::fixed << "\n";
    check(worst < 1e-9, "extended(alpha=0) matches base within 1e-9");
    std::cout << "\n";

    //------------------------------------------------------------------
    // 3. Infeasible parameters
    //------------------------------------------------------------------
    std::cout << "Infeasible parameters:\n";
    LikelihoodEngine engine(SurvivalTable(std::vector<double>{1000, 800, 275, 250, 220}));
    check(isPenalty(engine.base(-1.0, 1.0)), "base gamma = -1 gives penalty");
    check(isPenalty(engine.base(1.0, 0.0)), "base delta = 0 gives penalty");
    check(isPenalty(engine.base(nan, 1.0)), "base gamma = NaN gives penalty");
    check(isPenalty(engine.base(1.0, inf)), "base delta = inf gives penalty");
    check(isPenalty(engine.extended(-1.0, 1.0, 0.0)), "extended gamma = -1 gives penalty");
    check(isPenalty(engine.extended(1.0, -3.0, 0.2)), "extended delta = -3 gives penalty");
    check(isPenalty(engine.extended(1.0, 1.0, nan)), "extended alpha = NaN gives penalty");
    check(isPenalty(engine.negativeLogLikelihood(ModelParameters(-1.0, 2.0))),
          "negativeLogLikelihood gamma = -1 gives penalty");
    std::cout << "\n";

    //------------------------------------------------------------------
    // 4. Clipping
    //------------------------------------------------------------------
    std::cout << "Clipping of max(0, 1 + alpha*t):\n";
    std::vector<double> C = cumulativeExponents(-10.0, 50);
    bool all_zero = true;
    for (double c : C) all_zero = all_zero && c == 0.0;
    check(all_zero, "alpha = -10: every cumulative exponent is exactly 0");

    bool clamped = true;
    for (int t = 1; t <= 200; ++t) {
        double e = clippedExponent(-10.0, t);
        clamped = clamped && e == 0.0 && !std::signbit(e);
    }
    check(clamped, "alpha = -10: per-period exponent clamps to +0, never negative");

    std::vector<double> C2 = cumulativeExponents(-0.1, 30);
    bool nondecreasing = true;
    bool flat_after = true;
    for (int t = 1; t <= 30; ++t) {
        nondecreasing = nondecreasing && C2[t] >= C2[t - 1];
        if (t > 10) flat_after = flat_after && C2[t] == C2[t - 1];
    }
    check(nondecreasing, "alpha = -0.1: cumulative exponents non-decreasing");
    check(flat_after, "alpha = -0.1: no further decay after period 10");
    check(std::abs(C2[3] - (0.9 + 0.8 + 0.7)) < 1e-12, "alpha = -0.1: C[3] = 2.4");

    std::vector<double> C0 = cumulativeExponents(0.0, 7);
    check(C0[7] == 7.0 && C0[1] == 1.0, "alpha = 0: C[t] = t");

    // No churn possible: zero losses give a likelihood of one
    LikelihoodEngine no_losses(SurvivalTable(std::vector<double>{100, 100, 100}));
    check(no_losses.extended(0.8, 2.0, -10.0) == 0.0, "alpha = -10 with no losses gives NLL 0");
    // Observed churn with zero model probability: infeasible
    check(isPenalty(engine.extended(0.8, 2.0, -10.0)), "alpha = -10 with losses gives penalty");
    std::cout << "\n";

    //------------------------------------------------------------------
    // 5. Numerical stability
    //------------------------------------------------------------------
    std::cout << "Numerical stability:\n";
    double big = engine.base(1e5, 1e5);
    check(std::isfinite(big) && big < kInfeasiblePenalty, "base finite at gamma = delta = 1e5");
    double tiny = engine.base(1e-4, 1e-4);
    check(std::isfinite(tiny) && tiny < kInfeasiblePenalty, "base finite at gamma = delta = 1e-4");
    double big_ext = engine.extended(2e4, 3e6, 0.7);
    check(std::isfinite(big_ext) && big_ext < kInfeasiblePenalty, "extended finite at large shapes");

    std::vector<double> long_counts;
    double n = 1e6;
    for (int t = 0; t <= 500; ++t) {
        long_counts.push_back(std::floor(n));
        n *= 0.985;
    }
    LikelihoodEngine long_engine((SurvivalTable(long_counts)));
    double long_base = long_engine.base(3.0, 40.0);
    double long_ext = long_engine.extended(3.0, 40.0, 0.05);
    check(std::isfinite(long_base) && long_base > 0.0 && long_base < kInfeasiblePenalty,
          "500-period history: base finite");
    check(std::isfinite(long_ext) && long_ext > 0.0 && long_ext < kInfeasiblePenalty,
          "500-period history: extended finite");
    std::cout << "\n";

    //------------------------------------------------------------------
    // 6. Concurrent evaluation
    //------------------------------------------------------------------
    std::cout << "Concurrent evaluation:\n";
    {
        check(std::abs(logGamma(0.5) - 0.5 * std::log(std::acos(-1.0))) < 1e-13, "logGamma(0.5) = log(sqrt(pi))");
        check(std::abs(logGamma(10.0) - std::log(362880.0)) < 1e-12, "logGamma(10) = log(9!)");

        const int n = 2000;
        std::vector<double> gammas(n), deltas(n), alphas(n);
        for (int i = 0; i < n; ++i) {
            gammas[i] = 0.05 + 0.01 * (i % 97);
            deltas[i] = 0.2 + 0.37 * (i % 53);
            alphas[i] = -0.1 + 0.001 * (i % 211);
        }
        std::vector<double> serial(n), parallel(n), serial_beta(n), parallel_beta(n);
        for (int i = 0; i < n; ++i) {
            serial[i] = engine.extended(gammas[i], deltas[i], alphas[i]);
            serial_beta[i] = logBeta(gammas[i], deltas[i]);
        }
#pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < n; ++i) {
            parallel[i] = engine.extended(gammas[i], deltas[i], alphas[i]);
            parallel_beta[i] = logBeta(gammas[i], deltas[i]);
        }
        check(parallel == serial, "extended NLL identical across threads");
        check(parallel_beta == serial_beta, "logBeta identical across threads");
    }

    std::cout << "\n========================================\n";
    if (g_failures > 0) {
        std::cout << g_failures << " check(s) FAILED\n";
        std::cout << "========================================\n";
        return 1;
    }
    std::cout << "All tests completed successfully!\n";
    std::cout << "========================================\n";
    return 0;
}
