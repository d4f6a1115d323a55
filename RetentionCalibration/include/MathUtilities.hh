#ifndef MATH_UTILITIES_HH
#define MATH_UTILITIES_HH

/**
 * @file MathUtilities.hh
 * @brief Mathematical utility functions for retention model calibration
 *
 * Provides:
 * - Log Beta function via reentrant lgamma_r (log-space for numerical stability)
 * - Stable log(1 - exp(x))
 * - Clipped per-period exponents of the extended model and their prefix sums
 * - Chi-square (1 d.o.f.) tail probability
 * - Clamping utilities
 */

#include <cmath>
#include <math.h>
#include <algorithm>
#include <limits>
#include <vector>

namespace RetentionCalibration {

/**
 * @brief Objective value returned for infeasible parameter proposals
 */
const double kInfeasiblePenalty = 1e30;

/**
 * @brief Clamp value to specified range
 * @param x Value to clamp
 * @param lo Lower bound
 * @param hi Upper bound
 * @return Clamped value in [lo, hi]
 */
inline double clamp(double x, double lo, double hi) {
    return std::max(lo, std::min(hi, x));
}

/**
 * @brief log|Gamma(x)| without touching the global signgam
 *
 * std::lgamma writes signgam on glibc; the likelihood is evaluated from
 * several OpenMP threads at once.
 */
inline double logGamma(double x) {
    int sign = 0;
    return ::lgamma_r(x, &sign);
}

/**
 * @brief log B(a, b) = lgamma(a) + lgamma(b) - lgamma(a + b)
 *
 * Never overflows for large arguments, unlike a ratio of Beta values.
 *
 * @return log B(a, b), or NaN if a <= 0 or b <= 0
 */
inline double logBeta(double a, double b) {
    if (!(a > 0.0 && b > 0.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return logGamma(a) + logGamma(b) - logGamma(a + b);
}

/**
 * @brief log(1 - exp(x)) for x <= 0
 *
 * Switches between log(-expm1(x)) and log1p(-exp(x)) at -ln 2
 * (Maechler, "Accurately computing log(1 - exp(-|a|))").
 *
 * @return -inf at x = 0, NaN for x > 0
 */
inline double log1mExp(double x) {
    if (x > 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (x == 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    if (x > -0.693147180559945309) {
        return std::log(-std::expm1(x));
    }
    return std::log1p(-std::exp(x));
}

/**
 * @brief Per-period survival exponent max(0, 1 + alpha*t)
 */
inline double clippedExponent(double alpha, int t) {
    return std::max(0.0, 1.0 + alpha * static_cast<double>(t));
}

/**
 * @brief Prefix sums of the clipped exponents
 *
 * C[0] = 0, C[t] = C[t-1] + max(0, 1 + alpha*t) for t = 1..T.
 * In the likelihood, cumA[t] = C[t-1] and cumB[t] = C[t].
 * With alpha = 0, C[t] = t.
 *
 * @param alpha Time-varying churn term
 * @param T Number of periods
 * @return Vector of size T + 1, non-decreasing
 */
inline std::vector<double> cumulativeExponents(double alpha, int T) {
    std::vector<double> C(static_cast<size_t>(std::max(T, 0)) + 1, 0.0);
    for (int t = 1; t <= T; ++t) {
        C[t] = C[t - 1] + clippedExponent(alpha, t);
    }
    return C;
}

/**
 * @brief Upper tail of the chi-square distribution with 1 d.o.f.
 *
 * P(X > x) = erfc(sqrt(x / 2))
 */
inline double chiSquare1Survival(double x) {
    if (!(x > 0.0)) return 1.0;
    return std::erfc(std::sqrt(0.5 * x));
}

} // namespace RetentionCalibration

#endif // MATH_UTILITIES_HH
