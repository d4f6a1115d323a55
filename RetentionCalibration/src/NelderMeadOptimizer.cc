/**
 * @file NelderMeadOptimizer.cc
 * @brief Implementation of Nelder-Mead simplex optimizer
 */

#include "NelderMeadOptimizer.hh"
#include "MathUtilities.hh"
#include "RetentionErrors.hh"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>

namespace RetentionCalibration {

NelderMeadOptimizer::NelderMeadOptimizer(const NelderMeadOptions& options)
    : m_options(options)
    , m_iterations(0)
    , m_evaluations(0)
    , m_stopReason(StopReason::MaxIterations)
{
}

void NelderMeadOptimizer::setOptions(const NelderMeadOptions& options) {
    m_options = options;
}

const NelderMeadOptions& NelderMeadOptimizer::getOptions() const {
    return m_options;
}

void NelderMeadOptimizer::setBounds(const std::vector<double>& lower, const std::vector<double>& upper) {
    if (lower.size() != upper.size()) {
        throw InvalidInputError("NelderMeadOptimizer: lower and upper bounds differ in size");
    }
    m_lowerBounds = lower;
    m_upperBounds = upper;
}

int NelderMeadOptimizer::getIterations() const {
    return m_iterations;
}

int NelderMeadOptimizer::getEvaluations() const {
    return m_evaluations;
}

bool NelderMeadOptimizer::hasConverged() const {
    return m_stopReason == StopReason::Converged;
}

StopReason NelderMeadOptimizer::getStopReason() const {
    return m_stopReason;
}

std::vector<double> NelderMeadOptimizer::clampToBounds(std::vector<double> p) const {
    if (m_lowerBounds.size() != p.size()) {
        return p;
    }
    for (size_t d = 0; d < p.size(); ++d) {
        p[d] = clamp(p[d], m_lowerBounds[d], m_upperBounds[d]);
    }
    return p;
}

double NelderMeadOptimizer::squaredDistance(const std::vector<double>& a, const std::vector<double>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = a[i] - b[i];
        s += d * d;
    }
    return s;
}

std::vector<double> NelderMeadOptimizer::optimize(
    Objective objective,
    const std::vector<double>& x0,
    const std::vector<double>& step,
    double& best_value)
{
    if (x0.empty() || step.size() != x0.size()) {
        throw InvalidInputError("NelderMeadOptimizer: x0 and step must be non-empty and of equal size");
    }
    if (!m_lowerBounds.empty() && m_lowerBounds.size() != x0.size()) {
        throw InvalidInputError("NelderMeadOptimizer: bounds do not match the parameter dimension");
    }

    typedef std::chrono::steady_clock Clock;
    const Clock::time_point start = Clock::now();

    m_iterations = 0;
    m_evaluations = 0;
    m_stopReason = StopReason::MaxIterations;

    auto f = [&](const std::vector<double>& v) -> double {
        ++m_evaluations;
        return objective(v);
    };

    const int n = static_cast<int>(x0.size());
    const int m = n + 1;  // Simplex size

    // Initialize simplex: x0, x0 + step_d along each axis
    std::vector<std::vector<double>> x(m, clampToBounds(x0));
    for (int i = 1; i < m; ++i) {
        x[i][i - 1] += step[i - 1];
        x[i] = clampToBounds(x[i]);
    }

    // Evaluate objective at simplex vertices
    std::vector<double> fx(m);
    for (int i = 0; i < m; ++i) {
        fx[i] = f(x[i]);
    }

    // Lambda to sort simplex by function value
    auto sort_simplex = [&]() {
        std::vector<int> idx(m);
        std::iota(idx.begin(), idx.end(), 0);
        std::sort(idx.begin(), idx.end(), [&](int a, int b) { return fx[a] < fx[b]; });

        std::vector<std::vector<double>> x2(m);
        std::vector<double> fx2(m);
        for (int k = 0; k < m; ++k) {
            x2[k] = x[idx[k]];
            fx2[k] = fx[idx[k]];
        }
        x.swap(x2);
        fx.swap(fx2);
    };

    auto tolerances_met = [&]() {
        double fspan = std::abs(fx[m - 1] - fx[0]);
        double xspan = 0.0;
        for (int i = 1; i < m; ++i) {
            xspan = std::max(xspan, std::sqrt(squaredDistance(x[i], x[0])));
        }
        return fspan < m_options.tol_f && xspan < m_options.tol_x;
    };

    sort_simplex();

    // Main optimization loop
    for (int iter = 0; iter < m_options.max_iter; ++iter) {
        if (tolerances_met()) {
            m_stopReason = StopReason::Converged;
            break;
        }

        if (m_options.max_seconds > 0.0) {
            std::chrono::duration<double> elapsed = Clock::now() - start;
            if (elapsed.count() > m_options.max_seconds) {
                m_stopReason = StopReason::TimeBudget;
                break;
            }
        }

        m_iterations = iter + 1;

        // Compute centroid of best n points (exclude worst)
        std::vector<double> xc(n, 0.0);
        for (int i = 0; i < n; ++i) {
            for (int d = 0; d < n; ++d) {
                xc[d] += x[i][d];
            }
        }
        for (int d = 0; d < n; ++d) {
            xc[d] /= static_cast<double>(n);
        }

        // Reflection
        std::vector<double> xr(n);
        for (int d = 0; d < n; ++d) {
            xr[d] = xc[d] + m_options.alpha * (xc[d] - x[m - 1][d]);
        }
        xr = clampToBounds(xr);
        double fr = f(xr);

        if (fr < fx[0]) {
            // Try expansion
            std::vector<double> xe(n);
            for (int d = 0; d < n; ++d) {
                xe[d] = xc[d] + m_options.gamma * (xr[d] - xc[d]);
            }
            xe = clampToBounds(xe);
            double fe = f(xe);

            if (fe < fr) {
                x[m - 1] = xe;
                fx[m - 1] = fe;
            } else {
                x[m - 1] = xr;
                fx[m - 1] = fr;
            }
        } else if (fr < fx[n - 1]) {
            // Accept reflection
            x[m - 1] = xr;
            fx[m - 1] = fr;
        } else {
            // Contraction
            std::vector<double> xk(n);
            if (fr < fx[m - 1]) {
                // Outside contraction
                for (int d = 0; d < n; ++d) {
                    xk[d] = xc[d] + m_options.rho * (xr[d] - xc[d]);
                }
            } else {
                // Inside contraction
                for (int d = 0; d < n; ++d) {
                    xk[d] = xc[d] - m_options.rho * (xc[d] - x[m - 1][d]);
                }
            }
            xk = clampToBounds(xk);
            double fk = f(xk);

            if (fk < fx[m - 1]) {
                x[m - 1] = xk;
                fx[m - 1] = fk;
            } else {
                // Shrink toward best point
                for (int i = 1; i < m; ++i) {
                    for (int d = 0; d < n; ++d) {
                        x[i][d] = x[0][d] + m_options.sigma * (x[i][d] - x[0][d]);
                    }
                    x[i] = clampToBounds(x[i]);
                    fx[i] = f(x[i]);
                }
            }
        }

        sort_simplex();
    }

    // The last iteration may have collapsed the simplex
    if (m_stopReason == StopReason::MaxIterations && tolerances_met()) {
        m_stopReason = StopReason::Converged;
    }

    best_value = fx[0];
    return x[0];
}

} // namespace RetentionCalibration
