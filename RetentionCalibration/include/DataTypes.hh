#ifndef DATA_TYPES_HH
#define DATA_TYPES_HH

/**
 * @file DataTypes.hh
 * @brief Data structures for cohort retention fitting and forecasting
 *
 * Defines the core value types used across the module:
 * - ModelParameters: Beta-Geometric shape parameters (+ optional alpha)
 * - NelderMeadOptions: Simplex optimizer configuration
 * - FitConfig: Configuration for the fitting procedure
 * - HessianMatrix: NxN Hessian for uncertainty analysis
 * - ForecastTable: Model-implied survival table
 * - ComparisonRow: Observed vs expected counts for one period
 */

#include <vector>
#include <iostream>
#include <iomanip>
#include <cmath>

namespace RetentionCalibration {

/**
 * @brief Parameters of the (shifted) Beta-Geometric retention model
 *
 * The latent per-period churn probability theta of a customer follows
 * Beta(gamma, delta). The extended model raises the per-period survival
 * factor (1 - theta) to the power max(0, 1 + alpha*t):
 * - alpha < 0: churn propensity decays over time (loyalty)
 * - alpha > 0: churn propensity grows over time (novelty wearing off)
 * - alpha = 0: identical to the base model
 */
struct ModelParameters {
    double gamma;   ///< Beta shape parameter (>0)
    double delta;   ///< Beta shape parameter (>0)
    double alpha;   ///< Time-varying churn term, used only when extended
    bool extended;  ///< Whether alpha is part of the model

    ModelParameters() : gamma(1.0), delta(1.0), alpha(0.0), extended(false) {}
    ModelParameters(double gamma_val, double delta_val)
        : gamma(gamma_val), delta(delta_val), alpha(0.0), extended(false) {}
    ModelParameters(double gamma_val, double delta_val, double alpha_val)
        : gamma(gamma_val), delta(delta_val), alpha(alpha_val), extended(true) {}

    /**
     * @brief Number of free parameters (2 for base, 3 for extended)
     */
    int dimension() const {
        return extended ? 3 : 2;
    }

    /**
     * @brief alpha as seen by the formulas (0 for the base model)
     */
    double effectiveAlpha() const {
        return extended ? alpha : 0.0;
    }

    /**
     * @brief Check the shape parameters are finite and positive
     */
    bool isValid() const {
        return std::isfinite(gamma) && std::isfinite(delta) && gamma > 0.0 && delta > 0.0
            && (!extended || std::isfinite(alpha));
    }

    /**
     * @brief Mean of the latent churn probability, gamma / (gamma + delta)
     */
    double meanChurnProbability() const {
        return gamma / (gamma + delta);
    }

    /**
     * @brief Pack into an optimizer vector (gamma, delta[, alpha])
     */
    std::vector<double> toVector() const;

    /**
     * @brief Unpack from an optimizer vector; size 3 means extended
     * @throws InvalidInputError for fewer than two values
     */
    static ModelParameters fromVector(const std::vector<double>& v);

    /**
     * @brief Print parameters
     */
    void print() const;
};

/**
 * @brief Options for Nelder-Mead optimizer
 */
struct NelderMeadOptions {
    int max_iter;       ///< Maximum iterations
    double tol_f;       ///< Tolerance on function value
    double tol_x;       ///< Tolerance on parameter values
    double alpha;       ///< Reflection coefficient
    double gamma;       ///< Expansion coefficient
    double rho;         ///< Contraction coefficient
    double sigma;       ///< Shrink coefficient
    double max_seconds; ///< Wall-clock budget per search (<= 0: unlimited)

    NelderMeadOptions()
        : max_iter(5000)
        , tol_f(1e-10)
        , tol_x(1e-8)
        , alpha(1.0)
        , gamma(2.0)
        , rho(0.5)
        , sigma(0.5)
        , max_seconds(0.0)
    {}
};

/**
 * @brief Configuration for the fitting procedure
 *
 * The defaults reproduce the reference behaviour: a single simplex search
 * started at gamma = 1, delta = 1 (alpha = 0 for the extended model).
 */
struct FitConfig {
    bool extended;             ///< Fit (gamma, delta, alpha) instead of (gamma, delta)
    ModelParameters initial;   ///< Starting point of the first search
    ModelParameters step;      ///< Initial simplex step per parameter
    ModelParameters lower;     ///< Lower bounds
    ModelParameters upper;     ///< Upper bounds
    int n_starts;              ///< Number of starting points (1 = single start)
    unsigned int seed;         ///< Seed for the random starting points
    double start_spread;       ///< Random starts: gamma, delta in [1/spread, spread]
    double alpha_spread;       ///< Random starts: alpha in [-alpha_spread, alpha_spread]
    bool polish;               ///< Restart the simplex once at the optimum
    bool compute_hessian;      ///< Evaluate Hessian and standard errors at the optimum
    NelderMeadOptions optimizer;

    FitConfig()
        : extended(false)
        , initial(1.0, 1.0, 0.0)
        , step(0.5, 0.5, 0.1)
        , lower(1e-6, 1e-6, -1e3)
        , upper(1e6, 1e6, 1e3)
        , n_starts(1)
        , seed(12345u)
        , start_spread(10.0)
        , alpha_spread(0.2)
        , polish(true)
        , compute_hessian(true)
    {}
};

/**
 * @brief Symmetric NxN Hessian matrix for parameter uncertainty
 *
 * Stored row-major. Parameter order is (gamma, delta[, alpha]).
 */
struct HessianMatrix {
    int n;
    std::vector<double> h;

    HessianMatrix() : n(0) {}
    explicit HessianMatrix(int dim) : n(dim), h(dim * dim, 0.0) {}

    double& operator()(int i, int j) { return h[i * n + j]; }
    double operator()(int i, int j) const { return h[i * n + j]; }

    bool empty() const { return n == 0; }

    /**
     * @brief Cholesky factorisation H = L L^T
     * @param[out] L Lower-triangular factor (row-major)
     * @return false if the matrix is not positive definite
     */
    bool cholesky(std::vector<double>& L) const;

    /**
     * @brief Check if matrix is positive definite
     */
    bool isPositiveDefinite() const;

    /**
     * @brief Inverse of the matrix via its Cholesky factor
     * @return Row-major inverse, empty if not positive definite
     */
    std::vector<double> inverse() const;

    /**
     * @brief Standard errors sqrt(diag(H^-1))
     * @return Empty if not positive definite
     */
    std::vector<double> standardErrors() const;
};

/**
 * @brief Model-implied survival table for periods 1..H
 */
struct ForecastTable {
    double initial_population;   ///< Cohort size at period 0
    std::vector<int> period;     ///< 1..H
    std::vector<double> remaining; ///< Expected customers still active
    std::vector<double> lost;    ///< Expected customers lost in the period

    ForecastTable() : initial_population(0.0) {}

    size_t size() const { return period.size(); }

    /**
     * @brief Print the table
     */
    void print() const;
};

/**
 * @brief Observed vs model-expected survivors for one period
 */
struct ComparisonRow {
    int period;
    double observed;   ///< Observed remaining customers
    double expected;   ///< Model-expected remaining customers
    double residual;   ///< observed - expected

    ComparisonRow() : period(0), observed(0.0), expected(0.0), residual(0.0) {}
    ComparisonRow(int t, double obs, double exp_val)
        : period(t), observed(obs), expected(exp_val), residual(obs - exp_val) {}
};

} // namespace RetentionCalibration

#endif // DATA_TYPES_HH
