#ifndef MODEL_FITTER_HH
#define MODEL_FITTER_HH

/**
 * @file ModelFitter.hh
 * @brief Maximum likelihood fitting of the retention model
 *
 * Provides high-level interface for:
 * - Fitting (gamma, delta) or (gamma, delta, alpha) to a survival table
 * - Multi-start search with convergence diagnostics
 * - Uncertainty analysis via Hessian
 * - Profile likelihood for alpha
 * - Likelihood-ratio comparison of the extended and base models
 */

#include "DataTypes.hh"
#include "LikelihoodEngine.hh"
#include "NelderMeadOptimizer.hh"
#include "SurvivalTable.hh"
#include <limits>
#include <utility>
#include <vector>

namespace RetentionCalibration {

/**
 * @struct FitDiagnostics
 * @brief How the optimum was reached
 */
struct FitDiagnostics {
    int starts;                    ///< Starting points searched
    int startsConverged;           ///< Starts whose simplex met the tolerances
    double objectiveSpread;        ///< max - min NLL over converged starts
    bool polished;                 ///< Whether a polish restart was run
    bool hessianPositiveDefinite;  ///< Hessian at the optimum is positive definite
    bool atBound;                  ///< Some parameter sits on its FitConfig bound
    std::vector<bool> boundActive; ///< Per parameter (gamma, delta[, alpha])
    StopReason stopReason;         ///< Stop reason of the final search
    int evaluations;               ///< Objective evaluations over all searches

    FitDiagnostics()
        : starts(0)
        , startsConverged(0)
        , objectiveSpread(0.0)
        , polished(false)
        , hessianPositiveDefinite(false)
        , atBound(false)
        , stopReason(StopReason::MaxIterations)
        , evaluations(0)
    {}
};

/**
 * @struct FitResult
 * @brief Results from model fitting
 */
struct FitResult {
    ModelParameters params;             ///< Optimal parameters
    double negLogLikelihood;            ///< Negative log-likelihood at optimum
    HessianMatrix hessian;              ///< Hessian at optimum (empty if not computed)
    std::vector<double> standardErrors; ///< sqrt(diag(H^-1)), empty if H is not PD or at a bound
    int iterations;                     ///< Iterations of the selected start (+ polish)
    bool converged;                     ///< Simplex converged to an interior optimum
    FitDiagnostics diagnostics;

    FitResult()
        : negLogLikelihood(std::numeric_limits<double>::infinity())
        , iterations(0)
        , converged(false)
    {}

    /**
     * @brief Print a fit report
     */
    void print() const;
};

/**
 * @struct ModelComparison
 * @brief Likelihood-ratio test of the extended model against the base model
 */
struct ModelComparison {
    FitResult base;
    FitResult extended;
    double lrStatistic;  ///< 2 * (NLL_base - NLL_extended), >= 0
    double pValue;       ///< Chi-square (1 d.o.f.) upper tail of lrStatistic

    ModelComparison() : lrStatistic(0.0), pValue(1.0) {}

    /**
     * @brief Whether alpha is significant at the given level
     */
    bool preferExtended(double significance = 0.05) const {
        return pValue < significance;
    }

    /**
     * @brief Print comparison report
     */
    void print() const;
};

/**
 * @class ModelFitter
 * @brief Drives the Nelder-Mead search over the LikelihoodEngine
 *
 * No guarantee of global optimality: the objective is non-convex in
 * (gamma, delta, alpha) and a simplex can stall. Check
 * FitResult::converged, and use FitConfig::n_starts > 1 to search from
 * several starting points.
 */
class ModelFitter {
public:
    /**
     * @brief Constructor
     * @param config Fitting configuration
     */
    explicit ModelFitter(const FitConfig& config = FitConfig());

    /**
     * @brief Set fitting configuration
     * @param config New configuration
     */
    void setConfig(const FitConfig& config);

    /**
     * @brief Get current configuration
     */
    const FitConfig& getConfig() const;

    /**
     * @brief Fit the model selected by FitConfig::extended
     */
    FitResult fit(const SurvivalTable& table) const;

    /**
     * @brief Fit the base (extended = false) or extended model
     * @param table Observed survival table
     * @param extended Whether to fit alpha as well
     * @return Fit results including optimal parameters and diagnostics
     * @throws InvalidInputError for an inconsistent configuration
     */
    FitResult fit(const SurvivalTable& table, bool extended) const;

    /**
     * @brief Compute Hessian of the NLL by central differences
     * @param engine Likelihood to differentiate
     * @param params Parameters at which to evaluate the Hessian
     * @return 2x2 (base) or 3x3 (extended) Hessian
     */
    HessianMatrix computeHessian(const LikelihoodEngine& engine,
                                 const ModelParameters& params) const;

    /**
     * @brief Compute profile likelihood for alpha
     *
     * Fixes alpha at grid points and minimizes the extended NLL over
     * (gamma, delta), starting from params_opt.
     *
     * @param table Observed survival table
     * @param params_opt Optimal parameters (start of each inner search)
     * @param alpha_min Minimum alpha value
     * @param alpha_max Maximum alpha value
     * @param n_grid Number of grid points (>= 2)
     * @return Vector of (alpha, profile_nll) pairs
     */
    std::vector<std::pair<double, double>> profileLikelihoodAlpha(
        const SurvivalTable& table,
        const ModelParameters& params_opt,
        double alpha_min,
        double alpha_max,
        int n_grid = 41) const;

    /**
     * @brief Fit both models and run a likelihood-ratio test
     *
     * The extended search starts from the base optimum with alpha = 0,
     * so the extended NLL ends at or below the base NLL unless a
     * random start that converged elsewhere is selected instead.
     */
    ModelComparison compareModels(const SurvivalTable& table) const;

private:
    /**
     * @brief Throw InvalidInputError if the configuration is unusable
     */
    static void validateConfig(const FitConfig& config);

    /**
     * @brief First start from FitConfig::initial, the rest random
     */
    std::vector<std::vector<double>> startingPoints(const FitConfig& config, bool extended) const;

    FitResult fitWith(const FitConfig& config, const SurvivalTable& table, bool extended) const;

    FitConfig m_config;
};

} // namespace RetentionCalibration

#endif // MODEL_FITTER_HH
