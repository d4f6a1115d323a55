#ifndef NELDER_MEAD_OPTIMIZER_HH
#define NELDER_MEAD_OPTIMIZER_HH

/**
 * @file NelderMeadOptimizer.hh
 * @brief Nelder-Mead simplex optimizer for N-dimensional parameter spaces
 *
 * Implements the Nelder-Mead algorithm for minimizing functions
 * of N variables within box bounds. This is a derivative-free method
 * with no convergence guarantee on non-convex surfaces: callers must
 * check hasConverged().
 */

#include "DataTypes.hh"
#include <functional>
#include <vector>

namespace RetentionCalibration {

/**
 * @brief Why the last search stopped
 */
enum class StopReason {
    Converged,      ///< tol_f and tol_x both met
    MaxIterations,  ///< max_iter reached
    TimeBudget      ///< max_seconds exceeded
};

/**
 * @class NelderMeadOptimizer
 * @brief N-D Nelder-Mead simplex optimizer
 *
 * The algorithm maintains a simplex of N+1 points and iteratively
 * improves it by reflection, expansion, contraction, and shrinkage
 * operations. Trial points are clamped to the bounds.
 *
 * One instance runs one search at a time; use one instance per thread.
 */
class NelderMeadOptimizer {
public:
    typedef std::function<double(const std::vector<double>&)> Objective;

    /**
     * @brief Constructor with options
     * @param options Optimizer configuration
     */
    explicit NelderMeadOptimizer(const NelderMeadOptions& options = NelderMeadOptions());

    /**
     * @brief Set optimizer options
     * @param options New options
     */
    void setOptions(const NelderMeadOptions& options);

    /**
     * @brief Get current options
     * @return Current options
     */
    const NelderMeadOptions& getOptions() const;

    /**
     * @brief Set parameter bounds
     *
     * Without bounds the search is unconstrained.
     *
     * @param lower Lower bound per dimension
     * @param upper Upper bound per dimension
     */
    void setBounds(const std::vector<double>& lower, const std::vector<double>& upper);

    /**
     * @brief Optimize the objective function
     *
     * @param objective Function to minimize
     * @param x0 Initial guess
     * @param step Initial step sizes for simplex construction
     * @param[out] best_value Optimal function value found
     * @return Optimal parameters
     */
    std::vector<double> optimize(
        Objective objective,
        const std::vector<double>& x0,
        const std::vector<double>& step,
        double& best_value);

    /**
     * @brief Get number of iterations used in last optimization
     * @return Iteration count
     */
    int getIterations() const;

    /**
     * @brief Get number of objective evaluations in last optimization
     */
    int getEvaluations() const;

    /**
     * @brief Whether the last optimization met its tolerances
     */
    bool hasConverged() const;

    /**
     * @brief Why the last optimization stopped
     */
    StopReason getStopReason() const;

private:
    /**
     * @brief Clamp parameters to bounds
     */
    std::vector<double> clampToBounds(std::vector<double> p) const;

    /**
     * @brief Compute squared distance between two points
     */
    static double squaredDistance(const std::vector<double>& a, const std::vector<double>& b);

    NelderMeadOptions m_options;
    std::vector<double> m_lowerBounds;
    std::vector<double> m_upperBounds;
    int m_iterations;
    int m_evaluations;
    StopReason m_stopReason;
};

} // namespace RetentionCalibration

#endif // NELDER_MEAD_OPTIMIZER_HH
