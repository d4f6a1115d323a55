#ifndef PROJECTOR_HH
#define PROJECTOR_HH

/**
 * @file Projector.hh
 * @brief Forward model: survival curves and forecasts from parameters
 *
 * Survival fraction after t periods:
 *   base:     S(t) = B(gamma, delta + t)    / B(gamma, delta)
 *   extended: S(t) = B(gamma, delta + C[t]) / B(gamma, delta)
 * with C[t] the prefix sum of max(0, 1 + alpha*i), i = 1..t.
 *
 * Since C[t] is non-decreasing and B(a, b) decreases in b, S(t) is
 * non-increasing in t and stays in [0, 1].
 */

#include "DataTypes.hh"
#include "SurvivalTable.hh"
#include <vector>

namespace RetentionCalibration {

/**
 * @class Projector
 * @brief Expected survivors, churn probabilities and retention rates
 *
 * All methods throw InvalidInputError for invalid parameters,
 * a horizon < 1, or a negative / non-finite initial population.
 */
class Projector {
public:
    /**
     * @brief Forecast survivors for periods 1..horizon
     *
     * remaining[t] = initial_population * S(t),
     * lost[t] = remaining[t-1] - remaining[t] (remaining[0] = initial_population)
     *
     * @param initial_population Cohort size at period 0
     * @param params Model parameters (fitted or counterfactual)
     * @param horizon Number of periods H >= 1
     * @return Forecast table with H rows
     */
    ForecastTable project(double initial_population,
                          const ModelParameters& params,
                          int horizon) const;

    /**
     * @brief Survival fractions S(1..horizon)
     */
    std::vector<double> survivalCurve(const ModelParameters& params, int horizon) const;

    /**
     * @brief Probabilities P(churn in t) = S(t-1) - S(t), t = 1..horizon
     */
    std::vector<double> churnProbabilities(const ModelParameters& params, int horizon) const;

    /**
     * @brief Retention rates r(t) = S(t) / S(t-1), t = 1..horizon
     *
     * Base model: r(t) = (delta + t - 1) / (gamma + delta + t - 1).
     */
    std::vector<double> retentionRates(const ModelParameters& params, int horizon) const;

    /**
     * @brief Observed vs expected survivors over the periods of a table
     * @param table Observed survival table
     * @param params Model parameters
     * @return One row per observed period
     */
    std::vector<ComparisonRow> compare(const SurvivalTable& table,
                                       const ModelParameters& params) const;

private:
    /**
     * @brief log S(t) for t = 0..horizon (log S(0) = 0)
     */
    std::vector<double> logSurvival(const ModelParameters& params, int horizon) const;
};

} // namespace RetentionCalibration

#endif // PROJECTOR_HH
