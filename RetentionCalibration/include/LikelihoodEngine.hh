#ifndef LIKELIHOOD_ENGINE_HH
#define LIKELIHOOD_ENGINE_HH

/**
 * @file LikelihoodEngine.hh
 * @brief Negative log-likelihood of observed attrition
 *
 * Base model (shifted Beta-Geometric):
 *   P(churn in t) = B(gamma+1, delta+t-1) / B(gamma, delta)
 *   S(T)          = B(gamma, delta+T) / B(gamma, delta)
 *
 * Extended model, with C[t] = sum_{i<=t} max(0, 1 + alpha*i):
 *   P(churn in t) = (B(gamma, delta+C[t-1]) - B(gamma, delta+C[t])) / B(gamma, delta)
 *   S(T)          = B(gamma, delta+C[T]) / B(gamma, delta)
 *
 *   NLL = -[ sum_t lost[t] * log P(churn in t) + remaining[T] * log S(T) ]
 *
 * All Beta ratios are evaluated as log-Beta differences.
 */

#include "DataTypes.hh"
#include "SurvivalTable.hh"

namespace RetentionCalibration {

/**
 * @class LikelihoodEngine
 * @brief Objective function for maximum likelihood fitting
 *
 * Evaluation never throws. Infeasible proposals (gamma <= 0, delta <= 0,
 * non-finite values, or a likelihood of zero) return kInfeasiblePenalty so
 * the optimizer can step away from them.
 */
class LikelihoodEngine {
public:
    /**
     * @brief Constructor
     * @param table Observed survival table (copied)
     */
    explicit LikelihoodEngine(const SurvivalTable& table);

    /**
     * @brief NLL of the base or extended model, chosen by params.extended
     */
    double negativeLogLikelihood(const ModelParameters& params) const;

    /**
     * @brief NLL of the base (static churn) model
     */
    double base(double gamma, double delta) const;

    /**
     * @brief NLL of the extended (time-varying churn) model
     *
     * Equals base(gamma, delta) at alpha = 0.
     */
    double extended(double gamma, double delta, double alpha) const;

    /**
     * @brief Get the survival table
     */
    const SurvivalTable& getTable() const;

private:
    SurvivalTable m_table;
};

} // namespace RetentionCalibration

#endif // LIKELIHOOD_ENGINE_HH
