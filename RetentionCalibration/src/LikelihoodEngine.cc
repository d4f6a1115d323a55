/**
 * @file LikelihoodEngine.cc
 * @brief Implementation of the retention model likelihood
 */

#include "LikelihoodEngine.hh"
#include "MathUtilities.hh"
#include <cmath>

namespace RetentionCalibration {

LikelihoodEngine::LikelihoodEngine(const SurvivalTable& table)
    : m_table(table)
{
}

const SurvivalTable& LikelihoodEngine::getTable() const {
    return m_table;
}

double LikelihoodEngine::negativeLogLikelihood(const ModelParameters& params) const {
    if (params.extended) {
        return extended(params.gamma, params.delta, params.alpha);
    }
    return base(params.gamma, params.delta);
}

double LikelihoodEngine::base(double gamma, double delta) const {
    if (!(gamma > 0.0 && delta > 0.0) || !std::isfinite(gamma) || !std::isfinite(delta)) {
        return kInfeasiblePenalty;
    }

    const std::vector<double>& lost = m_table.lost();
    const int T = m_table.size();
    const double logB0 = logBeta(gamma, delta);

    double ll = 0.0;
    for (int t = 1; t <= T; ++t) {
        const double n = lost[t - 1];
        if (n == 0.0) continue;
        // log P(churn in t) = log B(gamma+1, delta+t-1) - log B(gamma, delta)
        ll += n * (logBeta(gamma + 1.0, delta + t - 1.0) - logB0);
    }

    // Right-censored survivors at T
    const double survivors = m_table.finalRemaining();
    if (survivors > 0.0) {
        ll += survivors * (logBeta(gamma, delta + T) - logB0);
    }

    const double nll = -ll;
    return std::isfinite(nll) ? nll : kInfeasiblePenalty;
}

double LikelihoodEngine::extended(double gamma, double delta, double alpha) const {
    if (!(gamma > 0.0 && delta > 0.0) || !std::isfinite(gamma) || !std::isfinite(delta)
        || !std::isfinite(alpha)) {
        return kInfeasiblePenalty;
    }

    const std::vector<double>& lost = m_table.lost();
    const int T = m_table.size();
    const double logB0 = logBeta(gamma, delta);

    // C[t-1] = cumA[t], C[t] = cumB[t]
    const std::vector<double> C = cumulativeExponents(alpha, T);

    double ll = 0.0;
    for (int t = 1; t <= T; ++t) {
        const double n = lost[t - 1];
        if (n == 0.0) continue;
        // log(B(g, d+A) - B(g, d+B)) = log B(g, d+A) + log(1 - B(g, d+B)/B(g, d+A))
        const double logBa = logBeta(gamma, delta + C[t - 1]);
        const double logBb = logBeta(gamma, delta + C[t]);
        ll += n * (logBa + log1mExp(logBb - logBa) - logB0);
    }

    const double survivors = m_table.finalRemaining();
    if (survivors > 0.0) {
        ll += survivors * (logBeta(gamma, delta + C[T]) - logB0);
    }

    const double nll = -ll;
    return std::isfinite(nll) ? nll : kInfeasiblePenalty;
}

} // namespace RetentionCalibration
