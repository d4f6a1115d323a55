/**
 * @file Projector.cc
 * @brief Implementation of the retention forward model
 */

#include "Projector.hh"
#include "MathUtilities.hh"
#include "RetentionErrors.hh"
#include <cmath>
#include <sstream>

namespace RetentionCalibration {

namespace {

void checkArguments(const ModelParameters& params, int horizon) {
    if (!params.isValid()) {
        std::ostringstream msg;
        msg << "Projector: gamma and delta must be finite and positive, got gamma="
            << params.gamma << ", delta=" << params.delta;
        throw InvalidInputError(msg.str());
    }
    if (horizon < 1) {
        std::ostringstream msg;
        msg << "Projector: horizon must be at least 1, got " << horizon;
        throw InvalidInputError(msg.str());
    }
}

} // namespace

std::vector<double> Projector::logSurvival(const ModelParameters& params, int horizon) const {
    checkArguments(params, horizon);

    const std::vector<double> C = cumulativeExponents(params.effectiveAlpha(), horizon);
    const double logB0 = logBeta(params.gamma, params.delta);

    std::vector<double> logS(horizon + 1, 0.0);
    for (int t = 1; t <= horizon; ++t) {
        // S(t) <= S(t-1) also under lgamma rounding
        double v = logBeta(params.gamma, params.delta + C[t]) - logB0;
        logS[t] = std::min(v, logS[t - 1]);
    }
    return logS;
}

std::vector<double> Projector::survivalCurve(const ModelParameters& params, int horizon) const {
    const std::vector<double> logS = logSurvival(params, horizon);
    std::vector<double> S;
    S.reserve(horizon);
    for (int t = 1; t <= horizon; ++t) {
        S.push_back(std::exp(logS[t]));
    }
    return S;
}

std::vector<double> Projector::churnProbabilities(const ModelParameters& params, int horizon) const {
    const std::vector<double> logS = logSurvival(params, horizon);
    std::vector<double> p;
    p.reserve(horizon);
    for (int t = 1; t <= horizon; ++t) {
        // S(t-1) - S(t) = S(t-1) * (1 - S(t)/S(t-1))
        const double ratio = logS[t] - logS[t - 1];
        p.push_back(ratio == 0.0 ? 0.0 : std::exp(logS[t - 1] + log1mExp(ratio)));
    }
    return p;
}

std::vector<double> Projector::retentionRates(const ModelParameters& params, int horizon) const {
    const std::vector<double> logS = logSurvival(params, horizon);
    std::vector<double> r;
    r.reserve(horizon);
    for (int t = 1; t <= horizon; ++t) {
        r.push_back(std::exp(logS[t] - logS[t - 1]));
    }
    return r;
}

ForecastTable Projector::project(double initial_population,
                                 const ModelParameters& params,
                                 int horizon) const {
    if (!std::isfinite(initial_population) || initial_population < 0.0) {
        std::ostringstream msg;
        msg << "Projector: initial population must be finite and non-negative, got "
            << initial_population;
        throw InvalidInputError(msg.str());
    }

    const std::vector<double> S = survivalCurve(params, horizon);

    ForecastTable table;
    table.initial_population = initial_population;
    table.period.reserve(horizon);
    table.remaining.reserve(horizon);
    table.lost.reserve(horizon);

    double previous = initial_population;
    for (int t = 1; t <= horizon; ++t) {
        double remaining = clamp(initial_population * S[t - 1], 0.0, previous);
        table.period.push_back(t);
        table.remaining.push_back(remaining);
        table.lost.push_back(previous - remaining);
        previous = remaining;
    }

    return table;
}

std::vector<ComparisonRow> Projector::compare(const SurvivalTable& table,
                                              const ModelParameters& params) const {
    const ForecastTable forecast = project(table.initialPopulation(), params, table.size());
    const std::vector<double>& observed = table.remaining();

    std::vector<ComparisonRow> rows;
    rows.reserve(forecast.size());
    for (size_t i = 0; i < forecast.size(); ++i) {
        rows.push_back(ComparisonRow(forecast.period[i], observed[i], forecast.remaining[i]));
    }
    return rows;
}

} // namespace RetentionCalibration
