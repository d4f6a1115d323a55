/**
 * @file ModelFitter.cc
 * @brief Implementation of the retention model fitter
 */

#include "ModelFitter.hh"
#include "Logging.hh"
#include "MathUtilities.hh"
#include "RetentionErrors.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace RetentionCalibration {

namespace {

/**
 * @brief Outcome of one simplex search
 */
struct StartOutcome {
    std::vector<double> x;
    double value;
    int iterations;
    int evaluations;
    StopReason reason;

    StartOutcome()
        : value(std::numeric_limits<double>::infinity())
        , iterations(0)
        , evaluations(0)
        , reason(StopReason::MaxIterations)
    {}

    bool converged() const { return reason == StopReason::Converged; }
};

const char* stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::Converged: return "converged";
        case StopReason::MaxIterations: return "iteration budget exhausted";
        case StopReason::TimeBudget: return "time budget exhausted";
    }
    return "unknown";
}

/**
 * @brief (gamma, delta[, alpha]) of a configuration entry, whatever its own flag
 */
std::vector<double> packed(const ModelParameters& p, bool extended) {
    std::vector<double> v;
    v.push_back(p.gamma);
    v.push_back(p.delta);
    if (extended) {
        v.push_back(p.alpha);
    }
    return v;
}

} // namespace

ModelFitter::ModelFitter(const FitConfig& config)
    : m_config(config)
{
}

void ModelFitter::setConfig(const FitConfig& config) {
    m_config = config;
}

const FitConfig& ModelFitter::getConfig() const {
    return m_config;
}

void ModelFitter::validateConfig(const FitConfig& config) {
    if (config.n_starts < 1) {
        throw InvalidInputError("ModelFitter: n_starts must be at least 1");
    }
    const std::vector<double> lo = packed(config.lower, true);
    const std::vector<double> hi = packed(config.upper, true);
    for (size_t d = 0; d < lo.size(); ++d) {
        if (!std::isfinite(lo[d]) || !std::isfinite(hi[d]) || !(lo[d] < hi[d])) {
            throw InvalidInputError("ModelFitter: bounds must be finite with lower < upper");
        }
    }
    if (!(lo[0] > 0.0 && lo[1] > 0.0)) {
        throw InvalidInputError("ModelFitter: lower bounds of gamma and delta must be positive");
    }
    if (!(config.start_spread >= 1.0) || !(config.alpha_spread >= 0.0)) {
        throw InvalidInputError("ModelFitter: start_spread must be >= 1 and alpha_spread >= 0");
    }
}

std::vector<std::vector<double>> ModelFitter::startingPoints(const FitConfig& config, bool extended) const {
    std::vector<std::vector<double>> starts;
    starts.reserve(config.n_starts);

    starts.push_back(packed(config.initial, extended));

    // Log-uniform gamma and delta, uniform alpha; drawn up front so the
    // starts do not depend on thread scheduling
    std::mt19937 rng(config.seed);
    const double log_spread = std::log(config.start_spread);
    std::uniform_real_distribution<double> log_shape(-log_spread, log_spread);
    std::uniform_real_distribution<double> trend(-config.alpha_spread, config.alpha_spread);

    for (int i = 1; i < config.n_starts; ++i) {
        std::vector<double> x;
        x.push_back(clamp(std::exp(log_shape(rng)), config.lower.gamma, config.upper.gamma));
        x.push_back(clamp(std::exp(log_shape(rng)), config.lower.delta, config.upper.delta));
        double a = trend(rng);
        if (extended) {
            x.push_back(clamp(a, config.lower.alpha, config.upper.alpha));
        }
        starts.push_back(x);
    }
    return starts;
}

FitResult ModelFitter::fit(const SurvivalTable& table) const {
    return fitWith(m_config, table, m_config.extended);
}

FitResult ModelFitter::fit(const SurvivalTable& table, bool extended) const {
    return fitWith(m_config, table, extended);
}

FitResult ModelFitter::fitWith(const FitConfig& config, const SurvivalTable& table, bool extended) const {
    validateConfig(config);

    FitResult result;
    const LikelihoodEngine engine(table);

    RETENTION_LOGV(RETENTION_LOG_INFO, "ModelFitter: fitting " << (extended ? "extended" : "base")
                   << " model to " << table.size() << " periods (cohort " << table.initialPopulation()
                   << ") from " << config.n_starts << " start(s)");

    // Objective function
    auto objective = [&engine, extended](const std::vector<double>& v) -> double {
        if (extended) {
            return engine.extended(v[0], v[1], v[2]);
        }
        return engine.base(v[0], v[1]);
    };

    const std::vector<double> lo = packed(config.lower, extended);
    const std::vector<double> hi = packed(config.upper, extended);
    const std::vector<double> step = packed(config.step, extended);
    const std::vector<std::vector<double>> starts = startingPoints(config, extended);
    const int n_starts = static_cast<int>(starts.size());

    // Each start gets its own optimizer; the engine is only read
    std::vector<StartOutcome> outcomes(n_starts);

    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n_starts; ++i) {
        NelderMeadOptimizer optimizer(config.optimizer);
        optimizer.setBounds(lo, hi);
        StartOutcome& out = outcomes[i];
        out.x = optimizer.optimize(objective, starts[i], step, out.value);
        out.iterations = optimizer.getIterations();
        out.evaluations = optimizer.getEvaluations();
        out.reason = optimizer.getStopReason();
    }

    // Select best converged start, or best overall if none converged
    int best = -1;
    double conv_min = std::numeric_limits<double>::infinity();
    double conv_max = -std::numeric_limits<double>::infinity();
    for (int i = 0; i < n_starts; ++i) {
        const StartOutcome& out = outcomes[i];
        RETENTION_LOGV(RETENTION_LOG_DEBUG, "ModelFitter: start " << i << " -> nll=" << out.value
                       << " after " << out.iterations << " iterations (" << stopReasonName(out.reason) << ")");
        result.diagnostics.evaluations += out.evaluations;
        if (out.converged()) {
            ++result.diagnostics.startsConverged;
            conv_min = std::min(conv_min, out.value);
            conv_max = std::max(conv_max, out.value);
        }
        if (best < 0) {
            best = i;
            continue;
        }
        const StartOutcome& cur = outcomes[best];
        if (out.converged() != cur.converged()) {
            if (out.converged()) best = i;
        } else if (out.value < cur.value) {
            best = i;
        }
    }

    result.diagnostics.starts = n_starts;
    if (result.diagnostics.startsConverged > 1) {
        result.diagnostics.objectiveSpread = conv_max - conv_min;
    }

    StartOutcome selected = outcomes[best];
    result.iterations = selected.iterations;

    // Polish: rebuild the simplex around the optimum and search again
    if (config.polish) {
        std::vector<double> polish_step(step.size());
        for (size_t d = 0; d < step.size(); ++d) {
            double s = 0.1 * std::abs(selected.x[d]);
            polish_step[d] = (s > 1e-3) ? s : 0.1 * step[d];
        }

        NelderMeadOptimizer optimizer(config.optimizer);
        optimizer.setBounds(lo, hi);
        double value = 0.0;
        std::vector<double> x = optimizer.optimize(objective, selected.x, polish_step, value);

        if (value <= selected.value) {
            selected.x = x;
            selected.value = value;
        }
        selected.reason = optimizer.getStopReason();
        result.iterations += optimizer.getIterations();
        result.diagnostics.evaluations += optimizer.getEvaluations();
        result.diagnostics.polished = true;
    }

    result.params = ModelParameters::fromVector(selected.x);
    result.negLogLikelihood = selected.value;
    result.diagnostics.stopReason = selected.reason;

    // An optimum on the box is an artefact of the bounds, not a maximum likelihood estimate
    result.diagnostics.boundActive.assign(selected.x.size(), false);
    for (size_t d = 0; d < selected.x.size(); ++d) {
        const double tol_lo = std::max(config.optimizer.tol_x, 1e-8 * std::max(1.0, std::abs(lo[d])));
        const double tol_hi = std::max(config.optimizer.tol_x, 1e-8 * std::max(1.0, std::abs(hi[d])));
        if (selected.x[d] - lo[d] <= tol_lo || hi[d] - selected.x[d] <= tol_hi) {
            result.diagnostics.boundActive[d] = true;
            result.diagnostics.atBound = true;
        }
    }
    result.converged = selected.converged() && !result.diagnostics.atBound;

    if (config.compute_hessian) {
        result.hessian = computeHessian(engine, result.params);
        result.diagnostics.hessianPositiveDefinite = result.hessian.isPositiveDefinite();
        if (!result.diagnostics.atBound) {
            result.standardErrors = result.hessian.standardErrors();
        }
    }

    if (extended) {
        RETENTION_LOGV(RETENTION_LOG_INFO, "ModelFitter: gamma=" << result.params.gamma
                       << ", delta=" << result.params.delta << ", alpha=" << result.params.alpha
                       << ", nll=" << result.negLogLikelihood);
    } else {
        RETENTION_LOGV(RETENTION_LOG_INFO, "ModelFitter: gamma=" << result.params.gamma
                       << ", delta=" << result.params.delta << ", nll=" << result.negLogLikelihood);
    }

    if (result.diagnostics.atBound) {
        const char* names[3] = {"gamma", "delta", "alpha"};
        for (size_t d = 0; d < selected.x.size(); ++d) {
            if (result.diagnostics.boundActive[d]) {
                RETENTION_LOGV(RETENTION_LOG_WARN, "ModelFitter: " << names[d] << "=" << selected.x[d]
                               << " is on its bound [" << lo[d] << ", " << hi[d]
                               << "]; no interior optimum, standard errors withheld");
            }
        }
    } else if (!result.converged) {
        RETENTION_LOGV(RETENTION_LOG_WARN, "ModelFitter: search did not converge ("
                       << stopReasonName(result.diagnostics.stopReason) << "); the estimate is best-effort");
    }
    if (result.diagnostics.startsConverged > 1 && result.diagnostics.objectiveSpread > 1e-3) {
        RETENTION_LOGV(RETENTION_LOG_WARN, "ModelFitter: converged starts disagree by "
                       << result.diagnostics.objectiveSpread << " in nll; local optima present");
    }

    return result;
}

HessianMatrix ModelFitter::computeHessian(const LikelihoodEngine& engine,
                                          const ModelParameters& params) const {
    const std::vector<double> x = params.toVector();
    const int n = static_cast<int>(x.size());

    // Relative step sizes; keep gamma, delta +/- h positive
    std::vector<double> h(n);
    for (int i = 0; i < n; ++i) {
        h[i] = 1e-4 * std::max(1.0, std::abs(x[i]));
        if (i < 2) {
            h[i] = std::min(h[i], 0.5 * x[i]);
        }
    }

    // Create evaluation function
    auto eval = [&engine, &x](int i, double di, int j, double dj) -> double {
        std::vector<double> y = x;
        if (i >= 0) y[i] += di;
        if (j >= 0) y[j] += dj;
        return engine.negativeLogLikelihood(ModelParameters::fromVector(y));
    };

    const double f00 = eval(-1, 0.0, -1, 0.0);

    // Central differences
    HessianMatrix H(n);
    for (int i = 0; i < n; ++i) {
        double fp = eval(i, +h[i], -1, 0.0);
        double fm = eval(i, -h[i], -1, 0.0);
        H(i, i) = (fp - 2.0 * f00 + fm) / (h[i] * h[i]);

        for (int j = i + 1; j < n; ++j) {
            double fpp = eval(i, +h[i], j, +h[j]);
            double fpm = eval(i, +h[i], j, -h[j]);
            double fmp = eval(i, -h[i], j, +h[j]);
            double fmm = eval(i, -h[i], j, -h[j]);
            H(i, j) = (fpp - fpm - fmp + fmm) / (4.0 * h[i] * h[j]);
            H(j, i) = H(i, j);
        }
    }

    return H;
}

std::vector<std::pair<double, double>> ModelFitter::profileLikelihoodAlpha(
    const SurvivalTable& table,
    const ModelParameters& params_opt,
    double alpha_min,
    double alpha_max,
    int n_grid) const
{
    if (n_grid < 2 || !std::isfinite(alpha_min) || !std::isfinite(alpha_max) || !(alpha_min < alpha_max)) {
        throw InvalidInputError("ModelFitter: profile grid needs n_grid >= 2 and alpha_min < alpha_max");
    }
    if (!params_opt.isValid()) {
        throw InvalidInputError("ModelFitter: profile start parameters must have positive gamma and delta");
    }

    const LikelihoodEngine engine(table);

    std::vector<double> lo;
    lo.push_back(m_config.lower.gamma);
    lo.push_back(m_config.lower.delta);
    std::vector<double> hi;
    hi.push_back(m_config.upper.gamma);
    hi.push_back(m_config.upper.delta);

    std::vector<double> x0;
    x0.push_back(params_opt.gamma);
    x0.push_back(params_opt.delta);
    std::vector<double> step;
    step.push_back(std::max(0.1 * params_opt.gamma, 0.05));
    step.push_back(std::max(0.1 * params_opt.delta, 0.05));

    std::vector<std::pair<double, double>> profile;
    profile.reserve(n_grid);

    NelderMeadOptimizer optimizer(m_config.optimizer);
    optimizer.setBounds(lo, hi);

    for (int i = 0; i < n_grid; ++i) {
        double alpha = alpha_min + (alpha_max - alpha_min) * static_cast<double>(i) / (n_grid - 1);

        // 2D optimization over (gamma, delta) with alpha fixed
        auto objective = [&engine, alpha](const std::vector<double>& v) -> double {
            return engine.extended(v[0], v[1], alpha);
        };

        double best_nll = 0.0;
        optimizer.optimize(objective, x0, step, best_nll);
        profile.push_back(std::make_pair(alpha, best_nll));
    }

    return profile;
}

ModelComparison ModelFitter::compareModels(const SurvivalTable& table) const {
    ModelComparison comparison;
    comparison.base = fitWith(m_config, table, false);

    // Nested model: the extended search starts at the base optimum
    FitConfig ext_config = m_config;
    ext_config.initial = ModelParameters(comparison.base.params.gamma, comparison.base.params.delta, 0.0);
    comparison.extended = fitWith(ext_config, table, true);

    comparison.lrStatistic = std::max(0.0,
        2.0 * (comparison.base.negLogLikelihood - comparison.extended.negLogLikelihood));
    comparison.pValue = chiSquare1Survival(comparison.lrStatistic);

    RETENTION_LOGV(RETENTION_LOG_INFO, "ModelFitter: likelihood ratio " << comparison.lrStatistic
                   << ", p-value " << comparison.pValue);

    return comparison;
}

void FitResult::print() const {
    std::cout << "=== Fit Results ===\n\n";
    params.print();
    std::cout << std::fixed;
    std::cout << "  Negative log-likelihood: " << std::setprecision(6) << negLogLikelihood << "\n";
    std::cout << "  Iterations: " << iterations << "\n";
    std::cout << "  Converged: " << (converged ? "Yes" : "No")
              << " (" << stopReasonName(diagnostics.stopReason)
              << (diagnostics.atBound ? ", optimum on a parameter bound" : "") << ")\n";
    std::cout << "  Starts: " << diagnostics.starts
              << ", converged: " << diagnostics.startsConverged
              << ", nll spread: " << std::scientific << std::setprecision(3)
              << diagnostics.objectiveSpread << "\n";

    if (!hessian.empty()) {
        const char* names[3] = {"gamma", "delta", "alpha"};
        std::cout << "  Hessian positive definite: "
                  << (diagnostics.hessianPositiveDefinite ? "Yes" : "No") << "\n";
        for (size_t i = 0; i < standardErrors.size(); ++i) {
            std::cout << "  SE(" << names[i] << ") ~ " << std::fixed << std::setprecision(4)
                      << standardErrors[i] << "\n";
        }
    }
    std::cout << std::fixed << "\n";
}

void ModelComparison::print() const {
    std::cout << "=== Model Comparison (extended vs base) ===\n";
    std::cout << std::fixed;
    std::cout << "  NLL base:      " << std::setprecision(6) << base.negLogLikelihood << "\n";
    std::cout << "  NLL extended:  " << std::setprecision(6) << extended.negLogLikelihood << "\n";
    std::cout << "  alpha:         " << std::setprecision(4) << extended.params.alpha << "\n";
    std::cout << "  LR statistic:  " << std::setprecision(4) << lrStatistic << "\n";
    std::cout << "  p-value:       " << std::scientific << std::setprecision(3) << pValue << "\n";
    std::cout << std::fixed;
    std::cout << "===========================================\n";
}

} // namespace RetentionCalibration
