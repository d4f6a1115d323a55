/**
 * @file DataTypes.cc
 * @brief Implementation of data type methods
 */

#include "DataTypes.hh"
#include "RetentionErrors.hh"
#include <sstream>
#include <string>

namespace RetentionCalibration {

std::vector<double> ModelParameters::toVector() const {
    std::vector<double> v;
    v.push_back(gamma);
    v.push_back(delta);
    if (extended) {
        v.push_back(alpha);
    }
    return v;
}

ModelParameters ModelParameters::fromVector(const std::vector<double>& v) {
    if (v.size() < 2) {
        std::ostringstream msg;
        msg << "ModelParameters: need (gamma, delta[, alpha]), got " << v.size() << " value(s)";
        throw InvalidInputError(msg.str());
    }
    if (v.size() >= 3) {
        return ModelParameters(v[0], v[1], v[2]);
    }
    return ModelParameters(v[0], v[1]);
}

void ModelParameters::print() const {
    std::cout << "=== Beta-Geometric Model Parameters ===\n";
    std::cout << std::fixed;
    std::cout << "  gamma:                  " << std::setprecision(4) << gamma << "\n";
    std::cout << "  delta:                  " << std::setprecision(4) << delta << "\n";
    if (extended) {
        std::cout << "  alpha (churn trend):    " << std::setprecision(4) << alpha << "\n";
    }
    std::cout << "\n";
    std::cout << "Derived quantities:\n";
    std::cout << "  Mean churn probability E[theta]: " << std::setprecision(4) << meanChurnProbability() << "\n";
    std::cout << "=======================================\n";
}

bool HessianMatrix::cholesky(std::vector<double>& L) const {
    L.assign(h.size(), 0.0);
    for (int j = 0; j < n; ++j) {
        double d = (*this)(j, j);
        for (int k = 0; k < j; ++k) {
            d -= L[j * n + k] * L[j * n + k];
        }
        if (!(d > 0.0) || !std::isfinite(d)) {
            return false;
        }
        L[j * n + j] = std::sqrt(d);
        for (int i = j + 1; i < n; ++i) {
            double s = (*this)(i, j);
            for (int k = 0; k < j; ++k) {
                s -= L[i * n + k] * L[j * n + k];
            }
            L[i * n + j] = s / L[j * n + j];
        }
    }
    return true;
}

bool HessianMatrix::isPositiveDefinite() const {
    if (n == 0) return false;
    std::vector<double> L;
    return cholesky(L);
}

std::vector<double> HessianMatrix::inverse() const {
    std::vector<double> L;
    if (n == 0 || !cholesky(L)) {
        return std::vector<double>();
    }

    // Solve L L^T X = I column by column
    std::vector<double> inv(n * n, 0.0);
    std::vector<double> y(n);
    for (int c = 0; c < n; ++c) {
        // Forward substitution: L y = e_c
        for (int i = 0; i < n; ++i) {
            double s = (i == c) ? 1.0 : 0.0;
            for (int k = 0; k < i; ++k) {
                s -= L[i * n + k] * y[k];
            }
            y[i] = s / L[i * n + i];
        }
        // Back substitution: L^T x = y
        for (int i = n - 1; i >= 0; --i) {
            double s = y[i];
            for (int k = i + 1; k < n; ++k) {
                s -= L[k * n + i] * inv[k * n + c];
            }
            inv[i * n + c] = s / L[i * n + i];
        }
    }
    return inv;
}

std::vector<double> HessianMatrix::standardErrors() const {
    std::vector<double> inv = inverse();
    std::vector<double> se;
    if (inv.empty()) {
        return se;
    }
    se.reserve(n);
    for (int i = 0; i < n; ++i) {
        se.push_back(std::sqrt(inv[i * n + i]));
    }
    return se;
}

void ForecastTable::print() const {
    std::cout << std::setw(10) << "Period"
              << std::setw(15) << "Remaining"
              << std::setw(15) << "Lost" << "\n";
    std::cout << "  " << std::string(38, '-') << "\n";
    std::cout << std::setw(10) << 0
              << std::setw(15) << std::fixed << std::setprecision(2) << initial_population
              << std::setw(15) << "-" << "\n";
    for (size_t i = 0; i < period.size(); ++i) {
        std::cout << std::setw(10) << period[i]
                  << std::setw(15) << std::fixed << std::setprecision(2) << remaining[i]
                  << std::setw(15) << lost[i] << "\n";
    }
}

} // namespace RetentionCalibration
