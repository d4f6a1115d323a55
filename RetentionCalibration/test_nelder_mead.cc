/**
 * @file test_nelder_mead.cc
 * @brief Test program for the N-D Nelder-Mead optimizer
 *
 * Checks:
 * 1. Convergence on a shifted quadratic and on Rosenbrock
 * 2. Bounds clamping
 * 3. Iteration and wall-clock budgets
 * 4. Argument validation
 */

#include "NelderMeadOptimizer.hh"
#include "RetentionErrors.hh"

#include <chrono>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <string>
#include <thread>
#include <vector>

using namespace RetentionCalibration;

static int g_failures = 0;

static void check(bool ok, const std::string& name) {
    std::cout << "  " << std::left << std::setw(60) << name << std::right
              << std::setw(6) << (ok ? "PASS" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static double quadratic(const std::vector<double>& v) {
    double a = v[0] - 3.0;
    double b = v[1] + 1.5;
    double c = v[2] - 0.25;
    return a * a + 4.0 * b * b + 10.0 * c * c + 2.0;
}

static double rosenbrock(const std::vector<double>& v) {
    double a = 1.0 - v[0];
    double b = v[1] - v[0] * v[0];
    return a * a + 100.0 * b * b;
}

int main() {
    std::cout << "========================================\n";
    std::cout << "NelderMeadOptimizer Test\n";
    std::cout << "========================================\n\n";

    //------------------------------------------------------------------
    // 1. Convergence
    //------------------------------------------------------------------
    std::cout << "Convergence:\n";
    {
        NelderMeadOptimizer nm;
        double fmin = 0.0;
        std::vector<double> x = nm.optimize(quadratic, {0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}, fmin);
        std::cout << "    quadratic: x = (" << x[0] << ", " << x[1] << ", " << x[2]
                  << "), f = " << fmin << ", iterations = " << nm.getIterations() << "\n";
        check(nm.hasConverged(), "quadratic converged");
        check(nm.getStopReason() == StopReason::Converged, "stop reason is Converged");
        check(std::abs(x[0] - 3.0) < 1e-4 && std::abs(x[1] + 1.5) < 1e-4
              && std::abs(x[2] - 0.25) < 1e-4, "quadratic minimizer found");
        check(std::abs(fmin - 2.0) < 1e-8, "quadratic minimum value 2");
        check(nm.getEvaluations() > nm.getIterations(), "evaluations counted");
    }
    {
        NelderMeadOptimizer nm;
        double fmin = 0.0;
        std::vector<double> x = nm.optimize(rosenbrock, {-1.2, 1.0}, {0.5, 0.5}, fmin);
        std::cout << "    rosenbrock: x = (" << x[0] << ", " << x[1] << "), f = " << fmin << "\n";
        check(nm.hasConverged(), "rosenbrock converged");
        check(std::abs(x[0] - 1.0) < 1e-3 && std::abs(x[1] - 1.0) < 1e-3, "rosenbrock minimizer (1, 1)");
    }
    std::cout << "\n";

    //------------------------------------------------------------------
    // 2. Bounds
    //------------------------------------------------------------------
    std::cout << "Bounds:\n";
    {
        NelderMeadOptimizer nm;
        nm.setBounds({4.0, -10.0, -10.0}, {10.0, 10.0, 0.0});
        double fmin = 0.0;
        std::vector<double> x = nm.optimize(quadratic, {8.0, 0.0, -1.0}, {1.0, 1.0, 0.5}, fmin);
        std::cout << "    bounded: x = (" << x[0] << ", " << x[1] << ", " << x[2] << ")\n";
        check(x[0] >= 4.0 && x[2] <= 0.0, "solution inside the box");
        check(std::abs(x[0] - 4.0) < 1e-4, "active lower bound reached");
        check(std::abs(x[2]) < 1e-4, "active upper bound reached");
        check(std::abs(x[1] + 1.5) < 1e-4, "free coordinate still optimal");
    }
    {
        // Starting point and simplex outside the box are clamped before evaluation
        NelderMeadOptimizer nm;
        nm.setBounds({0.0, 0.0}, {2.0, 2.0});
        bool inside = true;
        NelderMeadOptimizer::Objective watched = [&](const std::vector<double>& v) {
            inside = inside && v[0] >= 0.0 && v[0] <= 2.0 && v[1] >= 0.0 && v[1] <= 2.0;
            return rosenbrock(v);
        };
        double fmin = 0.0;
        nm.optimize(watched, {-5.0, 7.0}, {3.0, 3.0}, fmin);
        check(inside, "objective never evaluated outside the bounds");
    }
    {
        NelderMeadOptimizer nm;
        bool thrown = false;
        try {
            nm.setBounds({0.0, 0.0}, {1.0});
        } catch (const InvalidInputError&) {
            thrown = true;
        }
        check(thrown, "mismatched bound sizes rejected");
    }
    std::cout << "\n";

    //------------------------------------------------------------------
    // 3. Budgets
    //------------------------------------------------------------------
    std::cout << "Budgets:\n";
    {
        NelderMeadOptions options;
        options.max_iter = 3;
        NelderMeadOptimizer nm(options);
        double fmin = 0.0;
        nm.optimize(rosenbrock, {-1.2, 1.0}, {0.5, 0.5}, fmin);
        check(!nm.hasConverged(), "max_iter = 3 does not converge");
        check(nm.getStopReason() == StopReason::MaxIterations, "stop reason is MaxIterations");
        check(nm.getIterations() == 3, "exactly 3 iterations");
        check(std::isfinite(fmin), "best value still reported");
    }
    {
        NelderMeadOptions options;
        options.max_iter = 1000000;
        options.tol_f = -1.0;  // never met
        options.max_seconds = 0.02;
        NelderMeadOptimizer nm(options);
        NelderMeadOptimizer::Objective slow = [](const std::vector<double>& v) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            return rosenbrock(v);
        };
        double fmin = 0.0;
        nm.optimize(slow, {-1.2, 1.0}, {0.5, 0.5}, fmin);
        check(nm.getStopReason() == StopReason::TimeBudget, "stop reason is TimeBudget");
        check(!nm.hasConverged(), "time budget is not convergence");
        check(nm.getIterations() < 1000000, "search stopped early");
    }
    std::cout << "\n";

    //------------------------------------------------------------------
    // 4. Argument validation
    //------------------------------------------------------------------
    std::cout << "Argument validation:\n";
    {
        NelderMeadOptimizer nm;
        double fmin = 0.0;
        bool thrown = false;
        try {
            nm.optimize(rosenbrock, {0.0, 0.0}, {1.0}, fmin);
        } catch (const InvalidInputError&) {
            thrown = true;
        }
        check(thrown, "step of wrong size rejected");

        thrown = false;
        nm.setBounds({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0});
        try {
            nm.optimize(rosenbrock, {0.5, 0.5}, {0.1, 0.1}, fmin);
        } catch (const InvalidInputError&) {
            thrown = true;
        }
        check(thrown, "bounds of wrong dimension rejected");
    }

    std::cout << "\n========================================\n";
    if (g_failures > 0) {
        std::cout << g_failures << " check(s) FAILED\n";
        std::cout << "========================================\n";
        return 1;
    }
    std::cout << "All tests completed successfully!\n";
    std::cout << "========================================\n";
    return 0;
}
