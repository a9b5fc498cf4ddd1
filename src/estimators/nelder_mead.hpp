#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// NelderMeadResult — output of nelder_mead_minimize()
// ---------------------------------------------------------------------------
struct NelderMeadResult {
    std::vector<double> x;
    double value = std::numeric_limits<double>::infinity();
    int iterations = 0;
    bool converged = false;
};

// ---------------------------------------------------------------------------
// nelder_mead_minimize — derivative-free simplex minimizer
//
// Unconstrained; callers handle bounds by optimizing over transformed
// parameters (log / logistic maps). Terminates after max_iter iterations at
// the latest. Converged when the spread of simplex values falls below tol.
// ---------------------------------------------------------------------------
inline NelderMeadResult nelder_mead_minimize(
    const std::vector<double>& x0,
    const std::vector<double>& step,
    const std::function<double(const std::vector<double>&)>& f,
    int max_iter = 4000,
    double tol = 1e-8)
{
    const size_t n = x0.size();
    const double alpha = 1.0, gamma = 2.0, rho = 0.5, sigma = 0.5;

    auto safe_f = [&](const std::vector<double>& x) {
        double v = f(x);
        return std::isfinite(v) ? v : std::numeric_limits<double>::max();
    };

    std::vector<std::vector<double>> simplex(n + 1, x0);
    for (size_t i = 0; i < n; ++i) simplex[i + 1][i] += step[i];
    std::vector<double> fv(n + 1);
    for (size_t i = 0; i <= n; ++i) fv[i] = safe_f(simplex[i]);

    NelderMeadResult result;
    std::vector<size_t> order(n + 1);

    int it = 0;
    for (; it < max_iter; ++it) {
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return fv[a] < fv[b]; });
        {
            std::vector<std::vector<double>> s2(n + 1);
            std::vector<double> f2(n + 1);
            for (size_t i = 0; i <= n; ++i) {
                s2[i] = simplex[order[i]];
                f2[i] = fv[order[i]];
            }
            simplex.swap(s2);
            fv.swap(f2);
        }

        if (std::abs(fv[n] - fv[0]) <= tol * (std::abs(fv[0]) + tol)) {
            result.converged = true;
            break;
        }

        // Centroid of all but the worst vertex
        std::vector<double> c(n, 0.0);
        for (size_t i = 0; i < n; ++i)
            for (size_t j = 0; j < n; ++j) c[j] += simplex[i][j];
        for (double& v : c) v /= static_cast<double>(n);

        auto along = [&](double coef) {
            std::vector<double> p(n);
            for (size_t j = 0; j < n; ++j) p[j] = c[j] + coef * (simplex[n][j] - c[j]);
            return p;
        };

        auto xr = along(-alpha);
        double fr = safe_f(xr);
        if (fr < fv[0]) {
            auto xe = along(-alpha * gamma);
            double fe = safe_f(xe);
            if (fe < fr) {
                simplex[n] = xe;
                fv[n] = fe;
            } else {
                simplex[n] = xr;
                fv[n] = fr;
            }
            continue;
        }
        if (fr < fv[n - 1]) {
            simplex[n] = xr;
            fv[n] = fr;
            continue;
        }

        bool outside = fr < fv[n];
        auto xc = outside ? along(-alpha * rho) : along(rho);
        double fc = safe_f(xc);
        if (fc < (outside ? fr : fv[n])) {
            simplex[n] = xc;
            fv[n] = fc;
            continue;
        }

        // Shrink toward the best vertex
        for (size_t i = 1; i <= n; ++i) {
            for (size_t j = 0; j < n; ++j) {
                simplex[i][j] = simplex[0][j] + sigma * (simplex[i][j] - simplex[0][j]);
            }
            fv[i] = safe_f(simplex[i]);
        }
    }

    size_t best = static_cast<size_t>(std::min_element(fv.begin(), fv.end()) - fv.begin());
    result.x = simplex[best];
    result.value = fv[best];
    result.iterations = it;
    return result;
}
