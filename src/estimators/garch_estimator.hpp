#pragma once

#include "analysis/descriptive_stats.hpp"
#include "analysis/statistical_tests.hpp"
#include "core/errors.hpp"
#include "estimators/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GarchKind — conditional-volatility model family
// ---------------------------------------------------------------------------
enum class GarchKind { GARCH, EGARCH, TGARCH };

inline const char* to_string(GarchKind k) {
    switch (k) {
        case GarchKind::GARCH:  return "GARCH";
        case GarchKind::EGARCH: return "EGARCH";
        case GarchKind::TGARCH: return "TGARCH";
    }
    return "GARCH";
}

inline GarchKind parse_garch_kind(const std::string& s) {
    if (s == "GARCH" || s == "garch") return GarchKind::GARCH;
    if (s == "EGARCH" || s == "egarch") return GarchKind::EGARCH;
    if (s == "TGARCH" || s == "tgarch" || s == "GJR" || s == "gjr") return GarchKind::TGARCH;
    throw std::invalid_argument("Unknown GARCH kind: '" + s + "'");
}

// ---------------------------------------------------------------------------
// GarchConfig
// ---------------------------------------------------------------------------
struct GarchConfig {
    int max_iterations = 4000;
    double tolerance = 1e-8;
    int forecast_horizon = 10;
    int ljung_box_lags = 10;
    int arch_lm_lags = 5;
    size_t min_observations = 30;
    int rolling_window = 252;
};

// ---------------------------------------------------------------------------
// GarchDiagnostics — tests on standardized residuals (reported, never used
// to reject a fit)
// ---------------------------------------------------------------------------
struct GarchDiagnostics {
    TestResult ljung_box;
    TestResult ljung_box_squared;
    TestResult jarque_bera;
    TestResult arch_lm;
    double residual_mean = 0.0;
    double residual_std = 0.0;
    double residual_skewness = 0.0;
    double residual_kurtosis = 0.0;
};

// ---------------------------------------------------------------------------
// GarchForecast — volatility path with a fixed multiplicative envelope
// ---------------------------------------------------------------------------
struct GarchForecast {
    std::vector<double> volatility;
    std::vector<double> lower_95;
    std::vector<double> upper_95;
    std::vector<double> lower_99;
    std::vector<double> upper_99;
    double long_run_volatility = 0.0;
};

// ---------------------------------------------------------------------------
// GarchFit — result of one fit call
// ---------------------------------------------------------------------------
struct GarchFit {
    GarchKind kind = GarchKind::GARCH;
    std::map<std::string, double> params;
    std::vector<double> conditional_volatility;
    std::vector<double> standardized_residuals;
    double log_likelihood = 0.0;
    double aic = 0.0;
    double bic = 0.0;
    int num_params = 0;
    int num_obs = 0;
    int iterations = 0;
    bool converged = false;
    bool stationary = true;
    double persistence = 0.0;
    double long_run_variance = 0.0;
    GarchDiagnostics diagnostics;
    GarchForecast forecast;
    bool degraded = false;
    std::string degraded_reason;

    double param(const std::string& name, double fallback = 0.0) const {
        auto it = params.find(name);
        return it == params.end() ? fallback : it->second;
    }
};

// ---------------------------------------------------------------------------
// GarchSelection — all candidate fits plus the lowest-AIC one
// ---------------------------------------------------------------------------
struct GarchSelection {
    std::vector<GarchFit> candidates;
    GarchFit best;
};

// ---------------------------------------------------------------------------
// GarchRollingWindow / GarchRollingAnalysis — refits over sliding windows
// ---------------------------------------------------------------------------
struct GarchRollingWindow {
    int end_index = 0;
    double omega = 0.0;
    double alpha = 0.0;
    double beta = 0.0;
    double annualized_volatility = 0.0;
    double aic = 0.0;
    double bic = 0.0;
};

struct GarchRollingAnalysis {
    std::vector<GarchRollingWindow> windows;
    double alpha_std = 0.0;
    double beta_std = 0.0;
    double omega_std = 0.0;
    double volatility_std = 0.0;
    double alpha_trend = 0.0;
    double beta_trend = 0.0;
    double volatility_trend = 0.0;
    double aic_trend = 0.0;
    double avg_aic = 0.0;
    double avg_bic = 0.0;
};

namespace garch {

constexpr double VARIANCE_FLOOR = 1e-12;
constexpr double BETA_CAP = 0.999;
inline const double ABS_Z_MEAN = std::sqrt(2.0 / std::numbers::pi);  // E|z|, z ~ N(0,1)

inline int num_params(GarchKind k) {
    return k == GarchKind::GARCH ? 3 : 4;
}

inline std::vector<std::string> param_names(GarchKind k) {
    if (k == GarchKind::GARCH) return {"omega", "alpha", "beta"};
    return {"omega", "alpha", "gamma", "beta"};
}

inline double sigmoid(double x) { return 1.0 / (1.0 + std::exp(-x)); }
inline double logit(double p) {
    p = std::clamp(p, 1e-10, 1.0 - 1e-10);
    return std::log(p / (1.0 - p));
}

// Map to and from [lo, hi) through the logistic function.
inline double to_bounded(double theta, double lo, double hi) {
    return lo + (hi - lo) * sigmoid(theta);
}
inline double from_bounded(double x, double lo, double hi) {
    return logit((x - lo) / (hi - lo));
}

// ---------------------------------------------------------------------------
// variance_path — σ²_t for t = 0..n-1 given demeaned residuals eps.
// σ²_0 is the sample variance. Returns an empty vector when the recursion
// leaves the finite positive range.
// ---------------------------------------------------------------------------
inline std::vector<double> variance_path(GarchKind kind,
                                         const std::vector<double>& p,
                                         const std::vector<double>& eps,
                                         double var0) {
    size_t n = eps.size();
    std::vector<double> s2(n);
    if (n == 0) return s2;
    s2[0] = std::max(var0, VARIANCE_FLOOR);

    for (size_t t = 1; t < n; ++t) {
        double e = eps[t - 1];
        double prev = s2[t - 1];
        double v;
        switch (kind) {
            case GarchKind::GARCH:
                v = p[0] + p[1] * e * e + p[2] * prev;
                break;
            case GarchKind::TGARCH:
                v = p[0] + (p[1] + (e < 0.0 ? p[2] : 0.0)) * e * e + p[3] * prev;
                break;
            case GarchKind::EGARCH: {
                double z = e / std::sqrt(prev);
                double log_v = p[0] + p[1] * (std::abs(z) - ABS_Z_MEAN) + p[2] * z +
                               p[3] * std::log(prev);
                log_v = std::clamp(log_v, -700.0, 700.0);
                v = std::exp(log_v);
                break;
            }
            default:
                v = prev;
        }
        if (!std::isfinite(v) || v <= 0.0) return {};
        s2[t] = std::max(v, VARIANCE_FLOOR);
    }
    return s2;
}

// −L = ½ Σ (ln 2π + ln σ²_t + ε²_t / σ²_t)
inline double negative_log_likelihood(const std::vector<double>& eps,
                                      const std::vector<double>& s2) {
    if (s2.size() != eps.size() || s2.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    const double ln2pi = std::log(2.0 * std::numbers::pi);
    double nll = 0.0;
    for (size_t t = 0; t < eps.size(); ++t) {
        nll += 0.5 * (ln2pi + std::log(s2[t]) + eps[t] * eps[t] / s2[t]);
    }
    return std::isfinite(nll) ? nll : std::numeric_limits<double>::infinity();
}

// Persistence of shocks in the variance recursion.
inline double persistence(GarchKind kind, const std::vector<double>& p) {
    switch (kind) {
        case GarchKind::GARCH:  return p[1] + p[2];
        case GarchKind::TGARCH: return p[1] + 0.5 * p[2] + p[3];
        case GarchKind::EGARCH: return p[3];
    }
    return 1.0;
}

inline GarchDiagnostics diagnose(const std::vector<double>& z, const GarchConfig& cfg) {
    GarchDiagnostics d;
    std::vector<double> z2(z.size());
    for (size_t i = 0; i < z.size(); ++i) z2[i] = z[i] * z[i];
    d.ljung_box = ljung_box_test(z, cfg.ljung_box_lags);
    d.ljung_box_squared = ljung_box_test(z2, cfg.ljung_box_lags);
    d.jarque_bera = jarque_bera_test(z);
    d.arch_lm = arch_lm_test(z, cfg.arch_lm_lags);
    d.residual_mean = stats::mean(z);
    d.residual_std = stats::stddev(z);
    d.residual_skewness = stats::skewness(z);
    d.residual_kurtosis = stats::excess_kurtosis(z);
    return d;
}

inline void fill_bands(GarchForecast& f) {
    for (double v : f.volatility) {
        f.lower_95.push_back(v * 0.8);
        f.upper_95.push_back(v * 1.2);
        f.lower_99.push_back(v * 0.7);
        f.upper_99.push_back(v * 1.3);
    }
}

// ---------------------------------------------------------------------------
// forecast — h-step volatility path from the end of the sample
// ---------------------------------------------------------------------------
inline GarchForecast forecast(GarchKind kind, const std::vector<double>& p,
                              double last_eps, double last_var, int horizon) {
    GarchForecast f;
    if (horizon <= 0) return f;
    std::vector<double> var(static_cast<size_t>(horizon));

    if (kind == GarchKind::EGARCH) {
        double z = last_eps / std::sqrt(last_var);
        double log_v = p[0] + p[1] * (std::abs(z) - ABS_Z_MEAN) + p[2] * z +
                       p[3] * std::log(last_var);
        for (int h = 0; h < horizon; ++h) {
            if (h > 0) log_v = p[0] + p[3] * log_v;
            var[static_cast<size_t>(h)] = std::exp(std::clamp(log_v, -700.0, 700.0));
        }
        double lr_log = std::abs(p[3]) < 1.0 ? p[0] / (1.0 - p[3]) : log_v;
        f.long_run_volatility = std::sqrt(std::exp(std::clamp(lr_log, -700.0, 700.0)));
    } else {
        double next;
        double omega = p[0];
        if (kind == GarchKind::GARCH) {
            next = omega + p[1] * last_eps * last_eps + p[2] * last_var;
        } else {
            next = omega + (p[1] + (last_eps < 0.0 ? p[2] : 0.0)) * last_eps * last_eps +
                   p[3] * last_var;
        }
        double pers = persistence(kind, p);
        bool stationary = pers < 1.0;
        double lr = stationary ? omega / (1.0 - pers) : next;
        for (int h = 0; h < horizon; ++h) {
            double v;
            if (stationary) {
                v = lr + std::pow(pers, h) * (next - lr);
            } else {
                v = next + static_cast<double>(h) * omega;
            }
            var[static_cast<size_t>(h)] = std::max(v, VARIANCE_FLOOR);
        }
        f.long_run_volatility = std::sqrt(std::max(lr, VARIANCE_FLOOR));
    }

    for (double v : var) f.volatility.push_back(std::sqrt(v));
    fill_bands(f);
    return f;
}

}  // namespace garch

// ---------------------------------------------------------------------------
// GarchEstimator — maximum-likelihood GARCH / EGARCH / TGARCH
//
// Bounded parameters are optimized in an unconstrained transformed space
// with Nelder-Mead. For GARCH, α + β < 1 is checked after the fit, not
// constrained. Any failure yields the constant-volatility fallback fit.
// ---------------------------------------------------------------------------
class GarchEstimator {
public:
    explicit GarchEstimator(GarchConfig config = {}) : config_(config) {}

    const GarchConfig& config() const { return config_; }

    GarchFit fit(const std::vector<double>& returns, GarchKind kind) const {
        if (returns.size() < config_.min_observations) {
            return fallback(returns, kind, "insufficient data: " +
                            std::to_string(returns.size()) + " returns");
        }
        for (double r : returns) {
            if (!std::isfinite(r)) return fallback(returns, kind, "non-finite return");
        }

        try {
            return fit_mle(returns, kind);
        } catch (const NumericalDivergenceError& e) {
            return fallback(returns, kind, e.what());
        }
    }

    // Fit all three kinds and keep the lowest AIC. Non-degraded fits win over
    // degraded ones.
    GarchSelection fit_best(const std::vector<double>& returns) const {
        GarchSelection sel;
        for (GarchKind k : {GarchKind::GARCH, GarchKind::EGARCH, GarchKind::TGARCH}) {
            sel.candidates.push_back(fit(returns, k));
        }
        const GarchFit* best = nullptr;
        for (const auto& f : sel.candidates) {
            if (!best) {
                best = &f;
                continue;
            }
            if (best->degraded != f.degraded) {
                if (!f.degraded) best = &f;
                continue;
            }
            if (f.aic < best->aic) best = &f;
        }
        sel.best = *best;
        return sel;
    }

    // Refit GARCH(1,1) on trailing windows stepping window/4 observations.
    // Throws UnderdeterminedModelError when fewer than 2 * window returns.
    GarchRollingAnalysis rolling_fit(const std::vector<double>& returns,
                                     int trading_days = 252) const {
        int window = config_.rolling_window;
        int n = static_cast<int>(returns.size());
        if (window < static_cast<int>(config_.min_observations) || n < 2 * window) {
            throw UnderdeterminedModelError("rolling GARCH needs at least " +
                                            std::to_string(2 * window) + " returns");
        }

        GarchRollingAnalysis out;
        int step = std::max(1, window / 4);
        for (int end = window; end < n; end += step) {
            std::vector<double> w(returns.begin() + (end - window), returns.begin() + end);
            GarchFit f = fit(w, GarchKind::GARCH);
            if (f.degraded) continue;
            GarchRollingWindow rw;
            rw.end_index = end;
            rw.omega = f.param("omega");
            rw.alpha = f.param("alpha");
            rw.beta = f.param("beta");
            rw.annualized_volatility = stats::stddev(w, 1) * std::sqrt(static_cast<double>(trading_days));
            rw.aic = f.aic;
            rw.bic = f.bic;
            out.windows.push_back(rw);
        }
        if (out.windows.empty()) {
            throw NumericalDivergenceError("no rolling window produced a converged fit");
        }

        std::vector<double> a, b, o, v, aic, bic;
        for (const auto& w : out.windows) {
            a.push_back(w.alpha);
            b.push_back(w.beta);
            o.push_back(w.omega);
            v.push_back(w.annualized_volatility);
            aic.push_back(w.aic);
            bic.push_back(w.bic);
        }
        out.alpha_std = stats::stddev(a, 1);
        out.beta_std = stats::stddev(b, 1);
        out.omega_std = stats::stddev(o, 1);
        out.volatility_std = stats::stddev(v, 1);
        out.alpha_trend = stats::trend_correlation(a);
        out.beta_trend = stats::trend_correlation(b);
        out.volatility_trend = stats::trend_correlation(v);
        out.aic_trend = stats::trend_correlation(aic);
        out.avg_aic = stats::mean(aic);
        out.avg_bic = stats::mean(bic);
        return out;
    }

    // Constant-volatility fit used whenever the MLE path fails.
    GarchFit fallback(const std::vector<double>& returns, GarchKind kind,
                      const std::string& reason) const {
        GarchFit f;
        f.kind = kind;
        f.degraded = true;
        f.degraded_reason = reason;
        f.num_obs = static_cast<int>(returns.size());
        f.num_params = 1;

        double sd = stats::stddev(returns, 1);
        if (!std::isfinite(sd) || sd <= 0.0) sd = 1e-6;
        double m = stats::mean(returns);
        f.conditional_volatility.assign(returns.size(), sd);
        f.standardized_residuals.reserve(returns.size());
        for (double r : returns) f.standardized_residuals.push_back((r - m) / sd);

        std::vector<double> eps(returns.size());
        for (size_t i = 0; i < returns.size(); ++i) eps[i] = returns[i] - m;
        std::vector<double> s2(returns.size(), sd * sd);
        double nll = returns.empty() ? 0.0 : garch::negative_log_likelihood(eps, s2);
        if (!std::isfinite(nll)) nll = 0.0;
        f.log_likelihood = -nll;
        set_information_criteria(f);

        f.persistence = 0.0;
        f.stationary = true;
        f.long_run_variance = sd * sd;
        f.diagnostics = garch::diagnose(f.standardized_residuals, config_);
        f.forecast.volatility.assign(static_cast<size_t>(std::max(0, config_.forecast_horizon)), sd);
        f.forecast.long_run_volatility = sd;
        garch::fill_bands(f.forecast);
        return f;
    }

private:
    GarchConfig config_;

    static void set_information_criteria(GarchFit& f) {
        double k = static_cast<double>(f.num_params);
        f.aic = 2.0 * k - 2.0 * f.log_likelihood;
        f.bic = std::log(static_cast<double>(std::max(f.num_obs, 1))) * k - 2.0 * f.log_likelihood;
    }

    // Transformed-space parameterisation for each kind.
    struct Transform {
        GarchKind kind;
        double var;

        std::vector<double> to_params(const std::vector<double>& th) const {
            switch (kind) {
                case GarchKind::GARCH:
                    return {garch::to_bounded(th[0], 0.0, 10.0 * var),
                            garch::to_bounded(th[1], 0.0, 1.0),
                            garch::to_bounded(th[2], 0.0, garch::BETA_CAP)};
                case GarchKind::TGARCH:
                    return {garch::to_bounded(th[0], 0.0, 10.0 * var),
                            garch::to_bounded(th[1], 0.0, 1.0),
                            garch::to_bounded(th[2], 0.0, 1.0),
                            garch::to_bounded(th[3], 0.0, garch::BETA_CAP)};
                case GarchKind::EGARCH:
                    return {th[0],
                            std::tanh(th[1]),
                            std::tanh(th[2]),
                            garch::BETA_CAP * std::tanh(th[3])};
            }
            return {};
        }

        std::vector<double> from_params(const std::vector<double>& p) const {
            switch (kind) {
                case GarchKind::GARCH:
                    return {garch::from_bounded(p[0], 0.0, 10.0 * var),
                            garch::from_bounded(p[1], 0.0, 1.0),
                            garch::from_bounded(p[2], 0.0, garch::BETA_CAP)};
                case GarchKind::TGARCH:
                    return {garch::from_bounded(p[0], 0.0, 10.0 * var),
                            garch::from_bounded(p[1], 0.0, 1.0),
                            garch::from_bounded(p[2], 0.0, 1.0),
                            garch::from_bounded(p[3], 0.0, garch::BETA_CAP)};
                case GarchKind::EGARCH:
                    return {p[0], std::atanh(p[1]), std::atanh(p[2]),
                            std::atanh(p[3] / garch::BETA_CAP)};
            }
            return {};
        }
    };

    static std::vector<double> initial_guess(GarchKind kind, double var) {
        switch (kind) {
            case GarchKind::GARCH:  return {var * 0.1, 0.05, 0.9};
            case GarchKind::TGARCH: return {var * 0.1, 0.05, 0.02, 0.9};
            case GarchKind::EGARCH: return {0.1 * std::log(var), 0.1, -0.05, 0.9};
        }
        return {};
    }

    GarchFit fit_mle(const std::vector<double>& returns, GarchKind kind) const {
        double m = stats::mean(returns);
        std::vector<double> eps(returns.size());
        for (size_t i = 0; i < returns.size(); ++i) eps[i] = returns[i] - m;
        double var = stats::variance(eps);
        if (!(var > 0.0)) {
            throw NumericalDivergenceError("zero-variance return series");
        }

        Transform tf{kind, var};
        auto objective = [&](const std::vector<double>& th) {
            auto s2 = garch::variance_path(kind, tf.to_params(th), eps, var);
            return garch::negative_log_likelihood(eps, s2);
        };

        std::vector<double> th0 = tf.from_params(initial_guess(kind, var));
        std::vector<double> step(th0.size(), 0.5);

        auto res = nelder_mead_minimize(th0, step, objective, config_.max_iterations,
                                        config_.tolerance);
        int iterations = res.iterations;
        // One restart from the best vertex refreshes a collapsed simplex.
        auto res2 = nelder_mead_minimize(res.x, std::vector<double>(th0.size(), 0.1), objective,
                                         config_.max_iterations, config_.tolerance);
        iterations += res2.iterations;
        if (res2.value <= res.value) res = res2;

        if (!res.converged && !res2.converged) {
            throw NumericalDivergenceError("optimizer did not converge in " +
                                           std::to_string(iterations) + " iterations");
        }
        if (!std::isfinite(res.value) || res.value >= std::numeric_limits<double>::max()) {
            throw NumericalDivergenceError("non-finite likelihood at optimum");
        }

        std::vector<double> p = tf.to_params(res.x);
        auto s2 = garch::variance_path(kind, p, eps, var);
        if (s2.empty()) {
            throw NumericalDivergenceError("non-positive conditional variance at optimum");
        }

        GarchFit f;
        f.kind = kind;
        auto names = garch::param_names(kind);
        for (size_t i = 0; i < names.size(); ++i) f.params[names[i]] = p[i];
        f.num_params = garch::num_params(kind);
        f.num_obs = static_cast<int>(returns.size());
        f.iterations = iterations;
        f.converged = true;
        f.log_likelihood = -res.value;
        set_information_criteria(f);

        f.conditional_volatility.reserve(s2.size());
        f.standardized_residuals.reserve(s2.size());
        for (size_t t = 0; t < s2.size(); ++t) {
            double sd = std::sqrt(s2[t]);
            f.conditional_volatility.push_back(sd);
            f.standardized_residuals.push_back(eps[t] / sd);
        }

        f.persistence = garch::persistence(kind, p);
        if (kind == GarchKind::EGARCH) {
            f.stationary = std::abs(p[3]) < 1.0;
            f.long_run_variance = f.stationary ? std::exp(p[0] / (1.0 - p[3])) : s2.back();
        } else {
            f.stationary = f.persistence < 1.0;
            f.long_run_variance = f.stationary ? p[0] / (1.0 - f.persistence)
                                               : std::numeric_limits<double>::infinity();
        }

        f.diagnostics = garch::diagnose(f.standardized_residuals, config_);
        f.forecast = garch::forecast(kind, p, eps.back(), s2.back(), config_.forecast_horizon);
        return f;
    }
};
