#pragma once

#include "analysis/descriptive_stats.hpp"
#include "analysis/statistical_tests.hpp"
#include "estimators/garch_estimator.hpp"
#include "estimators/kalman_estimator.hpp"
#include "estimators/vecm_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

struct StatisticalTestSummary {
    AdfResult adf;
    KpssResult kpss;
    TestResult jarque_bera;
    TestResult ljung_box_returns;
    TestResult ljung_box_squared;
    TestResult arch_lm;
};

struct GarchValidation {
    double aic = 0.0;
    double bic = 0.0;
    double log_likelihood = 0.0;
    double volatility_mse = 0.0;          // |r_t| vs σ_t
    double volatility_correlation = 0.0;
};

struct KalmanValidation {
    double log_likelihood = 0.0;
    double state_smoothness = 0.0;        // 1 / (1 + std of relative level changes)
    double innovation_variance = 0.0;
};

struct VecmValidation {
    int n_cointegrating = 0;
    double trace_stat = 0.0;
    double max_eigen_stat = 0.0;
    double error_correction_coefficient = 0.0;
    double adjustment_speed_quality = 0.0;  // |α| when α < 0
};

struct ResidualAnalysis {
    double mean = 0.0;
    double std = 0.0;
    double skewness = 0.0;
    double kurtosis = 0.0;
    double autocorrelation = 0.0;
    double normality_score = 0.0;         // 1 / (1 + |excess kurtosis|)
};

struct GoodnessOfFit {
    double garch_log_likelihood = 0.0;
    double kalman_log_likelihood = 0.0;
    double combined_fit_score = 0.0;
};

struct CrossValidation {
    int folds = 0;
    double mean_forecast_error = 0.0;
    double forecast_error_std = 0.0;
    double forecast_stability = 1.0;
};

struct StabilityTests {
    double garch_persistence = 0.0;
    bool garch_stationary = true;
    bool alpha_significant = false;
    bool beta_significant = false;
    double structural_stability = 1.0;    // min/max of half-sample σ
};

// ---------------------------------------------------------------------------
// Diagnostics — statistical tests, per-model validation, overall quality
// ---------------------------------------------------------------------------
struct Diagnostics {
    StatisticalTestSummary tests;
    GarchValidation garch;
    KalmanValidation kalman;
    VecmValidation vecm;
    ResidualAnalysis residuals;
    GoodnessOfFit goodness;
    CrossValidation cross_validation;
    StabilityTests stability;
    double quality_score = 0.5;
};

namespace diagnostics {

constexpr int LJUNG_BOX_LAGS = 10;
constexpr int ARCH_LM_LAGS = 5;
constexpr size_t MIN_CV_RETURNS = 100;
constexpr int CV_SPLITS = 5;

inline StatisticalTestSummary run_tests(const std::vector<double>& returns) {
    StatisticalTestSummary s;
    std::vector<double> sq(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) sq[i] = returns[i] * returns[i];
    s.adf = adf_test(returns);
    s.kpss = kpss_test(returns);
    s.jarque_bera = jarque_bera_test(returns);
    s.ljung_box_returns = ljung_box_test(returns, LJUNG_BOX_LAGS);
    s.ljung_box_squared = ljung_box_test(sq, LJUNG_BOX_LAGS);
    s.arch_lm = arch_lm_test(returns, ARCH_LM_LAGS);
    return s;
}

inline GarchValidation validate_garch(const std::vector<double>& returns, const GarchFit& g) {
    GarchValidation v;
    v.aic = g.aic;
    v.bic = g.bic;
    v.log_likelihood = g.log_likelihood;
    if (g.conditional_volatility.size() == returns.size() && !returns.empty()) {
        std::vector<double> realized(returns.size());
        for (size_t i = 0; i < returns.size(); ++i) realized[i] = std::abs(returns[i]);
        v.volatility_mse = stats::mse(realized, g.conditional_volatility);
        v.volatility_correlation = stats::correlation(realized, g.conditional_volatility);
    }
    return v;
}

inline KalmanValidation validate_kalman(const KalmanFit& k) {
    KalmanValidation v;
    v.log_likelihood = k.log_likelihood;
    auto level = level_path(k);
    if (level.size() > 1) {
        std::vector<double> rel;
        for (size_t i = 1; i < level.size(); ++i) {
            if (level[i - 1] != 0.0) rel.push_back((level[i] - level[i - 1]) / std::abs(level[i - 1]));
        }
        v.state_smoothness = 1.0 / (1.0 + stats::stddev(rel));
        v.innovation_variance = stats::variance(stats::diff(level));
    }
    return v;
}

inline VecmValidation validate_vecm(const CointegrationFit& f) {
    VecmValidation v;
    v.n_cointegrating = f.johansen.n_cointegrating;
    v.trace_stat = f.johansen.trace_stat;
    v.max_eigen_stat = f.johansen.max_eigen_stat;
    v.error_correction_coefficient = f.error_correction_coefficient;
    v.adjustment_speed_quality = f.error_correction_coefficient < 0.0 ? std::abs(f.error_correction_coefficient) : 0.0;
    return v;
}

inline ResidualAnalysis analyze_residuals(const std::vector<double>& z) {
    ResidualAnalysis r;
    if (z.empty()) return r;
    r.mean = stats::mean(z);
    r.std = stats::stddev(z);
    r.skewness = stats::skewness(z);
    r.kurtosis = stats::excess_kurtosis(z);
    if (z.size() > 5) r.autocorrelation = stats::autocorrelation(z, 1);
    r.normality_score = 1.0 / (1.0 + std::abs(r.kurtosis));
    return r;
}

// Fit score on the mean log-likelihood per observation: 1 / (1 + |ℓ|) when
// negative, 0.5 otherwise.
inline double fit_score(double log_likelihood, int n) {
    if (n <= 0) return 0.5;
    double per_obs = log_likelihood / n;
    return per_obs < 0.0 ? 1.0 / (1.0 + std::abs(per_obs)) : 0.5;
}

// Walk-forward: train-mean forecast vs test-window mean over folds 2..4.
inline CrossValidation cross_validate(const std::vector<double>& returns) {
    CrossValidation cv;
    if (returns.size() < MIN_CV_RETURNS) return cv;
    size_t split = returns.size() / CV_SPLITS;
    std::vector<double> errors;
    for (int i = 2; i < CV_SPLITS; ++i) {
        size_t train_end = static_cast<size_t>(i) * split;
        size_t test_end = std::min(static_cast<size_t>(i + 1) * split, returns.size());
        if (test_end - train_end < 10) continue;
        std::vector<double> train(returns.begin(), returns.begin() + static_cast<std::ptrdiff_t>(train_end));
        std::vector<double> test(returns.begin() + static_cast<std::ptrdiff_t>(train_end),
                                 returns.begin() + static_cast<std::ptrdiff_t>(test_end));
        errors.push_back(std::abs(stats::mean(train) - stats::mean(test)));
    }
    if (errors.empty()) return cv;
    cv.folds = static_cast<int>(errors.size());
    cv.mean_forecast_error = stats::mean(errors);
    cv.forecast_error_std = stats::stddev(errors);
    cv.forecast_stability = 1.0 / (1.0 + cv.forecast_error_std);
    return cv;
}

inline StabilityTests stability_tests(const std::vector<double>& returns, const GarchFit& g) {
    StabilityTests s;
    s.garch_persistence = g.persistence;
    s.garch_stationary = g.stationary;
    s.alpha_significant = g.param("alpha") > 0.01;
    s.beta_significant = g.param("beta") > 0.01;
    if (returns.size() > 100) {
        size_t mid = returns.size() / 2;
        std::vector<double> a(returns.begin(), returns.begin() + static_cast<std::ptrdiff_t>(mid));
        std::vector<double> b(returns.begin() + static_cast<std::ptrdiff_t>(mid), returns.end());
        double sa = stats::stddev(a);
        double sb = stats::stddev(b);
        double hi = std::max(sa, sb);
        s.structural_stability = hi > 0.0 ? std::min(sa, sb) / hi : 1.0;
    }
    return s;
}

}  // namespace diagnostics

// ---------------------------------------------------------------------------
// run_diagnostics
//
// Quality score = mean of (1 - ADF p-value), |σ vs |r| correlation|,
// residual normality score and combined fit score, clipped to [0, 1].
// ---------------------------------------------------------------------------
inline Diagnostics run_diagnostics(const std::vector<double>& returns, const GarchFit& garch,
                                   const KalmanFit& kalman, const CointegrationFit& vecm) {
    Diagnostics d;
    d.tests = diagnostics::run_tests(returns);
    d.garch = diagnostics::validate_garch(returns, garch);
    d.kalman = diagnostics::validate_kalman(kalman);
    d.vecm = diagnostics::validate_vecm(vecm);
    d.residuals = diagnostics::analyze_residuals(garch.standardized_residuals);
    d.goodness.garch_log_likelihood = garch.log_likelihood;
    d.goodness.kalman_log_likelihood = kalman.log_likelihood;
    int n_prices = static_cast<int>(kalman.filtered_states.size());
    d.goodness.combined_fit_score = 0.5 * (diagnostics::fit_score(garch.log_likelihood, garch.num_obs) +
                                           diagnostics::fit_score(kalman.log_likelihood, n_prices));
    d.cross_validation = diagnostics::cross_validate(returns);
    d.stability = diagnostics::stability_tests(returns, garch);

    std::vector<double> scores = {
        1.0 - d.tests.adf.p_value,
        std::abs(d.garch.volatility_correlation),
        d.residuals.normality_score,
        d.goodness.combined_fit_score,
    };
    d.quality_score = std::clamp(stats::mean(scores), 0.0, 1.0);
    return d;
}
