#pragma once

#include "analysis/descriptive_stats.hpp"
#include "core/errors.hpp"
#include "linalg/least_squares.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PatternConfig
// ---------------------------------------------------------------------------
struct PatternConfig {
    size_t min_observations = 20;
    size_t momentum_window = 10;
    double jump_threshold = 3.0;                       // in return σ
    std::vector<size_t> seasonal_lags = {5, 10, 21, 63};
    size_t seasonality_min_observations = 50;
    size_t hurst_min_prices = 30;
    size_t hurst_max_lag = 100;
    size_t correlation_window = 30;
    size_t correlation_min_observations = 50;
};

// ---------------------------------------------------------------------------
// MarketPatterns — shape statistics of the return / price path. Scores are
// in [0, 1] except hurst_exponent.
// ---------------------------------------------------------------------------
struct MarketPatterns {
    double momentum_strength = 0.0;        // sign consistency inside rolling windows
    double mean_reversion_tendency = 0.0;  // max(0, -lag-1 autocorrelation)
    double volatility_clustering = 0.0;    // max(0, lag-1 autocorrelation of r²)
    double hurst_exponent = 0.5;
    double trend_persistence = 0.0;        // min(1, 2 |H - 0.5|)
    double jump_frequency = 0.0;           // share of |r| beyond the jump threshold
    double seasonality_strength = 0.0;     // mean |autocorrelation| at seasonal lags
};

// Daily-bar proxies for microstructure quantities.
struct Microstructure {
    double spread_proxy = 0.0;        // 2 σ
    double price_impact = 0.0;        // mean |r|
    double efficiency_measure = 1.0;  // 1 - |lag-1 autocorrelation|
    double intraday_volatility = 0.0; // σ
};

// Stability of the rolling correlation with a reference series.
struct CorrelationRisk {
    bool has_reference = false;
    std::string reference;
    double mean_abs_correlation = 0.0;
    double correlation_risk = 0.0;    // stddev of rolling |correlation|
    int windows = 0;
};

struct PatternAnalysis {
    MarketPatterns patterns;
    Microstructure microstructure;
    CorrelationRisk correlation;
};

namespace patterns {

inline double momentum_strength(const std::vector<double>& returns, size_t window) {
    size_t n = returns.size();
    size_t w = std::min(window, n / 4);
    if (w == 0 || n <= w) return 0.0;
    double half = static_cast<double>(w) / 2.0;
    std::vector<double> scores;
    scores.reserve(n - w);
    for (size_t i = w; i < n; ++i) {
        double up = 0.0;
        for (size_t j = i - w; j < i; ++j) up += returns[j] > 0.0 ? 1.0 : 0.0;
        scores.push_back(std::abs(up - half) / half);
    }
    return stats::mean(scores);
}

inline double mean_reversion(const std::vector<double>& returns) {
    return std::max(0.0, -stats::autocorrelation(returns, 1));
}

inline double volatility_clustering(const std::vector<double>& returns) {
    std::vector<double> sq(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) sq[i] = returns[i] * returns[i];
    return std::max(0.0, stats::autocorrelation(sq, 1));
}

// Slope of log sqrt(σ(p[t+lag] - p[t])) on log lag, doubled. Returns 0.5
// when fewer than three lags give a finite point.
inline double hurst_exponent(const std::vector<double>& prices, size_t max_lag) {
    size_t upper = std::min(max_lag, prices.size() / 4);
    std::vector<double> xs, ys;
    for (size_t lag = 2; lag < upper; ++lag) {
        std::vector<double> d(prices.size() - lag);
        for (size_t t = 0; t + lag < prices.size(); ++t) d[t] = prices[t + lag] - prices[t];
        double tau = std::sqrt(stats::stddev(d));
        double x = std::log(static_cast<double>(lag));
        double y = std::log(tau);
        if (std::isfinite(x) && std::isfinite(y)) {
            xs.push_back(x);
            ys.push_back(y);
        }
    }
    if (xs.size() < 3) return 0.5;

    Eigen::MatrixXd X(static_cast<Eigen::Index>(xs.size()), 2);
    X.col(0).setOnes();
    X.col(1) = linalg::to_eigen(xs);
    try {
        return 2.0 * linalg::ols(X, ys).coefficients(1, 0);
    } catch (const NumericalDivergenceError&) {
        return 0.5;
    }
}

inline double jump_frequency(const std::vector<double>& returns, double threshold_sigma) {
    if (returns.empty()) return 0.0;
    double limit = threshold_sigma * stats::stddev(returns);
    size_t jumps = 0;
    for (double r : returns) {
        if (std::abs(r) > limit) ++jumps;
    }
    return static_cast<double>(jumps) / static_cast<double>(returns.size());
}

inline double seasonality_strength(const std::vector<double>& returns,
                                   const std::vector<size_t>& lags) {
    std::vector<double> acs;
    for (size_t lag : lags) {
        if (returns.size() > lag + 1) acs.push_back(std::abs(stats::autocorrelation(returns, lag)));
    }
    return acs.empty() ? 0.0 : stats::mean(acs);
}

inline Microstructure microstructure(const std::vector<double>& returns) {
    Microstructure m;
    double sd = stats::stddev(returns);
    m.spread_proxy = 2.0 * sd;
    m.intraday_volatility = sd;
    if (returns.size() > 10) {
        double total = 0.0;
        for (double r : returns) total += std::abs(r);
        m.price_impact = total / static_cast<double>(returns.size());
    }
    if (returns.size() > 5) {
        m.efficiency_measure = 1.0 - std::abs(stats::autocorrelation(returns, 1));
    }
    return m;
}

// Rolling |correlation| over windows ending before each t in [window, n).
inline CorrelationRisk correlation_risk(const std::vector<double>& returns,
                                        const std::vector<double>& reference,
                                        const std::string& reference_name, size_t window) {
    if (reference.size() != returns.size()) {
        throw DataShapeError("correlation reference has " + std::to_string(reference.size()) +
                             " returns, index has " + std::to_string(returns.size()));
    }
    CorrelationRisk out;
    out.has_reference = true;
    out.reference = reference_name;
    std::vector<double> corrs;
    for (size_t i = window; i < returns.size(); ++i) {
        std::vector<double> a(returns.begin() + static_cast<std::ptrdiff_t>(i - window),
                              returns.begin() + static_cast<std::ptrdiff_t>(i));
        std::vector<double> b(reference.begin() + static_cast<std::ptrdiff_t>(i - window),
                              reference.begin() + static_cast<std::ptrdiff_t>(i));
        corrs.push_back(std::abs(stats::correlation(a, b)));
    }
    out.windows = static_cast<int>(corrs.size());
    if (!corrs.empty()) {
        out.mean_abs_correlation = stats::mean(corrs);
        out.correlation_risk = stats::stddev(corrs);
    }
    return out;
}

}  // namespace patterns

// ---------------------------------------------------------------------------
// analyze_patterns
//
// returns has one entry fewer than prices. reference_returns (optional) is
// a related series on the same return grid. Throws UnderdeterminedModelError
// below min_observations returns.
// ---------------------------------------------------------------------------
inline PatternAnalysis analyze_patterns(const std::vector<double>& returns,
                                        const std::vector<double>& prices,
                                        const PatternConfig& cfg = {},
                                        const std::vector<double>& reference_returns = {},
                                        const std::string& reference_name = "") {
    if (returns.size() < cfg.min_observations) {
        throw UnderdeterminedModelError("pattern analysis needs at least " +
                                        std::to_string(cfg.min_observations) + " returns");
    }

    PatternAnalysis out;
    auto& p = out.patterns;
    p.momentum_strength = patterns::momentum_strength(returns, cfg.momentum_window);
    p.mean_reversion_tendency = patterns::mean_reversion(returns);
    p.volatility_clustering = patterns::volatility_clustering(returns);
    if (prices.size() >= cfg.hurst_min_prices) {
        p.hurst_exponent = patterns::hurst_exponent(prices, cfg.hurst_max_lag);
        p.trend_persistence = std::min(1.0, 2.0 * std::abs(p.hurst_exponent - 0.5));
    }
    p.jump_frequency = patterns::jump_frequency(returns, cfg.jump_threshold);
    if (returns.size() >= cfg.seasonality_min_observations) {
        p.seasonality_strength = patterns::seasonality_strength(returns, cfg.seasonal_lags);
    }

    out.microstructure = patterns::microstructure(returns);

    if (!reference_returns.empty() && returns.size() >= cfg.correlation_min_observations) {
        out.correlation = patterns::correlation_risk(returns, reference_returns, reference_name,
                                                     cfg.correlation_window);
    }
    return out;
}
