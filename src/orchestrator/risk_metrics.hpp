#pragma once

#include "analysis/descriptive_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

struct DrawdownStats {
    double max_drawdown = 0.0;       // most negative (cum - peak) / peak
    double avg_duration = 0.0;       // periods spent below -1%
    double max_duration = 0.0;
    double recovery_factor = 1.0;    // 1 / (1 + avg_duration / trading_days)
};

struct RegimeRisk {
    double high_vol_var = 0.0;
    double low_vol_var = 0.0;
    double regime_persistence = 0.0;
};

struct StressScenarios {
    double worst_day = 0.0;
    double worst_week = 0.0;          // worst 5-period cumulative return
    double worst_month = 0.0;         // worst 21-period cumulative return
    double market_crash = -0.20;
    double volatility_spike = 0.0;    // 3σ
    double liquidity_stress = 0.0;    // 1.5 |worst day|
};

// Variance explained by the fitted conditional-variance path vs the rest.
struct VolatilityRiskAttribution {
    double total_variance = 0.0;
    double systematic_variance = 0.0;
    double idiosyncratic_variance = 0.0;
    double systematic_percentage = 0.0;
    double volatility_persistence = 0.0;
    double vol_of_vol = 0.0;
    double return_vol_correlation = 0.0;
};

// ---------------------------------------------------------------------------
// RiskMetrics — return-distribution and path risk for one index
// ---------------------------------------------------------------------------
struct RiskMetrics {
    double annualized_volatility = 0.0;
    double var_95 = 0.0;
    double var_99 = 0.0;
    double var_99_5 = 0.0;
    double expected_shortfall_95 = 0.0;
    double expected_shortfall_99 = 0.0;
    double tail_ratio = 0.0;
    DrawdownStats drawdown;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    double skewness = 0.0;
    double excess_kurtosis = 0.0;
    double garch_var_95 = 0.0;
    RegimeRisk regime;
    StressScenarios stress;
    double liquidity_risk = 0.0;
    VolatilityRiskAttribution attribution;
};

namespace risk {

constexpr double DRAWDOWN_THRESHOLD = -0.01;
constexpr double GARCH_VAR_Z = 1.645;

// Mean of returns at or below the threshold; the threshold itself when none.
inline double expected_shortfall(const std::vector<double>& returns, double threshold) {
    double sum = 0.0;
    int n = 0;
    for (double r : returns) {
        if (r <= threshold) {
            sum += r;
            ++n;
        }
    }
    return n > 0 ? sum / n : threshold;
}

inline std::vector<double> drawdown_curve(const std::vector<double>& returns) {
    std::vector<double> dd(returns.size());
    double cum = 1.0;
    double peak = 1.0;
    for (size_t i = 0; i < returns.size(); ++i) {
        cum *= 1.0 + returns[i];
        peak = std::max(peak, cum);
        dd[i] = peak > 0.0 ? (cum - peak) / peak : 0.0;
    }
    return dd;
}

inline DrawdownStats drawdown_stats(const std::vector<double>& returns, int trading_days) {
    DrawdownStats out;
    auto dd = drawdown_curve(returns);
    if (dd.empty()) return out;
    out.max_drawdown = *std::min_element(dd.begin(), dd.end());

    std::vector<double> durations;
    int run = 0;
    for (double d : dd) {
        if (d < DRAWDOWN_THRESHOLD) {
            ++run;
        } else if (run > 0) {
            durations.push_back(run);
            run = 0;
        }
    }
    if (run > 0) durations.push_back(run);
    if (durations.empty()) return out;

    out.avg_duration = stats::mean(durations);
    out.max_duration = *std::max_element(durations.begin(), durations.end());
    out.recovery_factor = 1.0 / (1.0 + out.avg_duration / trading_days);
    return out;
}

inline double worst_window_sum(const std::vector<double>& returns, size_t window) {
    if (returns.size() < window || window == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < window; ++i) sum += returns[i];
    double worst = sum;
    for (size_t i = window; i < returns.size(); ++i) {
        sum += returns[i] - returns[i - window];
        worst = std::min(worst, sum);
    }
    return worst;
}

inline StressScenarios stress_scenarios(const std::vector<double>& returns) {
    StressScenarios s;
    if (returns.empty()) return s;
    s.worst_day = *std::min_element(returns.begin(), returns.end());
    s.worst_week = worst_window_sum(returns, 5);
    s.worst_month = worst_window_sum(returns, 21);
    s.volatility_spike = 3.0 * stats::stddev(returns);
    s.liquidity_stress = 1.5 * std::abs(s.worst_day);
    return s;
}

// VaR95 inside the high (σ above median) and low volatility regimes.
inline RegimeRisk regime_risk(const std::vector<double>& returns,
                              const std::vector<double>& conditional_vol) {
    RegimeRisk out;
    if (conditional_vol.size() != returns.size() || returns.empty()) return out;
    double med = stats::median(conditional_vol);
    std::vector<double> high, low;
    int changes = 0;
    for (size_t i = 0; i < returns.size(); ++i) {
        bool h = conditional_vol[i] > med;
        (h ? high : low).push_back(returns[i]);
        if (i > 0 && h != (conditional_vol[i - 1] > med)) ++changes;
    }
    out.high_vol_var = high.empty() ? 0.0 : stats::percentile(high, 5.0);
    out.low_vol_var = low.empty() ? 0.0 : stats::percentile(low, 5.0);
    out.regime_persistence = 1.0 - static_cast<double>(changes) / static_cast<double>(returns.size());
    return out;
}

inline double sortino_ratio(const std::vector<double>& returns, int trading_days) {
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) downside.push_back(r);
    }
    double dd = stats::stddev(downside);
    if (downside.empty() || dd <= 0.0) return 0.0;
    return stats::mean(returns) / dd * std::sqrt(static_cast<double>(trading_days));
}

inline VolatilityRiskAttribution attribution(const std::vector<double>& returns,
                                             const std::vector<double>& conditional_vol,
                                             size_t correlation_window = 30) {
    VolatilityRiskAttribution a;
    if (conditional_vol.size() != returns.size() || returns.size() < 2) return a;
    a.total_variance = stats::variance(returns, 1);
    double cond_var = 0.0;
    for (double s : conditional_vol) cond_var += s * s;
    a.systematic_variance = cond_var / static_cast<double>(conditional_vol.size());
    a.idiosyncratic_variance = std::max(0.0, a.total_variance - a.systematic_variance);
    a.systematic_percentage = a.total_variance > 0.0 ? 100.0 * a.systematic_variance / a.total_variance : 0.0;
    a.volatility_persistence = stats::autocorrelation(conditional_vol, 1);
    a.vol_of_vol = stats::stddev(conditional_vol, 1);

    // Mean of rolling return / σ correlations.
    std::vector<double> corrs;
    for (size_t end = correlation_window; end <= returns.size(); ++end) {
        std::vector<double> r(returns.begin() + static_cast<std::ptrdiff_t>(end - correlation_window),
                              returns.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<double> v(conditional_vol.begin() + static_cast<std::ptrdiff_t>(end - correlation_window),
                              conditional_vol.begin() + static_cast<std::ptrdiff_t>(end));
        double c = stats::correlation(r, v);
        if (std::isfinite(c)) corrs.push_back(c);
    }
    a.return_vol_correlation = stats::mean(corrs);
    return a;
}

}  // namespace risk

// ---------------------------------------------------------------------------
// compute_risk_metrics
//
// VaR figures are empirical return percentiles (negative numbers for losses);
// expected shortfall is the mean return at or below the VaR. GARCH VaR uses
// the last conditional σ. Empty input yields all-zero metrics.
// ---------------------------------------------------------------------------
inline RiskMetrics compute_risk_metrics(const std::vector<double>& returns,
                                        const std::vector<double>& conditional_vol,
                                        int trading_days = 252) {
    RiskMetrics m;
    if (returns.empty()) return m;
    double sd = stats::stddev(returns);
    double mu = stats::mean(returns);
    double annualizer = std::sqrt(static_cast<double>(trading_days));

    m.annualized_volatility = sd * annualizer;
    m.var_95 = stats::percentile(returns, 5.0);
    m.var_99 = stats::percentile(returns, 1.0);
    m.var_99_5 = stats::percentile(returns, 0.5);
    m.expected_shortfall_95 = risk::expected_shortfall(returns, m.var_95);
    m.expected_shortfall_99 = risk::expected_shortfall(returns, m.var_99);
    double p95 = stats::percentile(returns, 95.0);
    m.tail_ratio = std::abs(m.var_95) > 0.0 ? p95 / std::abs(m.var_95) : 0.0;

    m.drawdown = risk::drawdown_stats(returns, trading_days);
    m.sharpe_ratio = sd > 0.0 ? mu / sd * annualizer : 0.0;
    m.sortino_ratio = risk::sortino_ratio(returns, trading_days);
    m.calmar_ratio = m.drawdown.max_drawdown != 0.0
                         ? mu * trading_days / std::abs(m.drawdown.max_drawdown)
                         : 0.0;
    m.skewness = stats::skewness(returns);
    m.excess_kurtosis = stats::excess_kurtosis(returns);

    if (!conditional_vol.empty()) m.garch_var_95 = -risk::GARCH_VAR_Z * conditional_vol.back();
    m.regime = risk::regime_risk(returns, conditional_vol);
    m.stress = risk::stress_scenarios(returns);
    if (returns.size() >= 10) {
        double ac = stats::autocorrelation(returns, 1);
        m.liquidity_risk = std::isfinite(ac) ? std::abs(ac) : 0.0;
    }
    m.attribution = risk::attribution(returns, conditional_vol);
    return m;
}
