#pragma once

#include "analysis/descriptive_stats.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

struct SignalConfig {
    size_t volatility_window = 20;
    double low_vol_ratio = 0.8;
    double high_vol_ratio = 1.2;
    double trend_threshold = 1e-3;   // |slope / level|
};

// ---------------------------------------------------------------------------
// TradingSignals — per-return-period signals in {-1, 0, +1}
// ---------------------------------------------------------------------------
struct TradingSignals {
    std::vector<int> volatility;
    std::vector<int> trend;
    std::vector<int> combined;
};

// ---------------------------------------------------------------------------
// generate_trading_signals
//
//   conditional_vol  σ_t on the return grid (n - 1 entries)
//   level, slope     Kalman filtered states on the price grid (n entries)
//
// Volatility rule: +1 when σ_t < 0.8 × trailing 20-period mean of σ, -1 when
// above 1.2 ×. Trend rule: sign of slope / level beyond the threshold.
// Combined is the common value when both rules agree and are non-zero.
// ---------------------------------------------------------------------------
inline TradingSignals generate_trading_signals(const std::vector<double>& conditional_vol,
                                               const std::vector<double>& level,
                                               const std::vector<double>& slope,
                                               const SignalConfig& cfg = {}) {
    size_t m = conditional_vol.size();
    if (level.size() != slope.size() || (m > 0 && level.size() != m + 1)) {
        throw std::invalid_argument("generate_trading_signals: series length mismatch");
    }

    TradingSignals s;
    s.volatility.assign(m, 0);
    s.trend.assign(m, 0);
    s.combined.assign(m, 0);

    auto vol_ma = stats::rolling_mean(conditional_vol, cfg.volatility_window);
    for (size_t t = cfg.volatility_window; t < m; ++t) {
        if (!std::isfinite(vol_ma[t])) continue;
        if (conditional_vol[t] < vol_ma[t] * cfg.low_vol_ratio) s.volatility[t] = 1;
        else if (conditional_vol[t] > vol_ma[t] * cfg.high_vol_ratio) s.volatility[t] = -1;
    }

    for (size_t t = 0; t < m; ++t) {
        double lv = level[t + 1];
        if (lv == 0.0) continue;
        double rel = slope[t + 1] / std::abs(lv);
        if (rel > cfg.trend_threshold) s.trend[t] = 1;
        else if (rel < -cfg.trend_threshold) s.trend[t] = -1;
    }

    for (size_t t = 0; t < m; ++t) {
        if (s.volatility[t] != 0 && s.volatility[t] == s.trend[t]) s.combined[t] = s.volatility[t];
    }
    return s;
}
