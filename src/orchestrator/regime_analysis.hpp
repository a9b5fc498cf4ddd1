#pragma once

#include "analysis/descriptive_stats.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// VolatilityRegimes — above / below-median split of GARCH σ_t
// ---------------------------------------------------------------------------
struct VolatilityRegimes {
    std::vector<int> regimes;          // 1 = high volatility, 0 = low
    int high_vol_periods = 0;
    int low_vol_periods = 0;
    double persistence = 0.0;          // 1 - changes / n
    double median_volatility = 0.0;
};

// ---------------------------------------------------------------------------
// StateRegimes — direction counts of Kalman level changes
// ---------------------------------------------------------------------------
struct StateRegimes {
    int uptrend_periods = 0;
    int downtrend_periods = 0;
    int sideways_periods = 0;
    double trend_strength = 0.0;       // std of level changes
};

struct RegimeAnalysis {
    VolatilityRegimes volatility;
    StateRegimes state;
    std::array<double, 5> volatility_thresholds{};  // σ percentiles 25/50/75/90/95
    std::string current_regime = "unknown";
};

namespace regime {

// Percentile cut points used to label the current volatility level.
constexpr std::array<double, 5> VOL_PERCENTILES = {25.0, 50.0, 75.0, 90.0, 95.0};

inline std::string classify_vol_regime(double current_vol, const std::array<double, 5>& thresholds) {
    if (current_vol <= thresholds[0]) return "low";
    if (current_vol <= thresholds[1]) return "medium-low";
    if (current_vol <= thresholds[2]) return "medium";
    if (current_vol <= thresholds[3]) return "high";
    if (current_vol <= thresholds[4]) return "extreme";
    return "crisis";
}

// Fraction of consecutive observations that stay in the same regime.
inline double regime_persistence(const std::vector<int>& regimes) {
    if (regimes.empty()) return 0.0;
    int changes = 0;
    for (size_t i = 1; i < regimes.size(); ++i) {
        if (regimes[i] != regimes[i - 1]) ++changes;
    }
    return 1.0 - static_cast<double>(changes) / static_cast<double>(regimes.size());
}

inline VolatilityRegimes volatility_regimes(const std::vector<double>& conditional_vol) {
    VolatilityRegimes out;
    if (conditional_vol.empty()) return out;
    out.median_volatility = stats::median(conditional_vol);
    out.regimes.reserve(conditional_vol.size());
    for (double v : conditional_vol) {
        int r = v > out.median_volatility ? 1 : 0;
        out.regimes.push_back(r);
        out.high_vol_periods += r;
    }
    out.low_vol_periods = static_cast<int>(conditional_vol.size()) - out.high_vol_periods;
    out.persistence = regime_persistence(out.regimes);
    return out;
}

inline StateRegimes state_regimes(const std::vector<double>& level) {
    StateRegimes out;
    auto changes = stats::diff(level);
    for (double c : changes) {
        if (c > 0.0) ++out.uptrend_periods;
        else if (c < 0.0) ++out.downtrend_periods;
        else ++out.sideways_periods;
    }
    out.trend_strength = stats::stddev(changes);
    return out;
}

}  // namespace regime

// ---------------------------------------------------------------------------
// analyze_regimes — volatility regimes from σ_t, state regimes from the
// filtered Kalman level.
// ---------------------------------------------------------------------------
inline RegimeAnalysis analyze_regimes(const std::vector<double>& conditional_vol,
                                      const std::vector<double>& kalman_level) {
    RegimeAnalysis out;
    out.volatility = regime::volatility_regimes(conditional_vol);
    out.state = regime::state_regimes(kalman_level);
    if (!conditional_vol.empty()) {
        for (size_t i = 0; i < regime::VOL_PERCENTILES.size(); ++i) {
            out.volatility_thresholds[i] = stats::percentile(conditional_vol, regime::VOL_PERCENTILES[i]);
        }
        out.current_regime = regime::classify_vol_regime(conditional_vol.back(), out.volatility_thresholds);
    }
    return out;
}
