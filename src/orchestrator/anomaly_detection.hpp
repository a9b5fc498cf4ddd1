#pragma once

#include "analysis/descriptive_stats.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct AnomalyConfig {
    double z_threshold = 3.0;
    size_t volatility_window = 20;
    double volatility_percentile = 95.0;
    size_t min_observations = 50;
};

// ---------------------------------------------------------------------------
// AnomalyReport — flags on the return grid
// ---------------------------------------------------------------------------
struct AnomalyReport {
    std::vector<bool> statistical;      // |z| > threshold
    std::vector<bool> volatility;       // rolling σ above its percentile
    std::vector<bool> combined;
    std::vector<size_t> indices;        // positions flagged in combined
    std::vector<int64_t> timestamps;    // timestamps of flagged returns
    int count = 0;
    double percentage = 0.0;
    double mean_anomaly_return = 0.0;
    double volatility_threshold = 0.0;
};

// ---------------------------------------------------------------------------
// detect_anomalies
//
// returns and (optional) timestamps of the return periods. Throws
// UnderdeterminedModelError below min_observations.
// ---------------------------------------------------------------------------
inline AnomalyReport detect_anomalies(const std::vector<double>& returns,
                                      const std::vector<int64_t>& return_timestamps = {},
                                      const AnomalyConfig& cfg = {}) {
    size_t n = returns.size();
    if (n < cfg.min_observations) {
        throw UnderdeterminedModelError("anomaly detection needs at least " +
                                        std::to_string(cfg.min_observations) + " returns");
    }

    AnomalyReport out;
    out.statistical.assign(n, false);
    out.volatility.assign(n, false);
    out.combined.assign(n, false);

    double mu = stats::mean(returns);
    double sd = stats::stddev(returns, 1);
    if (sd > 0.0) {
        for (size_t i = 0; i < n; ++i) {
            out.statistical[i] = std::abs((returns[i] - mu) / sd) > cfg.z_threshold;
        }
    }

    auto rolling_vol = stats::backfill(stats::rolling_std(returns, cfg.volatility_window));
    out.volatility_threshold = stats::percentile(rolling_vol, cfg.volatility_percentile);
    for (size_t i = 0; i < n; ++i) out.volatility[i] = rolling_vol[i] > out.volatility_threshold;

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        out.combined[i] = out.statistical[i] || out.volatility[i];
        if (!out.combined[i]) continue;
        out.indices.push_back(i);
        if (return_timestamps.size() == n) out.timestamps.push_back(return_timestamps[i]);
        sum += returns[i];
    }
    out.count = static_cast<int>(out.indices.size());
    out.percentage = 100.0 * out.count / static_cast<double>(n);
    out.mean_anomaly_return = out.count > 0 ? sum / out.count : 0.0;
    return out;
}
