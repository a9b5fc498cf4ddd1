#pragma once

#include "analysis/descriptive_stats.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Ensemble feature layout
//
// One row per return observation t (price index t + 1). Row t only uses
// information available at the close of period t; its regression target is
// returns[t + 1].
// ---------------------------------------------------------------------------
constexpr int NUM_RETURN_LAGS = 10;
constexpr std::array<size_t, 4> ROLLING_WINDOWS = {5, 10, 20, 50};
constexpr int ENSEMBLE_FEATURE_DIM = NUM_RETURN_LAGS + 2 * 4 + 2 + 2 + 2;

using FeatureRow = std::vector<double>;
using FeatureMatrix = std::vector<FeatureRow>;

inline std::vector<std::string> ensemble_feature_names() {
    std::vector<std::string> names;
    for (int l = 1; l <= NUM_RETURN_LAGS; ++l) names.push_back("return_lag_" + std::to_string(l));
    for (size_t w : ROLLING_WINDOWS) {
        names.push_back("rolling_mean_" + std::to_string(w));
        names.push_back("rolling_std_" + std::to_string(w));
    }
    names.push_back("price_to_sma20");
    names.push_back("price_to_sma50");
    names.push_back("garch_volatility");
    names.push_back("garch_volatility_ratio");
    names.push_back("kalman_level_gap");
    names.push_back("kalman_level_change");
    return names;
}

namespace features_detail {

inline double finite_or_zero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

}  // namespace features_detail

// ---------------------------------------------------------------------------
// build_ensemble_features
//
//   returns        n - 1 period returns
//   prices         n prices
//   conditional_vol  GARCH σ_t aligned with returns (empty → zeros)
//   kalman_level   filtered level aligned with prices (empty → price)
//
// NaN / Inf entries are replaced by 0.
// ---------------------------------------------------------------------------
inline FeatureMatrix build_ensemble_features(
    const std::vector<double>& returns,
    const std::vector<double>& prices,
    const std::vector<double>& conditional_vol,
    const std::vector<double>& kalman_level)
{
    size_t m = returns.size();
    if (prices.size() != m + 1) {
        throw std::invalid_argument("build_ensemble_features: prices must have returns.size() + 1 entries");
    }
    if (!conditional_vol.empty() && conditional_vol.size() != m) {
        throw std::invalid_argument("build_ensemble_features: conditional_vol length mismatch");
    }
    if (!kalman_level.empty() && kalman_level.size() != m + 1) {
        throw std::invalid_argument("build_ensemble_features: kalman_level length mismatch");
    }

    std::vector<std::vector<double>> roll_mean, roll_std;
    for (size_t w : ROLLING_WINDOWS) {
        roll_mean.push_back(stats::rolling_mean(returns, w));
        roll_std.push_back(stats::rolling_std(returns, w));
    }

    // Price-aligned SMAs, reduced to the return grid (price index t + 1).
    std::vector<double> p_next(prices.begin() + 1, prices.end());
    auto sma20 = stats::backfill(stats::rolling_mean(p_next, 20));
    auto sma50 = m >= 50 ? stats::backfill(stats::rolling_mean(p_next, 50)) : sma20;

    std::vector<double> vol = conditional_vol.empty() ? std::vector<double>(m, 0.0) : conditional_vol;
    auto vol_ma = stats::backfill(stats::rolling_mean(vol, 20));

    FeatureMatrix X(m, FeatureRow(ENSEMBLE_FEATURE_DIM, 0.0));
    for (size_t t = 0; t < m; ++t) {
        auto& row = X[t];
        size_t c = 0;
        for (int l = 1; l <= NUM_RETURN_LAGS; ++l, ++c) {
            size_t back = static_cast<size_t>(l - 1);
            row[c] = t >= back ? returns[t - back] : 0.0;
        }
        for (size_t w = 0; w < ROLLING_WINDOWS.size(); ++w) {
            row[c++] = roll_mean[w][t];
            row[c++] = roll_std[w][t];
        }
        double p = prices[t + 1];
        row[c++] = p / sma20[t];
        row[c++] = p / sma50[t];
        row[c++] = vol[t];
        row[c++] = vol[t] / vol_ma[t];
        if (kalman_level.empty()) {
            row[c++] = 0.0;
            row[c++] = 0.0;
        } else {
            row[c++] = kalman_level[t + 1] / p - 1.0;
            row[c++] = (kalman_level[t + 1] - kalman_level[t]) / p;
        }
        for (double& v : row) v = features_detail::finite_or_zero(v);
    }
    return X;
}

// Roll a feature row one step forward after predicting the next return: the
// prediction becomes lag 1 and older lags shift back. Other columns are held.
inline FeatureRow advance_features(FeatureRow row, double predicted_return) {
    for (int l = NUM_RETURN_LAGS - 1; l > 0; --l) row[static_cast<size_t>(l)] = row[static_cast<size_t>(l - 1)];
    row[0] = predicted_return;
    return row;
}

// ---------------------------------------------------------------------------
// FeatureScaler — per-column z-score fitted on training rows
// ---------------------------------------------------------------------------
struct FeatureScaler {
    std::vector<double> mean;
    std::vector<double> scale;

    void fit(const FeatureMatrix& X) {
        if (X.empty()) throw std::invalid_argument("FeatureScaler::fit: empty matrix");
        size_t d = X.front().size();
        mean.assign(d, 0.0);
        scale.assign(d, 1.0);
        std::vector<double> col(X.size());
        for (size_t j = 0; j < d; ++j) {
            for (size_t i = 0; i < X.size(); ++i) col[i] = X[i][j];
            mean[j] = stats::mean(col);
            double s = stats::stddev(col);
            scale[j] = s > 1e-12 ? s : 1.0;
        }
    }

    FeatureMatrix transform(const FeatureMatrix& X) const {
        FeatureMatrix out = X;
        for (auto& row : out) {
            if (row.size() != mean.size()) {
                throw std::invalid_argument("FeatureScaler::transform: column count mismatch");
            }
            for (size_t j = 0; j < row.size(); ++j) row[j] = (row[j] - mean[j]) / scale[j];
        }
        return out;
    }
};
