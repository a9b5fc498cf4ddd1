#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Descriptive statistics over double series. All functions return 0 on
// inputs too short to define the statistic.
// ---------------------------------------------------------------------------
namespace stats {

inline double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// ddof = 0 → population variance (numpy default), ddof = 1 → sample variance.
inline double variance(const std::vector<double>& v, int ddof = 0) {
    size_t n = v.size();
    if (n <= static_cast<size_t>(ddof)) return 0.0;
    double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return ss / static_cast<double>(n - static_cast<size_t>(ddof));
}

inline double stddev(const std::vector<double>& v, int ddof = 0) {
    return std::sqrt(variance(v, ddof));
}

inline double skewness(const std::vector<double>& v) {
    double s = stddev(v);
    if (v.size() < 3 || s <= 0.0) return 0.0;
    double m = mean(v);
    double acc = 0.0;
    for (double x : v) {
        double z = (x - m) / s;
        acc += z * z * z;
    }
    return acc / static_cast<double>(v.size());
}

// Excess kurtosis (normal → 0).
inline double excess_kurtosis(const std::vector<double>& v) {
    double s = stddev(v);
    if (v.size() < 4 || s <= 0.0) return 0.0;
    double m = mean(v);
    double acc = 0.0;
    for (double x : v) {
        double z = (x - m) / s;
        acc += z * z * z * z;
    }
    return acc / static_cast<double>(v.size()) - 3.0;
}

// Percentile with linear interpolation between closest ranks, q in [0, 100].
inline double percentile(std::vector<double> v, double q) {
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    double pos = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, v.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
}

inline double median(const std::vector<double>& v) {
    return percentile(v, 50.0);
}

inline double correlation(const std::vector<double>& a, const std::vector<double>& b) {
    size_t n = std::min(a.size(), b.size());
    if (n < 2) return 0.0;
    double ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);
    double sab = 0.0, saa = 0.0, sbb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double da = a[i] - ma;
        double db = b[i] - mb;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (saa <= 0.0 || sbb <= 0.0) return 0.0;
    return sab / std::sqrt(saa * sbb);
}

// Pearson correlation of v[t] with v[t - lag].
inline double autocorrelation(const std::vector<double>& v, size_t lag = 1) {
    if (v.size() <= lag + 1) return 0.0;
    std::vector<double> head(v.begin(), v.end() - static_cast<std::ptrdiff_t>(lag));
    std::vector<double> tail(v.begin() + static_cast<std::ptrdiff_t>(lag), v.end());
    return correlation(tail, head);
}

inline std::vector<double> diff(const std::vector<double>& v) {
    std::vector<double> out;
    if (v.size() < 2) return out;
    out.reserve(v.size() - 1);
    for (size_t i = 1; i < v.size(); ++i) out.push_back(v[i] - v[i - 1]);
    return out;
}

// Trailing rolling mean; positions before the first full window are NaN.
inline std::vector<double> rolling_mean(const std::vector<double>& v, size_t window) {
    std::vector<double> out(v.size(), std::nan(""));
    if (window == 0 || v.size() < window) return out;
    double sum = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        sum += v[i];
        if (i >= window) sum -= v[i - window];
        if (i + 1 >= window) out[i] = sum / static_cast<double>(window);
    }
    return out;
}

// Trailing rolling sample std (ddof = 1); NaN before the first full window.
inline std::vector<double> rolling_std(const std::vector<double>& v, size_t window) {
    std::vector<double> out(v.size(), std::nan(""));
    if (window < 2 || v.size() < window) return out;
    for (size_t i = window - 1; i < v.size(); ++i) {
        std::vector<double> w(v.begin() + static_cast<std::ptrdiff_t>(i + 1 - window),
                              v.begin() + static_cast<std::ptrdiff_t>(i + 1));
        out[i] = stddev(w, 1);
    }
    return out;
}

// Replace leading NaNs with the first finite value (pandas bfill).
inline std::vector<double> backfill(std::vector<double> v) {
    size_t first = 0;
    while (first < v.size() && !std::isfinite(v[first])) ++first;
    if (first == v.size()) {
        std::fill(v.begin(), v.end(), 0.0);
        return v;
    }
    for (size_t i = 0; i < first; ++i) v[i] = v[first];
    for (size_t i = first + 1; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) v[i] = v[i - 1];
    }
    return v;
}

// Ordinary linear-trend measure: correlation of v with its index.
inline double trend_correlation(const std::vector<double>& v) {
    std::vector<double> idx(v.size());
    std::iota(idx.begin(), idx.end(), 0.0);
    return correlation(v, idx);
}

inline double mse(const std::vector<double>& actual, const std::vector<double>& predicted) {
    size_t n = std::min(actual.size(), predicted.size());
    if (n == 0) return 0.0;
    double ss = 0.0;
    for (size_t i = 0; i < n; ++i) ss += (actual[i] - predicted[i]) * (actual[i] - predicted[i]);
    return ss / static_cast<double>(n);
}

// Coefficient of determination, 1 - SS_res / SS_tot. A constant target
// scores 0.
inline double r_squared(const std::vector<double>& actual, const std::vector<double>& predicted) {
    size_t n = std::min(actual.size(), predicted.size());
    if (n < 2) return 0.0;
    std::vector<double> a(actual.begin(), actual.begin() + static_cast<std::ptrdiff_t>(n));
    double m = mean(a);
    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < n; ++i) {
        ss_res += (a[i] - predicted[i]) * (a[i] - predicted[i]);
        ss_tot += (a[i] - m) * (a[i] - m);
    }
    if (ss_tot <= 0.0) return 0.0;
    return 1.0 - ss_res / ss_tot;
}

}  // namespace stats
