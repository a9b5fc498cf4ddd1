#pragma once

#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ReturnKind — how returns are derived from prices
// ---------------------------------------------------------------------------
enum class ReturnKind { Simple, Log };

// ---------------------------------------------------------------------------
// TimeSeries — one instrument's ordered (timestamp, price) history
//
// returns[i] is the return from prices[i] to prices[i + 1], so
// returns.size() == prices.size() - 1. volume is optional (empty or equal
// length to prices).
// ---------------------------------------------------------------------------
struct TimeSeries {
    std::string symbol;
    std::vector<int64_t> timestamps;
    std::vector<double> prices;
    std::vector<double> returns;
    std::vector<double> volume;

    size_t size() const { return prices.size(); }
    bool empty() const { return prices.empty(); }

    static TimeSeries from_prices(std::string symbol,
                                  std::vector<int64_t> timestamps,
                                  std::vector<double> prices,
                                  ReturnKind kind = ReturnKind::Simple) {
        TimeSeries ts;
        ts.symbol = std::move(symbol);
        ts.timestamps = std::move(timestamps);
        ts.prices = std::move(prices);
        ts.returns = compute_returns(ts.prices, kind);
        return ts;
    }

    static std::vector<double> compute_returns(const std::vector<double>& prices,
                                               ReturnKind kind = ReturnKind::Simple) {
        std::vector<double> out;
        if (prices.size() < 2) return out;
        out.reserve(prices.size() - 1);
        for (size_t i = 1; i < prices.size(); ++i) {
            double prev = prices[i - 1];
            double cur = prices[i];
            if (kind == ReturnKind::Log) {
                out.push_back(std::log(cur / prev));
            } else {
                out.push_back(cur / prev - 1.0);
            }
        }
        return out;
    }
};

namespace detail {

inline bool all_finite(const std::vector<double>& v) {
    return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

}  // namespace detail

// ---------------------------------------------------------------------------
// validate — reject malformed input before any numerical work.
// Throws DataShapeError.
// ---------------------------------------------------------------------------
inline void validate(const TimeSeries& ts, size_t min_length = 2) {
    const std::string who = ts.symbol.empty() ? std::string("series") : ts.symbol;

    if (ts.prices.empty()) {
        throw DataShapeError(who + ": empty price array");
    }
    if (ts.prices.size() < min_length) {
        throw DataShapeError(who + ": " + std::to_string(ts.prices.size()) +
                             " prices, need at least " + std::to_string(min_length));
    }
    if (!ts.timestamps.empty() && ts.timestamps.size() != ts.prices.size()) {
        throw DataShapeError(who + ": timestamps.size() != prices.size()");
    }
    if (!ts.volume.empty() && ts.volume.size() != ts.prices.size()) {
        throw DataShapeError(who + ": volume.size() != prices.size()");
    }
    if (!ts.returns.empty() && ts.returns.size() + 1 != ts.prices.size()) {
        throw DataShapeError(who + ": returns.size() must be prices.size() - 1");
    }
    if (!detail::all_finite(ts.prices) || !detail::all_finite(ts.returns) ||
        !detail::all_finite(ts.volume)) {
        throw DataShapeError(who + ": NaN or Inf in input arrays");
    }
    for (double p : ts.prices) {
        if (p <= 0.0) {
            throw DataShapeError(who + ": non-positive price");
        }
    }
    for (size_t i = 1; i < ts.timestamps.size(); ++i) {
        if (ts.timestamps[i] <= ts.timestamps[i - 1]) {
            throw DataShapeError(who + ": timestamps not strictly increasing at index " +
                                 std::to_string(i));
        }
    }
}

// All series valid and of identical length.
inline void validate_aligned(const std::vector<TimeSeries>& series, size_t min_length = 2) {
    if (series.empty()) {
        throw DataShapeError("no series supplied");
    }
    for (const auto& s : series) validate(s, min_length);
    size_t n = series.front().size();
    for (size_t i = 1; i < series.size(); ++i) {
        if (series[i].size() != n) {
            throw DataShapeError("series length mismatch: " + std::to_string(n) +
                                 " vs " + std::to_string(series[i].size()) +
                                 " (" + series[i].symbol + ")");
        }
    }
}

// Keep the trailing min-length window of every series.
inline std::vector<TimeSeries> truncate_to_min_length(const std::vector<TimeSeries>& series) {
    if (series.empty()) return {};
    size_t n = series.front().size();
    for (const auto& s : series) n = std::min(n, s.size());

    std::vector<TimeSeries> out;
    out.reserve(series.size());
    for (const auto& s : series) {
        size_t drop = s.size() - n;
        TimeSeries t;
        t.symbol = s.symbol;
        t.prices.assign(s.prices.begin() + static_cast<std::ptrdiff_t>(drop), s.prices.end());
        if (!s.timestamps.empty()) {
            t.timestamps.assign(s.timestamps.begin() + static_cast<std::ptrdiff_t>(drop),
                                s.timestamps.end());
        }
        if (!s.volume.empty()) {
            t.volume.assign(s.volume.begin() + static_cast<std::ptrdiff_t>(drop), s.volume.end());
        }
        if (!s.returns.empty() && n >= 2) {
            t.returns.assign(s.returns.end() - static_cast<std::ptrdiff_t>(n - 1), s.returns.end());
        }
        out.push_back(std::move(t));
    }
    return out;
}

// ---------------------------------------------------------------------------
// align_on_timestamps — restrict every series to the timestamps all of them
// share. Returns are recomputed (simple) on the common grid. Throws
// DataShapeError when a series has no timestamps or is out of order.
// ---------------------------------------------------------------------------
inline std::vector<TimeSeries> align_on_timestamps(const std::vector<TimeSeries>& series) {
    if (series.empty()) return {};
    for (const auto& s : series) {
        if (s.timestamps.empty()) {
            throw DataShapeError((s.symbol.empty() ? std::string("series") : s.symbol) +
                                 ": timestamps required for alignment");
        }
        validate(s, 1);
    }

    std::vector<int64_t> common = series.front().timestamps;
    for (size_t i = 1; i < series.size(); ++i) {
        std::vector<int64_t> next;
        std::set_intersection(common.begin(), common.end(), series[i].timestamps.begin(),
                              series[i].timestamps.end(), std::back_inserter(next));
        common.swap(next);
    }

    std::vector<TimeSeries> out;
    out.reserve(series.size());
    for (const auto& s : series) {
        TimeSeries t;
        t.symbol = s.symbol;
        t.timestamps = common;
        t.prices.reserve(common.size());
        size_t j = 0;
        for (int64_t ts : common) {
            while (s.timestamps[j] < ts) ++j;
            t.prices.push_back(s.prices[j]);
            if (!s.volume.empty()) t.volume.push_back(s.volume[j]);
        }
        t.returns = TimeSeries::compute_returns(t.prices);
        out.push_back(std::move(t));
    }
    return out;
}

// Returns of ts, deriving them from prices when not supplied.
inline std::vector<double> returns_of(const TimeSeries& ts) {
    if (!ts.returns.empty()) return ts.returns;
    return TimeSeries::compute_returns(ts.prices);
}
