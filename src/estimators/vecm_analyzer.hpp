#pragma once

#include "analysis/statistical_tests.hpp"
#include "core/errors.hpp"
#include "core/time_series.hpp"
#include "linalg/least_squares.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <numbers>
#include <set>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// VecmConfig
// ---------------------------------------------------------------------------
struct VecmConfig {
    int lags = 1;
    double eigenvalue_threshold = 0.1;
    int horizon = 10;
    double granger_significance = 0.05;
    double irf_decay = 0.8;
    double irf_cross_impact = 0.1;
};

// ---------------------------------------------------------------------------
// JohansenSummary — reduced-rank regression eigen-analysis
//
// trace_stats[r] tests H0: rank <= r; max_eigen_stats[r] tests rank = r
// against r + 1.
// ---------------------------------------------------------------------------
struct JohansenSummary {
    std::vector<double> eigenvalues;
    std::vector<std::vector<double>> eigenvectors;
    std::vector<double> trace_stats;
    std::vector<double> max_eigen_stats;
    std::vector<double> trace_critical_5pct;
    std::vector<double> max_eigen_critical_5pct;
    int n_cointegrating = 0;
    double trace_stat = 0.0;       // rank-0 trace statistic
    double max_eigen_stat = 0.0;   // rank-0 max-eigenvalue statistic
};

struct GrangerResult {
    double f_statistic = 0.0;
    double p_value = 1.0;
    int df_num = 0;
    int df_den = 0;
    bool significant = false;
};

// ---------------------------------------------------------------------------
// CointegrationFit — VECM estimate
// ---------------------------------------------------------------------------
struct CointegrationFit {
    std::vector<std::string> names;
    std::vector<std::vector<double>> cointegrating_vectors;
    std::vector<std::vector<double>> adjustment_coefficients;  // [equation][vector]
    std::vector<double> intercepts;
    std::vector<Eigen::MatrixXd> short_run_dynamics;           // per lag, [equation][variable]
    Eigen::MatrixXd residuals;
    Eigen::MatrixXd residual_covariance;
    JohansenSummary johansen;
    std::map<std::pair<std::string, std::string>, GrangerResult> granger_causality;  // (cause, effect)
    std::vector<std::vector<std::vector<double>>> impulse_responses;       // [shock][response][h]
    std::vector<std::vector<std::vector<double>>> variance_decomposition;  // [variable][h][source]
    double log_likelihood = 0.0;
    double aic = 0.0;
    double bic = 0.0;
    double error_correction_coefficient = 0.0;
    int lags = 0;
    int num_obs = 0;
    bool degraded = false;
    std::string degraded_reason;
};

namespace vecm {

// 5% critical values, unrestricted constant, indexed by (k - r) - 1.
inline double trace_critical_5pct(size_t k_minus_r) {
    static const double cv[] = {3.8415, 15.4943, 29.7961, 47.8545, 69.8189, 95.7542};
    if (k_minus_r == 0 || k_minus_r > 6) return 0.0;
    return cv[k_minus_r - 1];
}

inline double max_eigen_critical_5pct(size_t k_minus_r) {
    static const double cv[] = {3.8415, 14.2639, 21.1314, 27.5858, 33.8765, 40.0780};
    if (k_minus_r == 0 || k_minus_r > 6) return 0.0;
    return cv[k_minus_r - 1];
}

// Design blocks shared by Johansen, VECM and Granger regressions. Row i
// corresponds to t = lags + 1 + i.
struct LaggedDesign {
    size_t T = 0;
    Eigen::MatrixXd dY;     // T x k, ΔY_t
    Eigen::MatrixXd Ylag;   // T x k, Y_{t-1}
    Eigen::MatrixXd Z;      // T x (1 + k*lags), [1, ΔY_{t-1}, ..., ΔY_{t-lags}]
};

inline LaggedDesign build_design(const Eigen::MatrixXd& Y, size_t lags) {
    Eigen::Index N = Y.rows();
    Eigen::Index k = Y.cols();
    Eigen::Index p = static_cast<Eigen::Index>(lags);
    Eigen::Index T = N - 1 - p;
    Eigen::MatrixXd dY_full = Y.bottomRows(N - 1) - Y.topRows(N - 1);

    LaggedDesign d;
    d.T = static_cast<size_t>(T);
    d.dY = dY_full.bottomRows(T);
    d.Ylag = Y.middleRows(p, T);
    d.Z.resize(T, 1 + k * p);
    d.Z.col(0).setOnes();
    for (Eigen::Index l = 1; l <= p; ++l) {
        d.Z.middleCols(1 + (l - 1) * k, k) = dY_full.middleRows(p - l, T);
    }
    return d;
}

// ---------------------------------------------------------------------------
// johansen — eigenvalues of S11⁻¹ S10 S00⁻¹ S01, solved as the generalized
// symmetric problem S10 S00⁻¹ S01 v = λ S11 v.
// ---------------------------------------------------------------------------
inline JohansenSummary johansen(const LaggedDesign& d, double eigenvalue_threshold) {
    size_t k = static_cast<size_t>(d.dY.cols());
    double T = static_cast<double>(d.T);

    Eigen::MatrixXd R0 = linalg::ols(d.Z, d.dY).residuals;
    Eigen::MatrixXd R1 = linalg::ols(d.Z, d.Ylag).residuals;
    Eigen::MatrixXd S00 = (R0.transpose() * R0) / T;
    Eigen::MatrixXd S11 = (R1.transpose() * R1) / T;
    Eigen::MatrixXd S01 = (R0.transpose() * R1) / T;
    Eigen::MatrixXd S10 = S01.transpose();

    Eigen::MatrixXd M = linalg::symmetrize(S10 * linalg::spd_solve(S00, S01));
    Eigen::GeneralizedSelfAdjointEigenSolver<Eigen::MatrixXd> solver(M, linalg::symmetrize(S11));
    if (solver.info() != Eigen::Success) {
        throw NumericalDivergenceError("Johansen eigen-decomposition failed");
    }

    // Eigen returns ascending eigenvalues; rank tests want them descending.
    JohansenSummary js;
    js.eigenvalues.resize(k);
    for (size_t i = 0; i < k; ++i) {
        Eigen::Index src = static_cast<Eigen::Index>(k - 1 - i);
        js.eigenvalues[i] = std::clamp(solver.eigenvalues()(src), 0.0, 1.0 - 1e-12);
        js.eigenvectors.push_back(linalg::to_vector(solver.eigenvectors().col(src)));
    }
    for (size_t r = 0; r < k; ++r) {
        double trace = 0.0;
        for (size_t i = r; i < k; ++i) trace += -T * std::log(1.0 - js.eigenvalues[i]);
        js.trace_stats.push_back(trace);
        js.max_eigen_stats.push_back(-T * std::log(1.0 - js.eigenvalues[r]));
        js.trace_critical_5pct.push_back(trace_critical_5pct(k - r));
        js.max_eigen_critical_5pct.push_back(max_eigen_critical_5pct(k - r));
    }
    js.trace_stat = js.trace_stats.front();
    js.max_eigen_stat = js.max_eigen_stats.front();

    // Sequential trace test, additionally requiring the eigenvalue to clear
    // the configured floor. Without tabulated values only the floor applies.
    int r = 0;
    while (static_cast<size_t>(r) < k) {
        double cv = js.trace_critical_5pct[static_cast<size_t>(r)];
        bool trace_rejects = (cv <= 0.0) || js.trace_stats[static_cast<size_t>(r)] > cv;
        if (!trace_rejects || js.eigenvalues[static_cast<size_t>(r)] <= eigenvalue_threshold) break;
        ++r;
    }
    js.n_cointegrating = r;
    return js;
}

// Normalise a cointegrating vector on its first non-negligible element.
inline std::vector<double> normalize_vector(std::vector<double> v) {
    for (double x : v) {
        if (std::abs(x) > 1e-12) {
            double s = x;
            for (double& y : v) y /= s;
            return v;
        }
    }
    return v;
}

// Restricted (own lags) vs unrestricted (own + cause lags) F-test on ΔY.
inline GrangerResult granger_test(const LaggedDesign& d, size_t cause, size_t effect,
                                  size_t lags, double significance) {
    Eigen::Index k = d.dY.cols();
    Eigen::Index T = static_cast<Eigen::Index>(d.T);
    Eigen::Index p = static_cast<Eigen::Index>(lags);
    Eigen::Index e = static_cast<Eigen::Index>(effect);
    Eigen::Index c = static_cast<Eigen::Index>(cause);
    Eigen::MatrixXd Xr(T, 1 + p);
    Eigen::MatrixXd Xu(T, 1 + 2 * p);
    Xr.col(0).setOnes();
    Xu.col(0).setOnes();
    for (Eigen::Index l = 1; l <= p; ++l) {
        Xr.col(l) = d.Z.col(1 + (l - 1) * k + e);
        Xu.col(l) = d.Z.col(1 + (l - 1) * k + e);
        Xu.col(p + l) = d.Z.col(1 + (l - 1) * k + c);
    }
    Eigen::MatrixXd y = d.dY.col(e);
    double rss_r = linalg::ols(Xr, y).rss(0);
    double rss_u = linalg::ols(Xu, y).rss(0);

    GrangerResult g;
    g.df_num = static_cast<int>(lags);
    g.df_den = static_cast<int>(T) - static_cast<int>(Xu.cols());
    if (g.df_den <= 0 || rss_u <= 0.0) return g;
    g.f_statistic = std::max(0.0, ((rss_r - rss_u) / static_cast<double>(lags)) /
                                      (rss_u / static_cast<double>(g.df_den)));
    g.p_value = detail::f_sf(g.f_statistic, g.df_num, g.df_den);
    g.significant = g.p_value < significance;
    return g;
}

// Geometric-decay impulse responses [shock][response][h].
inline std::vector<std::vector<std::vector<double>>> impulse_responses(
    size_t k, int horizon, double decay, double cross_impact) {
    std::vector<std::vector<std::vector<double>>> irf(k, std::vector<std::vector<double>>(k));
    for (size_t s = 0; s < k; ++s) {
        for (size_t r = 0; r < k; ++r) {
            double impact = (s == r) ? 1.0 : cross_impact;
            for (int h = 0; h < horizon; ++h) irf[s][r].push_back(impact * std::pow(decay, h));
        }
    }
    return irf;
}

// Forecast-error variance shares [variable][h][source], rows sum to 1.
inline std::vector<std::vector<std::vector<double>>> variance_decomposition(size_t k, int horizon) {
    std::vector<std::vector<std::vector<double>>> fevd(k);
    for (size_t v = 0; v < k; ++v) {
        for (int h = 0; h < horizon; ++h) {
            double own = 0.8 * std::exp(-0.1 * h) + 0.2;
            double other = (k > 1) ? (0.2 / static_cast<double>(k - 1)) * (1.0 - std::exp(-0.1 * h))
                                   : 0.0;
            std::vector<double> row(k, other);
            row[v] = own;
            double sum = 0.0;
            for (double x : row) sum += x;
            for (double& x : row) x /= sum;
            fevd[v].push_back(row);
        }
    }
    return fevd;
}

}  // namespace vecm

// ---------------------------------------------------------------------------
// VecmAnalyzer — Johansen rank + VECM(lags) estimated by OLS
// ---------------------------------------------------------------------------
class VecmAnalyzer {
public:
    explicit VecmAnalyzer(VecmConfig config = {}) : config_(config) {}

    const VecmConfig& config() const { return config_; }

    // Series must share one length; call truncate_to_min_length() first to
    // align histories of different lengths. Names key the Granger map and
    // must be distinct. Throws DataShapeError on malformed input before any
    // numerical work.
    CointegrationFit fit(const std::vector<TimeSeries>& series, int lags = -1) const {
        if (series.empty()) {
            throw DataShapeError("cointegration analysis needs at least one series");
        }
        validate_aligned(series);
        int p = lags >= 1 ? lags : std::max(1, config_.lags);

        std::vector<std::string> names;
        for (size_t i = 0; i < series.size(); ++i) {
            names.push_back(series[i].symbol.empty() ? "series_" + std::to_string(i)
                                                     : series[i].symbol);
        }
        std::set<std::string> seen;
        for (const auto& name : names) {
            if (!seen.insert(name).second) {
                throw DataShapeError("duplicate series name '" + name + "'");
            }
        }

        try {
            if (series.size() < 2) {
                throw UnderdeterminedModelError("VECM requires at least 2 series, got " +
                                                std::to_string(series.size()));
            }
            return estimate(series, names, static_cast<size_t>(p));
        } catch (const UnderdeterminedModelError& e) {
            return fallback(names, p, e.what());
        } catch (const NumericalDivergenceError& e) {
            return fallback(names, p, e.what());
        }
    }

    CointegrationFit fallback(const std::vector<std::string>& names, int lags,
                              const std::string& reason) const {
        CointegrationFit f;
        f.names = names;
        f.lags = lags;
        f.degraded = true;
        f.degraded_reason = reason;
        f.johansen.n_cointegrating = 0;
        size_t k = names.size();
        f.impulse_responses = vecm::impulse_responses(k, config_.horizon, config_.irf_decay,
                                                      config_.irf_cross_impact);
        f.variance_decomposition = vecm::variance_decomposition(k, config_.horizon);
        return f;
    }

private:
    VecmConfig config_;

    CointegrationFit estimate(const std::vector<TimeSeries>& series,
                              const std::vector<std::string>& names, size_t lags) const {
        size_t k = series.size();
        size_t N = series.front().size();
        size_t k_vecm = 1 + k + k * lags;  // worst case regressor count
        if (N < lags + 2 + k_vecm + 10) {
            throw UnderdeterminedModelError("not enough observations (" + std::to_string(N) +
                                            ") for a VECM with " + std::to_string(lags) + " lags");
        }

        Eigen::MatrixXd Y(N, k);
        for (size_t j = 0; j < k; ++j) Y.col(static_cast<Eigen::Index>(j)) = linalg::to_eigen(series[j].prices);

        auto d = vecm::build_design(Y, lags);

        CointegrationFit f;
        f.names = names;
        f.lags = static_cast<int>(lags);
        f.num_obs = static_cast<int>(d.T);
        f.johansen = vecm::johansen(d, config_.eigenvalue_threshold);
        size_t r = static_cast<size_t>(f.johansen.n_cointegrating);
        for (size_t i = 0; i < r; ++i) {
            f.cointegrating_vectors.push_back(vecm::normalize_vector(f.johansen.eigenvectors[i]));
        }

        // [1, ECT_{t-1} (r columns), ΔY lags]
        Eigen::Index ri = static_cast<Eigen::Index>(r);
        Eigen::Index kl = static_cast<Eigen::Index>(k * lags);
        Eigen::MatrixXd X(static_cast<Eigen::Index>(d.T), 1 + ri + kl);
        X.col(0).setOnes();
        for (Eigen::Index c = 0; c < ri; ++c) {
            X.col(1 + c) = d.Ylag * linalg::to_eigen(f.cointegrating_vectors[static_cast<size_t>(c)]);
        }
        X.rightCols(kl) = d.Z.rightCols(kl);

        auto ols = linalg::ols(X, d.dY);
        f.residuals = ols.residuals;
        for (size_t e = 0; e < k; ++e) {
            f.intercepts.push_back(ols.coefficients(0, e));
            std::vector<double> alpha;
            for (size_t c = 0; c < r; ++c) alpha.push_back(ols.coefficients(1 + c, e));
            f.adjustment_coefficients.push_back(alpha);
        }
        for (size_t l = 0; l < lags; ++l) {
            // Coefficients are [regressor][equation]; store [equation][variable].
            Eigen::Index start = static_cast<Eigen::Index>(1 + r + l * k);
            Eigen::Index kk = static_cast<Eigen::Index>(k);
            f.short_run_dynamics.push_back(ols.coefficients.middleRows(start, kk).transpose());
        }
        if (r > 0) f.error_correction_coefficient = f.adjustment_coefficients[0][0];

        double T = static_cast<double>(d.T);
        f.residual_covariance = (f.residuals.transpose() * f.residuals) / T;
        double logdet = linalg::log_det_spd(f.residual_covariance);
        double kd = static_cast<double>(k);
        f.log_likelihood = -0.5 * T * (kd * std::log(2.0 * std::numbers::pi) + logdet + kd);
        double n_params = kd * static_cast<double>(X.cols()) + static_cast<double>(r) * kd;
        f.aic = 2.0 * n_params - 2.0 * f.log_likelihood;
        f.bic = std::log(T) * n_params - 2.0 * f.log_likelihood;

        for (size_t c = 0; c < k; ++c) {
            for (size_t e = 0; e < k; ++e) {
                if (c == e) continue;
                f.granger_causality[{names[c], names[e]}] =
                    vecm::granger_test(d, c, e, lags, config_.granger_significance);
            }
        }

        f.impulse_responses = vecm::impulse_responses(k, config_.horizon, config_.irf_decay,
                                                      config_.irf_cross_impact);
        f.variance_decomposition = vecm::variance_decomposition(k, config_.horizon);
        return f;
    }
};
