#pragma once

#include "analysis/descriptive_stats.hpp"
#include "core/errors.hpp"
#include "linalg/least_squares.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// KalmanKind — state-space model variants
// ---------------------------------------------------------------------------
enum class KalmanKind { LocalLevel, LocalTrend, RegimeSwitching };

inline const char* to_string(KalmanKind k) {
    switch (k) {
        case KalmanKind::LocalLevel:      return "local_level";
        case KalmanKind::LocalTrend:      return "local_trend";
        case KalmanKind::RegimeSwitching: return "regime_switching";
    }
    return "local_level";
}

inline KalmanKind parse_kalman_kind(const std::string& s) {
    if (s == "local_level") return KalmanKind::LocalLevel;
    if (s == "local_trend") return KalmanKind::LocalTrend;
    if (s == "regime_switching") return KalmanKind::RegimeSwitching;
    throw std::invalid_argument("Unknown Kalman model: '" + s + "'");
}

// ---------------------------------------------------------------------------
// KalmanConfig — heuristic noise split of var(diff(prices))
// ---------------------------------------------------------------------------
struct KalmanConfig {
    double observation_noise_share = 0.1;   // R
    double level_noise_share = 0.9;         // Q, local level
    double trend_level_share = 0.8;         // Q[0][0], local trend
    double trend_slope_share = 0.1;         // Q[1][1], local trend
    int initial_slope_window = 10;
    int fallback_window = 10;
    size_t min_regime_observations = 10;
};

// ---------------------------------------------------------------------------
// KalmanFit — filter / smoother output; every per-step vector has one entry
// per input price
// ---------------------------------------------------------------------------
struct KalmanFit {
    KalmanKind kind = KalmanKind::LocalLevel;
    int state_dim = 1;
    std::vector<std::vector<double>> filtered_states;
    std::vector<std::vector<double>> predicted_states;
    std::vector<std::vector<double>> smoothed_states;
    std::vector<Eigen::MatrixXd> state_covariances;
    std::vector<Eigen::MatrixXd> predicted_covariances;
    std::vector<Eigen::MatrixXd> smoothed_covariances;
    std::vector<double> innovations;
    std::vector<double> innovation_variances;
    double log_likelihood = 0.0;
    std::map<std::string, double> params;
    std::vector<std::vector<double>> state_probabilities;  // regime switching only
    std::vector<int> regime_labels;                        // 0 = low vol, 1 = high vol
    bool degraded = false;
    std::string degraded_reason;
};

// Level (state[0]) at every step.
inline std::vector<double> level_path(const KalmanFit& fit) {
    std::vector<double> out;
    out.reserve(fit.filtered_states.size());
    for (const auto& s : fit.filtered_states) out.push_back(s.empty() ? 0.0 : s[0]);
    return out;
}

// Slope (state[1]) at every step; zeros for level-only models.
inline std::vector<double> slope_path(const KalmanFit& fit) {
    std::vector<double> out;
    out.reserve(fit.filtered_states.size());
    for (const auto& s : fit.filtered_states) out.push_back(s.size() > 1 ? s[1] : 0.0);
    return out;
}

namespace kalman {

// ---------------------------------------------------------------------------
// StateSpaceModel — x_t = F x_{t-1} + w, y_t = H x_t + v
// ---------------------------------------------------------------------------
struct StateSpaceModel {
    Eigen::MatrixXd F;
    Eigen::RowVectorXd H;
    Eigen::MatrixXd Q;
    double R = 0.0;
    Eigen::VectorXd x0;
    Eigen::MatrixXd P0;
};

inline double noise_scale(const std::vector<double>& prices) {
    double v = stats::variance(stats::diff(prices));
    double level = stats::mean(prices);
    double floor = 1e-12 * std::max(1.0, level * level);
    return std::max(v, floor);
}

inline StateSpaceModel local_level_model(const std::vector<double>& prices,
                                         const KalmanConfig& cfg) {
    double v = noise_scale(prices);
    StateSpaceModel m;
    m.F = Eigen::MatrixXd::Identity(1, 1);
    m.H = Eigen::RowVectorXd::Ones(1);
    m.Q = Eigen::MatrixXd::Constant(1, 1, cfg.level_noise_share * v);
    m.R = cfg.observation_noise_share * v;
    m.x0 = Eigen::VectorXd::Constant(1, prices.front());
    m.P0 = Eigen::MatrixXd::Identity(1, 1);
    return m;
}

inline StateSpaceModel local_trend_model(const std::vector<double>& prices,
                                         const KalmanConfig& cfg) {
    double v = noise_scale(prices);
    StateSpaceModel m;
    m.F = linalg::from_rows({{1.0, 1.0}, {0.0, 1.0}});
    m.H = Eigen::RowVector2d(1.0, 0.0);
    m.Q = Eigen::MatrixXd::Zero(2, 2);
    m.Q(0, 0) = cfg.trend_level_share * v;
    m.Q(1, 1) = cfg.trend_slope_share * v;
    m.R = cfg.observation_noise_share * v;

    size_t w = std::min(static_cast<size_t>(std::max(1, cfg.initial_slope_window)),
                        prices.size() - 1);
    double slope0 = 0.0;
    if (w > 0) slope0 = (prices[w] - prices[0]) / static_cast<double>(w);
    m.x0 = Eigen::Vector2d(prices.front(), slope0);
    m.P0 = Eigen::MatrixXd::Identity(2, 2);
    return m;
}

// ---------------------------------------------------------------------------
// filter — forward Kalman recursion. The prior (x0, P0) is the prediction
// for t = 0. Throws NumericalDivergenceError on a singular innovation
// variance.
// ---------------------------------------------------------------------------
inline KalmanFit filter(const std::vector<double>& y, const StateSpaceModel& m) {
    size_t n = y.size();
    size_t d = static_cast<size_t>(m.x0.size());
    KalmanFit out;
    out.state_dim = static_cast<int>(d);
    out.filtered_states.reserve(n);
    out.predicted_states.reserve(n);
    out.state_covariances.reserve(n);
    out.predicted_covariances.reserve(n);

    const double ln2pi = std::log(2.0 * std::numbers::pi);
    double s_floor = 1e-15 * std::max(1.0, y.empty() ? 1.0 : y.front() * y.front());
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(d),
                                                  static_cast<Eigen::Index>(d));

    Eigen::VectorXd x = m.x0;
    Eigen::MatrixXd P = m.P0;
    for (size_t t = 0; t < n; ++t) {
        Eigen::VectorXd xp = (t == 0) ? x : Eigen::VectorXd(m.F * x);
        Eigen::MatrixXd Pp = (t == 0) ? P : linalg::symmetrize(m.F * P * m.F.transpose() + m.Q);

        double innov = y[t] - m.H.dot(xp);
        double S = (m.H * Pp * m.H.transpose())(0, 0) + m.R;
        if (!std::isfinite(S) || S <= s_floor) {
            throw NumericalDivergenceError("singular innovation variance at step " +
                                           std::to_string(t));
        }

        Eigen::VectorXd K = (Pp * m.H.transpose()) / S;
        x = xp + K * innov;
        P = linalg::symmetrize((I - K * m.H) * Pp);

        out.log_likelihood += -0.5 * (ln2pi + std::log(S) + innov * innov / S);
        out.predicted_states.push_back(linalg::to_vector(xp));
        out.predicted_covariances.push_back(Pp);
        out.filtered_states.push_back(linalg::to_vector(x));
        out.state_covariances.push_back(P);
        out.innovations.push_back(innov);
        out.innovation_variances.push_back(S);
    }
    if (!std::isfinite(out.log_likelihood)) {
        throw NumericalDivergenceError("non-finite filter log-likelihood");
    }
    return out;
}

// ---------------------------------------------------------------------------
// rts_smooth — Rauch-Tung-Striebel backward pass over a filtered fit
// ---------------------------------------------------------------------------
inline void rts_smooth(KalmanFit& fit, const StateSpaceModel& m) {
    size_t n = fit.filtered_states.size();
    fit.smoothed_states = fit.filtered_states;
    fit.smoothed_covariances = fit.state_covariances;
    if (n < 2) return;

    for (size_t t = n - 1; t-- > 0;) {
        const Eigen::MatrixXd& P = fit.state_covariances[t];
        const Eigen::MatrixXd& Pp_next = fit.predicted_covariances[t + 1];
        // A = P Fᵀ Pp⁻¹, solved as Pp Aᵀ = F P since both covariances are symmetric.
        Eigen::MatrixXd A = linalg::spd_solve(Pp_next, m.F * P).transpose();

        Eigen::VectorXd dx = linalg::to_eigen(fit.smoothed_states[t + 1]) -
                             linalg::to_eigen(fit.predicted_states[t + 1]);
        Eigen::VectorXd xs = linalg::to_eigen(fit.smoothed_states[t]) + A * dx;
        fit.smoothed_states[t] = linalg::to_vector(xs);

        Eigen::MatrixXd dP = fit.smoothed_covariances[t + 1] - Pp_next;
        fit.smoothed_covariances[t] = linalg::symmetrize(P + A * dP * A.transpose());
    }
}

// Trailing moving average using whatever history is available at the start.
inline std::vector<double> moving_average(const std::vector<double>& y, int window) {
    std::vector<double> out(y.size());
    size_t w = static_cast<size_t>(std::max(1, window));
    double sum = 0.0;
    for (size_t i = 0; i < y.size(); ++i) {
        sum += y[i];
        if (i >= w) sum -= y[i - w];
        out[i] = sum / static_cast<double>(std::min(i + 1, w));
    }
    return out;
}

}  // namespace kalman

// ---------------------------------------------------------------------------
// KalmanEstimator — local level / local trend / two-regime local level
// ---------------------------------------------------------------------------
class KalmanEstimator {
public:
    explicit KalmanEstimator(KalmanConfig config = {}) : config_(config) {}

    const KalmanConfig& config() const { return config_; }

    KalmanFit fit(const std::vector<double>& prices, KalmanKind kind) const {
        if (prices.size() < 3) {
            return fallback(prices, kind, "insufficient data: " +
                            std::to_string(prices.size()) + " prices");
        }
        for (double p : prices) {
            if (!std::isfinite(p)) return fallback(prices, kind, "non-finite price");
        }

        try {
            switch (kind) {
                case KalmanKind::LocalLevel:
                    return fit_linear(prices, kalman::local_level_model(prices, config_), kind);
                case KalmanKind::LocalTrend:
                    return fit_linear(prices, kalman::local_trend_model(prices, config_), kind);
                case KalmanKind::RegimeSwitching:
                    return fit_regime_switching(prices);
            }
        } catch (const NumericalDivergenceError& e) {
            return fallback(prices, kind, e.what());
        }
        return fallback(prices, kind, "unknown model kind");
    }

    // Moving-average state with unit covariance.
    KalmanFit fallback(const std::vector<double>& prices, KalmanKind kind,
                       const std::string& reason) const {
        KalmanFit f;
        f.kind = kind;
        f.state_dim = 1;
        f.degraded = true;
        f.degraded_reason = reason;

        auto ma = kalman::moving_average(prices, config_.fallback_window);
        const double ln2pi = std::log(2.0 * std::numbers::pi);
        for (size_t t = 0; t < prices.size(); ++t) {
            f.filtered_states.push_back({ma[t]});
            f.predicted_states.push_back({ma[t]});
            f.smoothed_states.push_back({ma[t]});
            f.state_covariances.push_back(Eigen::MatrixXd::Identity(1, 1));
            f.predicted_covariances.push_back(Eigen::MatrixXd::Identity(1, 1));
            f.smoothed_covariances.push_back(Eigen::MatrixXd::Identity(1, 1));
            double innov = prices[t] - ma[t];
            f.innovations.push_back(innov);
            f.innovation_variances.push_back(1.0);
            f.log_likelihood += -0.5 * (ln2pi + innov * innov);
        }
        if (!std::isfinite(f.log_likelihood)) f.log_likelihood = 0.0;
        return f;
    }

private:
    KalmanConfig config_;

    KalmanFit fit_linear(const std::vector<double>& prices,
                         const kalman::StateSpaceModel& model, KalmanKind kind) const {
        KalmanFit f = kalman::filter(prices, model);
        kalman::rts_smooth(f, model);
        f.kind = kind;
        f.params["observation_noise"] = model.R;
        f.params["level_noise"] = model.Q(0, 0);
        if (model.Q.rows() > 1) f.params["slope_noise"] = model.Q(1, 1);
        return f;
    }

    // Split observations by |log return| around its median and run an
    // independent local-level filter per bucket.
    KalmanFit fit_regime_switching(const std::vector<double>& prices) const {
        size_t n = prices.size();
        std::vector<double> abs_ret(n, 0.0);
        for (size_t t = 1; t < n; ++t) abs_ret[t] = std::abs(std::log(prices[t] / prices[t - 1]));
        abs_ret[0] = abs_ret[1];
        double med = stats::median(abs_ret);

        std::vector<int> labels(n);
        std::vector<size_t> idx[2];
        for (size_t t = 0; t < n; ++t) {
            labels[t] = abs_ret[t] > med ? 1 : 0;
            idx[labels[t]].push_back(t);
        }

        if (idx[0].size() <= config_.min_regime_observations ||
            idx[1].size() <= config_.min_regime_observations) {
            // Not enough observations to separate regimes: one regime.
            KalmanFit f = fit_linear(prices, kalman::local_level_model(prices, config_),
                                     KalmanKind::RegimeSwitching);
            f.regime_labels.assign(n, 0);
            f.state_probabilities.assign(n, {1.0, 0.0});
            return f;
        }

        KalmanFit out;
        out.kind = KalmanKind::RegimeSwitching;
        out.state_dim = 1;
        out.filtered_states.resize(n);
        out.predicted_states.resize(n);
        out.smoothed_states.resize(n);
        out.state_covariances.resize(n);
        out.predicted_covariances.resize(n);
        out.smoothed_covariances.resize(n);
        out.innovations.resize(n);
        out.innovation_variances.resize(n);

        const char* names[2] = {"low_vol", "high_vol"};
        for (int r = 0; r < 2; ++r) {
            std::vector<double> sub;
            sub.reserve(idx[r].size());
            for (size_t t : idx[r]) sub.push_back(prices[t]);

            auto model = kalman::local_level_model(sub, config_);
            KalmanFit part = kalman::filter(sub, model);
            kalman::rts_smooth(part, model);

            for (size_t k = 0; k < idx[r].size(); ++k) {
                size_t t = idx[r][k];
                out.filtered_states[t] = part.filtered_states[k];
                out.predicted_states[t] = part.predicted_states[k];
                out.smoothed_states[t] = part.smoothed_states[k];
                out.state_covariances[t] = part.state_covariances[k];
                out.predicted_covariances[t] = part.predicted_covariances[k];
                out.smoothed_covariances[t] = part.smoothed_covariances[k];
                out.innovations[t] = part.innovations[k];
                out.innovation_variances[t] = part.innovation_variances[k];
            }
            out.log_likelihood += part.log_likelihood;
            out.params[std::string(names[r]) + "_observation_noise"] = model.R;
            out.params[std::string(names[r]) + "_level_noise"] = model.Q(0, 0);
        }
        out.params["abs_return_median"] = med;

        out.regime_labels = labels;
        out.state_probabilities.reserve(n);
        for (int l : labels) {
            out.state_probabilities.push_back(l == 0 ? std::vector<double>{1.0, 0.0}
                                                     : std::vector<double>{0.0, 1.0});
        }
        return out;
    }
};
