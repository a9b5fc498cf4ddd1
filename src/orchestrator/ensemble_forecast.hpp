#pragma once

#include "analysis/descriptive_stats.hpp"
#include "core/errors.hpp"
#include "core/time_series.hpp"
#include "ensemble/features.hpp"
#include "ensemble/learner_factory.hpp"
#include "estimators/garch_estimator.hpp"
#include "estimators/kalman_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ComponentForecast — one ensemble member scored on the hold-out split
// ---------------------------------------------------------------------------
struct ComponentForecast {
    std::string name;
    std::vector<double> forecast;             // horizon return forecasts
    std::vector<double> holdout_predictions;
    double holdout_r2 = 0.0;
    double holdout_mse = 0.0;
    double weight = 0.0;
    std::vector<double> feature_importance;   // learners only, in ensemble_feature_names() order
    bool degraded = false;
    std::string reason;
};

struct EnsembleForecast {
    std::vector<double> forecast;
    std::vector<ComponentForecast> components;
    std::string best_component = "None";
    double holdout_r2 = 0.0;
    double holdout_mse = 0.0;
    int train_samples = 0;
    int holdout_samples = 0;
    std::map<std::string, double> feature_importance;   // feature name -> share
    std::string feature_importance_source;              // component it was read from

    double weight_of(const std::string& name) const {
        for (const auto& c : components) {
            if (c.name == name) return c.weight;
        }
        return 0.0;
    }
};

namespace ensemble {

// Weight = max(0, R²) over non-degraded components, normalised to 1. When no
// component scores above 0, non-degraded components share equally.
// Throws NumericalDivergenceError when every component is degraded.
inline void assign_weights(std::vector<ComponentForecast>& components) {
    double total = 0.0;
    int usable = 0;
    for (auto& c : components) {
        c.weight = 0.0;
        if (c.degraded) continue;
        ++usable;
        c.weight = std::isfinite(c.holdout_r2) ? std::max(0.0, c.holdout_r2) : 0.0;
        total += c.weight;
    }
    if (usable == 0) {
        throw NumericalDivergenceError("no ensemble component produced a forecast");
    }
    for (auto& c : components) {
        if (c.degraded) continue;
        c.weight = total > 0.0 ? c.weight / total : 1.0 / usable;
    }
}

inline std::vector<double> blend(const std::vector<ComponentForecast>& components,
                                 std::vector<double> ComponentForecast::*series,
                                 size_t length) {
    std::vector<double> out(length, 0.0);
    for (const auto& c : components) {
        if (c.weight <= 0.0) continue;
        const auto& v = c.*series;
        for (size_t i = 0; i < length && i < v.size(); ++i) out[i] += c.weight * v[i];
    }
    return out;
}

}  // namespace ensemble

// ---------------------------------------------------------------------------
// EnsembleForecaster
//
// Members: zero-mean GARCH return, Kalman trend-implied return, and each
// configured regression learner trained on the chronological training split.
// All members predict returns[t + 1] from information at t; the last
// holdout_fraction of samples scores them.
// ---------------------------------------------------------------------------
class EnsembleForecaster {
public:
    explicit EnsembleForecaster(EnsembleConfig config = {}) : config_(std::move(config)) {}

    const EnsembleConfig& config() const { return config_; }

    EnsembleForecast forecast(const TimeSeries& index, const GarchFit& garch,
                              const KalmanFit& kalman) const {
        const auto& r = index.returns;
        size_t m = r.size();
        if (m < 3) {
            throw UnderdeterminedModelError("ensemble forecast needs at least 3 returns");
        }
        size_t horizon = static_cast<size_t>(std::max(1, config_.horizon));
        size_t samples = m - 1;
        size_t n_test = std::max<size_t>(1, static_cast<size_t>(config_.holdout_fraction * static_cast<double>(samples)));
        if (n_test >= samples) n_test = samples - 1;
        size_t n_train = samples - n_test;
        if (n_train == 0) {
            throw UnderdeterminedModelError("ensemble forecast has no training samples");
        }

        std::vector<double> y_test(r.begin() + static_cast<std::ptrdiff_t>(n_train + 1), r.end());

        EnsembleForecast out;
        out.train_samples = static_cast<int>(n_train);
        out.holdout_samples = static_cast<int>(n_test);

        out.components.push_back(garch_component(garch, y_test, horizon));
        out.components.push_back(kalman_component(kalman, n_train, samples, y_test, horizon));

        std::vector<double> cv = garch.degraded ? std::vector<double>{} : garch.conditional_volatility;
        if (cv.size() != m) cv.clear();
        std::vector<double> level = kalman.degraded ? std::vector<double>{} : level_path(kalman);
        if (level.size() != index.prices.size()) level.clear();
        FeatureMatrix X = build_ensemble_features(r, index.prices, cv, level);

        for (LearnerKind kind : config_.learners) {
            out.components.push_back(learner_component(kind, X, r, n_train, samples, y_test, horizon));
        }

        ensemble::assign_weights(out.components);
        out.forecast = ensemble::blend(out.components, &ComponentForecast::forecast, horizon);
        auto blended = ensemble::blend(out.components, &ComponentForecast::holdout_predictions, n_test);
        out.holdout_r2 = stats::r_squared(y_test, blended);
        out.holdout_mse = stats::mse(y_test, blended);

        set_feature_importance(out);

        double best = -std::numeric_limits<double>::infinity();
        for (const auto& c : out.components) {
            if (!c.degraded && c.holdout_r2 > best) {
                best = c.holdout_r2;
                out.best_component = c.name;
            }
        }
        return out;
    }

private:
    EnsembleConfig config_;

    static void score(ComponentForecast& c, const std::vector<double>& y_test) {
        c.holdout_r2 = stats::r_squared(y_test, c.holdout_predictions);
        c.holdout_mse = stats::mse(y_test, c.holdout_predictions);
    }

    // Gradient boosting gain is preferred; otherwise any usable learner
    // that reports importances.
    static void set_feature_importance(EnsembleForecast& out) {
        const ComponentForecast* source = nullptr;
        for (const auto& c : out.components) {
            if (c.degraded || c.feature_importance.empty()) continue;
            if (!source || c.name == to_string(LearnerKind::GradientBoosting)) source = &c;
        }
        if (!source) return;
        auto names = ensemble_feature_names();
        for (size_t j = 0; j < names.size() && j < source->feature_importance.size(); ++j) {
            out.feature_importance[names[j]] = source->feature_importance[j];
        }
        out.feature_importance_source = source->name;
    }

    static ComponentForecast degraded_component(const std::string& name, const std::string& reason,
                                                size_t horizon, size_t n_test) {
        ComponentForecast c;
        c.name = name;
        c.degraded = true;
        c.reason = reason;
        c.forecast.assign(horizon, 0.0);
        c.holdout_predictions.assign(n_test, 0.0);
        return c;
    }

    static ComponentForecast garch_component(const GarchFit& garch, const std::vector<double>& y_test,
                                             size_t horizon) {
        if (garch.degraded) {
            return degraded_component("GARCH", "GARCH fit degraded: " + garch.degraded_reason,
                                      horizon, y_test.size());
        }
        ComponentForecast c;
        c.name = "GARCH";
        c.forecast.assign(horizon, 0.0);
        c.holdout_predictions.assign(y_test.size(), 0.0);
        score(c, y_test);
        return c;
    }

    // Implied next return from the filtered level and slope at t + 1.
    static ComponentForecast kalman_component(const KalmanFit& kalman, size_t n_train, size_t samples,
                                              const std::vector<double>& y_test, size_t horizon) {
        if (kalman.degraded) {
            return degraded_component("Kalman", "Kalman fit degraded: " + kalman.degraded_reason,
                                      horizon, y_test.size());
        }
        auto level = level_path(kalman);
        auto slope = slope_path(kalman);
        if (level.size() != samples + 2) {
            return degraded_component("Kalman", "Kalman state path length mismatch", horizon, y_test.size());
        }
        auto implied = [&](size_t i) {
            return level[i] != 0.0 ? slope[i] / level[i] : 0.0;
        };

        ComponentForecast c;
        c.name = "Kalman";
        for (size_t t = n_train; t < samples; ++t) c.holdout_predictions.push_back(implied(t + 1));
        score(c, y_test);

        double L = level.back();
        double s = slope.back();
        for (size_t h = 1; h <= horizon; ++h) {
            double prev = L + s * static_cast<double>(h - 1);
            double next = L + s * static_cast<double>(h);
            c.forecast.push_back(prev != 0.0 ? next / prev - 1.0 : 0.0);
        }
        return c;
    }

    ComponentForecast learner_component(LearnerKind kind, const FeatureMatrix& X,
                                        const std::vector<double>& r, size_t n_train, size_t samples,
                                        const std::vector<double>& y_test, size_t horizon) const {
        std::string name = to_string(kind);
        if (static_cast<int>(samples) < config_.min_samples) {
            return degraded_component(name, "insufficient samples: " + std::to_string(samples),
                                      horizon, y_test.size());
        }
        try {
            auto learner = LearnerFactory::create(kind, config_);
            FeatureMatrix X_train(X.begin(), X.begin() + static_cast<std::ptrdiff_t>(n_train));
            std::vector<double> y_train(r.begin() + 1, r.begin() + static_cast<std::ptrdiff_t>(n_train + 1));
            FeatureMatrix X_test(X.begin() + static_cast<std::ptrdiff_t>(n_train),
                                 X.begin() + static_cast<std::ptrdiff_t>(samples));
            learner->fit(X_train, y_train);

            ComponentForecast c;
            c.name = learner->name();
            c.holdout_predictions = learner->predict(X_test);
            c.feature_importance = learner->feature_importance();
            score(c, y_test);

            FeatureRow row = X.back();
            for (size_t h = 0; h < horizon; ++h) {
                double pred = learner->predict(FeatureMatrix{row}).front();
                if (!std::isfinite(pred)) {
                    throw NumericalDivergenceError(name + " produced a non-finite forecast");
                }
                c.forecast.push_back(pred);
                row = advance_features(row, pred);
            }
            if (!std::isfinite(c.holdout_r2)) {
                throw NumericalDivergenceError(name + " produced non-finite hold-out predictions");
            }
            return c;
        } catch (const std::exception& e) {
            return degraded_component(name, e.what(), horizon, y_test.size());
        }
    }
};
