#pragma once

#include "analysis/descriptive_stats.hpp"
#include "orchestrator/diagnostics.hpp"
#include "orchestrator/ensemble_forecast.hpp"
#include "orchestrator/risk_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

struct Interval {
    double point = 0.0;
    double lower_95 = 0.0;
    double upper_95 = 0.0;
    double lower_68 = 0.0;
    double upper_68 = 0.0;
};

struct ConfidenceIntervals {
    bool has_forecast = false;
    Interval forecast;     // last ensemble forecast ± dispersion of the path; unset without a forecast
    Interval var_95;       // standard error taken as 10% of |VaR|
    Interval sharpe_ratio; // standard error 0.1
};

struct ModelUncertainty {
    double ensemble_uncertainty = 0.0;
    double model_agreement = 1.0;
    double forecast_uncertainty = 0.0;
    double temporal_stability = 1.0;
    double parameter_uncertainty = 0.0;
    double overall_uncertainty = 0.5;
    double confidence_level = 0.5;
};

namespace uncertainty {

constexpr double Z_95 = 1.96;
constexpr double VAR_RELATIVE_SE = 0.1;
constexpr double SHARPE_SE = 0.1;

inline Interval symmetric(double point, double se) {
    return {point, point - Z_95 * se, point + Z_95 * se, point - se, point + se};
}

}  // namespace uncertainty

inline ConfidenceIntervals compute_confidence_intervals(const std::vector<double>& ensemble_forecast,
                                                        const RiskMetrics& risk) {
    ConfidenceIntervals ci;
    if (!ensemble_forecast.empty()) {
        ci.has_forecast = true;
        ci.forecast = uncertainty::symmetric(ensemble_forecast.back(), stats::stddev(ensemble_forecast));
    }
    ci.var_95 = uncertainty::symmetric(risk.var_95, uncertainty::VAR_RELATIVE_SE * std::abs(risk.var_95));
    ci.sharpe_ratio = uncertainty::symmetric(risk.sharpe_ratio, uncertainty::SHARPE_SE);
    return ci;
}

// ---------------------------------------------------------------------------
// assess_model_uncertainty
//
// Ensemble part: dispersion of hold-out R² across usable components (skipped
// when no ensemble ran). Forecast part: walk-forward error dispersion.
// Parameter part: 1 - min(stationarity flag, structural stability).
// ---------------------------------------------------------------------------
inline ModelUncertainty assess_model_uncertainty(const EnsembleForecast* ensemble,
                                                 const Diagnostics& diag) {
    ModelUncertainty u;
    std::vector<double> parts;

    if (ensemble) {
        std::vector<double> r2;
        for (const auto& c : ensemble->components) {
            if (!c.degraded && std::isfinite(c.holdout_r2)) r2.push_back(c.holdout_r2);
        }
        if (!r2.empty()) {
            u.ensemble_uncertainty = stats::stddev(r2);
            u.model_agreement = 1.0 - u.ensemble_uncertainty;
            parts.push_back(u.ensemble_uncertainty);
        }
    }

    u.forecast_uncertainty = diag.cross_validation.forecast_error_std;
    u.temporal_stability = diag.cross_validation.forecast_stability;
    parts.push_back(u.forecast_uncertainty);

    double stationarity = diag.stability.garch_stationary ? 1.0 : 0.0;
    u.parameter_uncertainty = 1.0 - std::min(stationarity, diag.stability.structural_stability);
    parts.push_back(u.parameter_uncertainty);

    u.overall_uncertainty = stats::mean(parts);
    u.confidence_level = 1.0 - u.overall_uncertainty;
    return u;
}
