#pragma once

#include "analysis/descriptive_stats.hpp"
#include "orchestrator/composite_report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace insights {

inline std::string percent(double fraction) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << 100.0 * fraction << "%";
    return os.str();
}

inline std::string fixed_digits(double v, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << v;
    return os.str();
}

inline std::string fixed2(double v) { return fixed_digits(v, 2); }
inline std::string fixed3(double v) { return fixed_digits(v, 3); }

inline void model_insights(const CompositeReport& r, std::vector<std::string>& out) {
    const GarchFit& g = r.best_garch();
    out.push_back(std::string(to_string(g.kind)) + " model selected as best volatility model");
    if (!g.degraded && g.params.count("beta")) {
        double beta = g.param("beta");
        if (beta > 0.9) {
            out.push_back("High volatility persistence detected - shocks have long-lasting effects");
        } else if (beta < 0.5) {
            out.push_back("Low volatility persistence - volatility shocks decay quickly");
        }
    }

    if (r.risk.is_ok()) {
        const auto& m = r.risk.value;
        if (m.skewness < -0.5) {
            out.push_back("Negative skewness indicates higher probability of large negative returns");
        } else if (m.skewness > 0.5) {
            out.push_back("Positive skewness suggests potential for large positive returns");
        }
        if (m.excess_kurtosis > 3.0) {
            out.push_back("Excess kurtosis detected - fat tails indicate higher extreme event probability");
        }
    }

    if (r.regime.is_ok()) {
        double p = r.regime.value.volatility.persistence;
        if (p > 0.8) {
            out.push_back("High regime persistence - volatility states tend to cluster");
        } else if (p < 0.3) {
            out.push_back("Low regime persistence - frequent volatility regime switches");
        }
    }

    if (r.cointegration.johansen.n_cointegrating > 0) {
        out.push_back("Cointegration relationships detected - long-term equilibrium exists");
    }
    if (!r.kalman.degraded && r.kalman.log_likelihood > -100.0) {
        out.push_back("State-space model shows good fit - underlying trends well captured");
    }
}

inline void enhanced_insights(const CompositeReport& r, std::vector<std::string>& out) {
    if (r.ensemble.is_ok() && r.ensemble.value.holdout_r2 > 0.1) {
        out.push_back("Ensemble explains " + percent(r.ensemble.value.holdout_r2) +
                      " of hold-out return variance (best component: " +
                      r.ensemble.value.best_component + ")");
    }
    if (r.risk.is_ok() && r.risk.value.regime.high_vol_var < -0.03) {
        out.push_back("High volatility regime shows significant risk (VaR: " +
                      percent(r.risk.value.regime.high_vol_var) + ")");
    }
    if (r.ensemble.is_ok() && !r.ensemble.value.feature_importance.empty()) {
        const auto& fi = r.ensemble.value.feature_importance;
        auto top = std::max_element(fi.begin(), fi.end(),
                                    [](const auto& a, const auto& b) { return a.second < b.second; });
        out.push_back("Most predictive feature: " + top->first + " (importance: " +
                      fixed3(top->second) + ")");
    }
    if (r.anomalies.is_ok() && r.anomalies.value.percentage > 5.0) {
        out.push_back("Anomaly detection identifies " + percent(r.anomalies.value.percentage / 100.0) +
                      " of observations as outliers");
    }
    if (r.patterns.is_ok()) {
        const auto& p = r.patterns.value.patterns;
        if (p.momentum_strength > 0.6) {
            out.push_back("Strong momentum patterns detected (strength: " + fixed2(p.momentum_strength) + ")");
        }
        if (p.volatility_clustering > 0.7) {
            out.push_back("Significant volatility clustering suggests GARCH effects");
        }
    }
    if (r.diagnostics.is_ok()) {
        const auto& d = r.diagnostics.value;
        if (d.quality_score > 0.8) {
            out.push_back("Excellent model quality (score: " + fixed2(d.quality_score) + ")");
        } else if (d.quality_score < 0.5) {
            out.push_back("Model quality concerns identified (score: " + fixed2(d.quality_score) + ")");
        }
        if (d.tests.adf.p_value < 0.05) {
            out.push_back("Data exhibits strong stationarity (suitable for time series modeling)");
        }
        if (d.tests.jarque_bera.p_value < 0.05) {
            out.push_back("Returns deviate significantly from normality (consider robust methods)");
        }
        if (d.tests.arch_lm.p_value < 0.05) {
            out.push_back("Significant volatility clustering suggests GARCH effects");
        }
    }
}

inline void recommendations(const CompositeReport& r, std::vector<std::string>& out) {
    const GarchFit& g = r.best_garch();
    const auto& cv = g.conditional_volatility;
    if (!cv.empty()) {
        double current = cv.back();
        double avg = stats::mean(cv);
        if (current > avg * 1.5) {
            out.push_back("High volatility detected - consider reducing position sizes");
            out.push_back("Implement volatility-based stop losses");
        } else if (current < avg * 0.7) {
            out.push_back("Low volatility environment - consider increasing position sizes");
            out.push_back("Good opportunity for volatility selling strategies");
        }
    }

    if (r.risk.is_ok()) {
        const auto& m = r.risk.value;
        if (m.var_95 < -0.03) {
            out.push_back("High VaR indicates significant downside risk - implement hedging");
        }
        if (m.drawdown.max_drawdown < -0.2) {
            out.push_back("Large historical drawdowns - consider diversification strategies");
        }
        if (m.drawdown.max_duration > 30.0) {
            out.push_back("Long drawdown periods suggest need for diversification");
        }
        if (m.sharpe_ratio < 0.5) {
            out.push_back("Low risk-adjusted returns - review investment strategy");
        } else if (m.sharpe_ratio > 1.5) {
            out.push_back("Strong risk-adjusted performance - consider maintaining current allocation");
        }
        if (m.liquidity_risk > 0.3) {
            out.push_back("Elevated liquidity risk suggests smaller position sizes");
        }
    }

    if (!g.degraded) {
        if (g.kind == GarchKind::EGARCH) {
            out.push_back("Asymmetric volatility effects detected - monitor leverage impact");
        } else if (g.kind == GarchKind::TGARCH) {
            out.push_back("Threshold effects present - bad news increases volatility more than good news");
        }
    }

    if (r.regime.is_ok()) {
        const auto& label = r.regime.value.current_regime;
        if (label == "high" || label == "extreme" || label == "crisis") {
            out.push_back("Current high volatility regime suggests defensive positioning");
        } else if (label == "low") {
            out.push_back("Low volatility environment may support growth strategies");
        }
    }

    if (r.ensemble.is_ok() && !r.ensemble.value.forecast.empty()) {
        const char* direction = r.ensemble.value.forecast.back() > 0.0 ? "positive" : "negative";
        double confidence = r.model_uncertainty.is_ok() ? r.model_uncertainty.value.confidence_level : 0.0;
        out.push_back(std::string("Ensemble models predict ") + direction +
                      " returns (confidence: " + percent(confidence) + ")");
    }

    if (r.patterns.is_ok()) {
        const auto& pa = r.patterns.value;
        if (pa.patterns.mean_reversion_tendency > 0.6) {
            out.push_back("Strong mean reversion suggests contrarian strategies");
        }
        if (pa.patterns.trend_persistence > 0.6) {
            out.push_back("Trend persistence supports momentum strategies");
        }
        if (pa.correlation.has_reference && pa.correlation.correlation_risk > 0.7) {
            out.push_back("High correlation risk indicates need for alternative assets");
        }
    }

    if (r.cointegration.johansen.n_cointegrating > 0) {
        out.push_back("Cointegration detected - consider pairs trading strategies");
        out.push_back("Mean reversion opportunities may exist");
    }
}

}  // namespace insights

// ---------------------------------------------------------------------------
// build_narrative — threshold-driven insight and recommendation strings.
// Degraded sections contribute nothing.
// ---------------------------------------------------------------------------
inline Narrative build_narrative(const CompositeReport& report) {
    Narrative n;
    insights::model_insights(report, n.insights);
    insights::enhanced_insights(report, n.insights);
    insights::recommendations(report, n.recommendations);
    return n;
}
