#pragma once

#include "core/errors.hpp"
#include "core/stage_result.hpp"
#include "core/time_series.hpp"
#include "estimators/garch_estimator.hpp"
#include "estimators/kalman_estimator.hpp"
#include "estimators/vecm_analyzer.hpp"
#include "orchestrator/anomaly_detection.hpp"
#include "orchestrator/composite_report.hpp"
#include "orchestrator/diagnostics.hpp"
#include "orchestrator/ensemble_forecast.hpp"
#include "orchestrator/insights.hpp"
#include "orchestrator/pattern_analysis.hpp"
#include "orchestrator/regime_analysis.hpp"
#include "orchestrator/risk_metrics.hpp"
#include "orchestrator/trading_signals.hpp"
#include "orchestrator/uncertainty.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AnalyzerConfig
// ---------------------------------------------------------------------------
struct AnalyzerConfig {
    GarchConfig garch;
    KalmanConfig kalman;
    VecmConfig vecm;
    EnsembleConfig ensemble;
    SignalConfig signals;
    AnomalyConfig anomalies;
    PatternConfig patterns;
    int trading_days = 252;
    int rolling_window = 252;
    bool enable_rolling = true;
    bool enable_anomalies = true;
    bool enable_patterns = true;
    size_t min_prices = 3;
};

namespace detail {

// Run one derived stage; any exception becomes a Degraded neutral section.
template <typename T, typename Fn>
StageResult<T> run_stage(Fn&& fn) {
    try {
        return StageResult<T>::ok(fn());
    } catch (const std::exception& e) {
        return StageResult<T>::degraded(T{}, e.what());
    }
}

}  // namespace detail

// ---------------------------------------------------------------------------
// IndexAnalyzer — composes the estimators into one CompositeReport
//
// Input shape is validated up front: DataShapeError propagates to the caller
// before any model is fitted. Every later stage is guarded, so numerical or
// under-determined failures surface as Degraded sections instead.
// ---------------------------------------------------------------------------
class IndexAnalyzer {
public:
    explicit IndexAnalyzer(AnalyzerConfig config = {}) : config_(std::move(config)) {}

    const AnalyzerConfig& config() const { return config_; }

    CompositeReport analyze(TimeSeries index, std::vector<TimeSeries> related = {}) const {
        index.returns = returns_of(index);
        for (auto& s : related) s.returns = returns_of(s);

        std::vector<TimeSeries> all;
        all.reserve(related.size() + 1);
        all.push_back(index);
        for (const auto& s : related) all.push_back(s);
        validate_aligned(all, config_.min_prices);

        CompositeReportBuilder builder;
        builder.series(index);

        GarchConfig garch_cfg = config_.garch;
        garch_cfg.rolling_window = config_.rolling_window;
        GarchEstimator garch_est(garch_cfg);
        GarchSelection garch = garch_est.fit_best(index.returns);
        const GarchFit& best = garch.best;

        KalmanFit kalman = KalmanEstimator(config_.kalman).fit(index.prices, KalmanKind::LocalTrend);

        VecmAnalyzer vecm_analyzer(config_.vecm);
        CointegrationFit vecm = related.empty()
            ? vecm_analyzer.fallback({index.symbol}, config_.vecm.lags, "no related series supplied")
            : vecm_analyzer.fit(all);

        auto level = level_path(kalman);
        auto slope = slope_path(kalman);
        const auto& returns = index.returns;

        builder.regime(detail::run_stage<RegimeAnalysis>([&] {
            return analyze_regimes(best.conditional_volatility, level);
        }));

        auto risk = detail::run_stage<RiskMetrics>([&] {
            return compute_risk_metrics(returns, best.conditional_volatility, config_.trading_days);
        });
        builder.risk(risk);

        builder.signals(detail::run_stage<TradingSignals>([&] {
            return generate_trading_signals(best.conditional_volatility, level, slope, config_.signals);
        }));

        auto ensemble = detail::run_stage<EnsembleForecast>([&] {
            return EnsembleForecaster(config_.ensemble).forecast(index, best, kalman);
        });
        builder.ensemble(ensemble);

        auto diag = detail::run_stage<Diagnostics>([&] {
            return run_diagnostics(returns, best, kalman, vecm);
        });
        builder.diagnostics(diag);

        builder.confidence_intervals(detail::run_stage<ConfidenceIntervals>([&] {
            if (risk.is_degraded()) throw UnderdeterminedModelError("risk metrics unavailable: " + risk.reason);
            // A degraded ensemble has no forecast path to bound.
            return compute_confidence_intervals(
                ensemble.is_ok() ? ensemble.value.forecast : std::vector<double>{}, risk.value);
        }));

        builder.model_uncertainty(detail::run_stage<ModelUncertainty>([&] {
            if (diag.is_degraded()) throw UnderdeterminedModelError("diagnostics unavailable: " + diag.reason);
            return assess_model_uncertainty(ensemble.is_ok() ? &ensemble.value : nullptr, diag.value);
        }));

        if (config_.enable_anomalies) {
            builder.anomalies(detail::run_stage<AnomalyReport>([&] {
                std::vector<int64_t> ts;
                if (index.timestamps.size() == index.prices.size()) {
                    ts.assign(index.timestamps.begin() + 1, index.timestamps.end());
                }
                return detect_anomalies(returns, ts, config_.anomalies);
            }));
        }

        if (config_.enable_rolling) {
            builder.rolling_garch(detail::run_stage<GarchRollingAnalysis>([&] {
                return garch_est.rolling_fit(returns, config_.trading_days);
            }));
        }

        if (config_.enable_patterns) {
            // The first related series is the correlation reference.
            builder.patterns(detail::run_stage<PatternAnalysis>([&] {
                if (related.empty()) return analyze_patterns(returns, index.prices, config_.patterns);
                return analyze_patterns(returns, index.prices, config_.patterns,
                                        related.front().returns, related.front().symbol);
            }));
        }

        builder.comparison(compare_models(garch, kalman, vecm));
        builder.garch(std::move(garch));
        builder.kalman(std::move(kalman));
        builder.cointegration(std::move(vecm));

        // The narrative reads the assembled sections, so draft the report first.
        CompositeReport draft = builder.build();
        builder.narrative(detail::run_stage<Narrative>([&] { return build_narrative(draft); }));
        return builder.build();
    }

private:
    AnalyzerConfig config_;
};
