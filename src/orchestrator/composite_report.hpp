#pragma once

#include "core/stage_result.hpp"
#include "estimators/garch_estimator.hpp"
#include "estimators/kalman_estimator.hpp"
#include "estimators/vecm_analyzer.hpp"
#include "orchestrator/anomaly_detection.hpp"
#include "orchestrator/diagnostics.hpp"
#include "orchestrator/ensemble_forecast.hpp"
#include "orchestrator/pattern_analysis.hpp"
#include "orchestrator/regime_analysis.hpp"
#include "orchestrator/risk_metrics.hpp"
#include "orchestrator/trading_signals.hpp"
#include "orchestrator/uncertainty.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ModelComparison — information criteria side by side
// ---------------------------------------------------------------------------
struct GarchComparisonRow {
    GarchKind kind = GarchKind::GARCH;
    double aic = 0.0;
    double bic = 0.0;
    double log_likelihood = 0.0;
    bool degraded = false;
};

struct ModelComparison {
    std::vector<GarchComparisonRow> garch;
    GarchKind best_garch = GarchKind::GARCH;
    double kalman_log_likelihood = 0.0;
    double vecm_log_likelihood = 0.0;
};

inline ModelComparison compare_models(const GarchSelection& garch, const KalmanFit& kalman,
                                      const CointegrationFit& vecm) {
    ModelComparison c;
    for (const auto& f : garch.candidates) {
        c.garch.push_back({f.kind, f.aic, f.bic, f.log_likelihood, f.degraded});
    }
    c.best_garch = garch.best.kind;
    c.kalman_log_likelihood = kalman.log_likelihood;
    c.vecm_log_likelihood = vecm.log_likelihood;
    return c;
}

struct Narrative {
    std::vector<std::string> insights;
    std::vector<std::string> recommendations;
};

// ---------------------------------------------------------------------------
// CompositeReport — one analysis call's complete, read-only result
//
// Leaf estimator fits are always present (possibly degraded fallbacks).
// Derived sections are StageResults: a degraded section carries a neutral
// value and the reason it could not be computed.
// ---------------------------------------------------------------------------
struct CompositeReport {
    std::string symbol;
    size_t num_observations = 0;
    std::vector<int64_t> timestamps;
    std::vector<double> prices;
    std::vector<double> returns;

    GarchSelection garch;
    KalmanFit kalman;
    CointegrationFit cointegration;
    ModelComparison comparison;

    StageResult<RegimeAnalysis> regime;
    StageResult<RiskMetrics> risk;
    StageResult<TradingSignals> signals;
    StageResult<EnsembleForecast> ensemble;
    StageResult<Diagnostics> diagnostics;
    StageResult<ConfidenceIntervals> confidence_intervals;
    StageResult<ModelUncertainty> model_uncertainty;
    StageResult<AnomalyReport> anomalies;
    StageResult<GarchRollingAnalysis> rolling_garch;
    StageResult<PatternAnalysis> patterns;
    StageResult<Narrative> narrative;

    const GarchFit& best_garch() const { return garch.best; }

    // Names of derived sections and leaf fits that came back degraded.
    std::vector<std::string> degraded_sections() const {
        std::vector<std::string> out;
        if (garch.best.degraded) out.push_back("garch");
        if (kalman.degraded) out.push_back("kalman");
        if (cointegration.degraded) out.push_back("cointegration");
        auto check = [&out](const auto& section, const char* name) {
            if (section.is_degraded()) out.push_back(name);
        };
        check(regime, "regime");
        check(risk, "risk");
        check(signals, "signals");
        check(ensemble, "ensemble");
        check(diagnostics, "diagnostics");
        check(confidence_intervals, "confidence_intervals");
        check(model_uncertainty, "model_uncertainty");
        check(anomalies, "anomalies");
        check(rolling_garch, "rolling_garch");
        check(patterns, "patterns");
        check(narrative, "narrative");
        return out;
    }
};

// ---------------------------------------------------------------------------
// CompositeReportBuilder — accumulates independently-set sections
//
// build() fills every section that was never set with a Degraded neutral
// value, so the returned report is always structurally complete.
// ---------------------------------------------------------------------------
class CompositeReportBuilder {
public:
    CompositeReportBuilder& series(const TimeSeries& ts) {
        symbol_ = ts.symbol;
        timestamps_ = ts.timestamps;
        prices_ = ts.prices;
        returns_ = ts.returns;
        return *this;
    }
    CompositeReportBuilder& garch(GarchSelection v) { garch_ = std::move(v); return *this; }
    CompositeReportBuilder& kalman(KalmanFit v) { kalman_ = std::move(v); return *this; }
    CompositeReportBuilder& cointegration(CointegrationFit v) { cointegration_ = std::move(v); return *this; }
    CompositeReportBuilder& comparison(ModelComparison v) { comparison_ = std::move(v); return *this; }
    CompositeReportBuilder& regime(StageResult<RegimeAnalysis> v) { regime_ = std::move(v); return *this; }
    CompositeReportBuilder& risk(StageResult<RiskMetrics> v) { risk_ = std::move(v); return *this; }
    CompositeReportBuilder& signals(StageResult<TradingSignals> v) { signals_ = std::move(v); return *this; }
    CompositeReportBuilder& ensemble(StageResult<EnsembleForecast> v) { ensemble_ = std::move(v); return *this; }
    CompositeReportBuilder& diagnostics(StageResult<Diagnostics> v) { diagnostics_ = std::move(v); return *this; }
    CompositeReportBuilder& confidence_intervals(StageResult<ConfidenceIntervals> v) {
        confidence_intervals_ = std::move(v);
        return *this;
    }
    CompositeReportBuilder& model_uncertainty(StageResult<ModelUncertainty> v) {
        model_uncertainty_ = std::move(v);
        return *this;
    }
    CompositeReportBuilder& anomalies(StageResult<AnomalyReport> v) { anomalies_ = std::move(v); return *this; }
    CompositeReportBuilder& rolling_garch(StageResult<GarchRollingAnalysis> v) {
        rolling_garch_ = std::move(v);
        return *this;
    }
    CompositeReportBuilder& patterns(StageResult<PatternAnalysis> v) { patterns_ = std::move(v); return *this; }
    CompositeReportBuilder& narrative(StageResult<Narrative> v) { narrative_ = std::move(v); return *this; }

    CompositeReport build() const {
        CompositeReport r;
        r.symbol = symbol_;
        r.num_observations = prices_.size();
        r.timestamps = timestamps_;
        r.prices = prices_;
        r.returns = returns_;
        // Fallback fits are only built for sections that were never set.
        r.garch = garch_ ? *garch_ : missing_garch();
        r.kalman = kalman_ ? *kalman_ : missing_kalman();
        r.cointegration = cointegration_ ? *cointegration_ : missing_cointegration();
        r.comparison = comparison_ ? *comparison_ : compare_models(r.garch, r.kalman, r.cointegration);
        r.regime = or_missing(regime_);
        r.risk = or_missing(risk_);
        r.signals = or_missing(signals_);
        r.ensemble = or_missing(ensemble_);
        r.diagnostics = or_missing(diagnostics_);
        r.confidence_intervals = or_missing(confidence_intervals_);
        r.model_uncertainty = or_missing(model_uncertainty_);
        r.anomalies = or_missing(anomalies_);
        r.rolling_garch = or_missing(rolling_garch_);
        r.patterns = or_missing(patterns_);
        r.narrative = or_missing(narrative_);
        return r;
    }

private:
    std::string symbol_;
    std::vector<int64_t> timestamps_;
    std::vector<double> prices_;
    std::vector<double> returns_;
    std::optional<GarchSelection> garch_;
    std::optional<KalmanFit> kalman_;
    std::optional<CointegrationFit> cointegration_;
    std::optional<ModelComparison> comparison_;
    std::optional<StageResult<RegimeAnalysis>> regime_;
    std::optional<StageResult<RiskMetrics>> risk_;
    std::optional<StageResult<TradingSignals>> signals_;
    std::optional<StageResult<EnsembleForecast>> ensemble_;
    std::optional<StageResult<Diagnostics>> diagnostics_;
    std::optional<StageResult<ConfidenceIntervals>> confidence_intervals_;
    std::optional<StageResult<ModelUncertainty>> model_uncertainty_;
    std::optional<StageResult<AnomalyReport>> anomalies_;
    std::optional<StageResult<GarchRollingAnalysis>> rolling_garch_;
    std::optional<StageResult<PatternAnalysis>> patterns_;
    std::optional<StageResult<Narrative>> narrative_;

    static constexpr const char* NOT_COMPUTED = "section not computed";

    template <typename T>
    static StageResult<T> or_missing(const std::optional<StageResult<T>>& section) {
        if (section) return *section;
        return StageResult<T>::degraded(T{}, NOT_COMPUTED);
    }

    GarchSelection missing_garch() const {
        GarchEstimator est;
        GarchSelection sel;
        for (GarchKind k : {GarchKind::GARCH, GarchKind::EGARCH, GarchKind::TGARCH}) {
            sel.candidates.push_back(est.fallback(returns_, k, NOT_COMPUTED));
        }
        sel.best = sel.candidates.front();
        return sel;
    }

    KalmanFit missing_kalman() const {
        return KalmanEstimator().fallback(prices_, KalmanKind::LocalTrend, NOT_COMPUTED);
    }

    CointegrationFit missing_cointegration() const {
        return VecmAnalyzer().fallback({symbol_}, 1, NOT_COMPUTED);
    }
};
