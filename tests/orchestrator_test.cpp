// orchestrator_test.cpp — derived analysis stages and report assembly
//
// Tests regime classification, risk metrics, trading-signal rules, ensemble
// weighting and feature importance, diagnostics / uncertainty ranges, anomaly
// flags, and the CompositeReportBuilder's handling of set and unset sections.

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "orchestrator/composite_report.hpp"
#include "orchestrator/insights.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::find(lines.begin(), lines.end(), needle) != lines.end();
}

ComponentForecast component(const std::string& name, double r2, bool degraded = false) {
    ComponentForecast c;
    c.name = name;
    c.holdout_r2 = r2;
    c.degraded = degraded;
    return c;
}

}  // anonymous namespace

class OrchestratorTest : public ::testing::Test {};

// ===========================================================================
// Regimes
// ===========================================================================
TEST_F(OrchestratorTest, Regimes_MedianSplitAndPersistence) {
    std::vector<double> vol = {1.0, 1.0, 1.0, 5.0, 5.0, 5.0};
    auto r = regime::volatility_regimes(vol);
    EXPECT_EQ(r.regimes, (std::vector<int>{0, 0, 0, 1, 1, 1}));
    EXPECT_EQ(r.high_vol_periods, 3);
    EXPECT_EQ(r.low_vol_periods, 3);
    EXPECT_DOUBLE_EQ(r.persistence, 1.0 - 1.0 / 6.0);
}

TEST_F(OrchestratorTest, Regimes_ClassifyCurrentLevel) {
    std::array<double, 5> th = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_EQ(regime::classify_vol_regime(0.5, th), "low");
    EXPECT_EQ(regime::classify_vol_regime(1.5, th), "medium-low");
    EXPECT_EQ(regime::classify_vol_regime(2.5, th), "medium");
    EXPECT_EQ(regime::classify_vol_regime(3.5, th), "high");
    EXPECT_EQ(regime::classify_vol_regime(4.5, th), "extreme");
    EXPECT_EQ(regime::classify_vol_regime(9.0, th), "crisis");
}

TEST_F(OrchestratorTest, Regimes_StateDirectionCounts) {
    auto a = analyze_regimes({0.01, 0.02}, {100.0, 101.0, 101.0, 100.5});
    EXPECT_EQ(a.state.uptrend_periods, 1);
    EXPECT_EQ(a.state.sideways_periods, 1);
    EXPECT_EQ(a.state.downtrend_periods, 1);
    EXPECT_NE(a.current_regime, "unknown");
}

// ===========================================================================
// Risk
// ===========================================================================
TEST_F(OrchestratorTest, Risk_VarOrderingAndShortfall) {
    auto r = iid_normal(1000, 0.01, 4);
    auto m = compute_risk_metrics(r, std::vector<double>(r.size(), 0.01));
    EXPECT_LT(m.var_95, 0.0);
    EXPECT_LE(m.var_99, m.var_95);
    EXPECT_LE(m.var_99_5, m.var_99);
    EXPECT_LE(m.expected_shortfall_95, m.var_95);
    EXPECT_LE(m.expected_shortfall_99, m.var_99);
    EXPECT_LE(m.drawdown.max_drawdown, 0.0);
    EXPECT_NEAR(m.annualized_volatility, 0.01 * std::sqrt(252.0), 0.02);
    EXPECT_DOUBLE_EQ(m.garch_var_95, -1.645 * 0.01);
}

TEST_F(OrchestratorTest, Risk_DrawdownOfKnownPath) {
    // +10%, -50%, +10%: peak 1.1, trough 0.55.
    auto dd = risk::drawdown_curve({0.1, -0.5, 0.1});
    ASSERT_EQ(dd.size(), 3u);
    EXPECT_DOUBLE_EQ(dd[0], 0.0);
    EXPECT_NEAR(dd[1], -0.5, 1e-12);
    EXPECT_NEAR(dd[2], 0.605 / 1.1 - 1.0, 1e-12);
}

TEST_F(OrchestratorTest, Risk_EmptyReturnsAreNeutral) {
    auto m = compute_risk_metrics({}, {});
    EXPECT_DOUBLE_EQ(m.var_95, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0);
}

// ===========================================================================
// Trading signals
// ===========================================================================
TEST_F(OrchestratorTest, Signals_LengthMismatchThrows) {
    std::vector<double> vol(10, 0.01);
    EXPECT_THROW(generate_trading_signals(vol, std::vector<double>(10, 100.0), std::vector<double>(10, 0.0)),
                 std::invalid_argument);
}

TEST_F(OrchestratorTest, Signals_CombinedWhenRulesAgree) {
    std::vector<double> vol(40, 1.0);
    for (size_t t = 30; t < vol.size(); ++t) vol[t] = 0.5;
    std::vector<double> level(41, 100.0);
    std::vector<double> slope(41, 1.0);   // 1% per period
    auto s = generate_trading_signals(vol, level, slope);
    ASSERT_EQ(s.combined.size(), 40u);
    EXPECT_EQ(s.volatility[25], 0);
    EXPECT_EQ(s.volatility[30], 1);
    EXPECT_EQ(s.trend[5], 1);
    EXPECT_EQ(s.combined[25], 0);
    EXPECT_EQ(s.combined[30], 1);
    for (size_t t = 0; t < 20; ++t) EXPECT_EQ(s.volatility[t], 0);
}

// ===========================================================================
// Ensemble
// ===========================================================================
TEST_F(OrchestratorTest, AssignWeights_PositiveR2Normalised) {
    std::vector<ComponentForecast> c = {component("A", 0.5), component("B", -0.2), component("C", 0.3)};
    ensemble::assign_weights(c);
    EXPECT_DOUBLE_EQ(c[0].weight, 0.625);
    EXPECT_DOUBLE_EQ(c[1].weight, 0.0);
    EXPECT_DOUBLE_EQ(c[2].weight, 0.375);
}

TEST_F(OrchestratorTest, AssignWeights_NoPositiveScoreSharesEqually) {
    std::vector<ComponentForecast> c = {component("A", -0.1), component("B", -0.3), component("C", 0.9, true)};
    ensemble::assign_weights(c);
    EXPECT_DOUBLE_EQ(c[0].weight, 0.5);
    EXPECT_DOUBLE_EQ(c[1].weight, 0.5);
    EXPECT_DOUBLE_EQ(c[2].weight, 0.0);
}

TEST_F(OrchestratorTest, AssignWeights_AllDegradedThrows) {
    std::vector<ComponentForecast> c = {component("A", 0.5, true)};
    EXPECT_THROW(ensemble::assign_weights(c), NumericalDivergenceError);
}

TEST_F(OrchestratorTest, Ensemble_WeightsSumToOneAndHorizon) {
    auto index = garch_index(400, 3);
    auto garch = GarchEstimator().fit(index.returns, GarchKind::GARCH);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalTrend);

    EnsembleConfig cfg;
    cfg.horizon = 5;
    cfg.learners = {LearnerKind::Ridge};
    auto f = EnsembleForecaster(cfg).forecast(index, garch, kalman);

    ASSERT_EQ(f.components.size(), 3u);
    ASSERT_EQ(f.forecast.size(), 5u);
    double total = 0.0;
    for (const auto& c : f.components) {
        EXPECT_GE(c.weight, 0.0);
        total += c.weight;
    }
    EXPECT_NEAR(total, 1.0, 1e-12);
    EXPECT_EQ(f.train_samples + f.holdout_samples, static_cast<int>(index.returns.size()) - 1);
    EXPECT_NE(f.best_component, "None");
}

TEST_F(OrchestratorTest, Ensemble_TooFewReturnsThrows) {
    auto index = make_series("IDX", {100.0, 101.0, 102.0});
    GarchFit g;
    KalmanFit k;
    EXPECT_THROW(EnsembleForecaster().forecast(index, g, k), UnderdeterminedModelError);
}

TEST_F(OrchestratorTest, Ensemble_FeatureImportancePrefersGradientBoosting) {
    auto index = garch_index(500, 6);
    auto garch = GarchEstimator().fit(index.returns, GarchKind::GARCH);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalTrend);

    EnsembleConfig cfg;
    cfg.horizon = 5;
    cfg.gbt_rounds = 50;
    cfg.learners = {LearnerKind::Ridge, LearnerKind::GradientBoosting};
    auto f = EnsembleForecaster(cfg).forecast(index, garch, kalman);

    auto gbt = std::find_if(f.components.begin(), f.components.end(),
                            [](const ComponentForecast& c) { return c.name == "XGBoost"; });
    ASSERT_NE(gbt, f.components.end());
    ASSERT_FALSE(gbt->degraded) << gbt->reason;
    EXPECT_EQ(f.feature_importance_source, "XGBoost");
    ASSERT_EQ(f.feature_importance.size(), static_cast<size_t>(ENSEMBLE_FEATURE_DIM));
    double total = 0.0;
    for (const auto& [name, score] : f.feature_importance) {
        EXPECT_GE(score, 0.0) << name;
        total += score;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
}

TEST_F(OrchestratorTest, Ensemble_FeatureImportanceFallsBackToRidge) {
    auto index = garch_index(400, 3);
    auto garch = GarchEstimator().fit(index.returns, GarchKind::GARCH);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalTrend);

    EnsembleConfig cfg;
    cfg.horizon = 5;
    cfg.learners = {LearnerKind::Ridge};
    auto f = EnsembleForecaster(cfg).forecast(index, garch, kalman);
    EXPECT_EQ(f.feature_importance_source, "Ridge");
    EXPECT_EQ(f.feature_importance.size(), static_cast<size_t>(ENSEMBLE_FEATURE_DIM));
}

// ===========================================================================
// Diagnostics / uncertainty
// ===========================================================================
TEST_F(OrchestratorTest, Diagnostics_QualityInUnitInterval) {
    auto index = garch_index(500, 8);
    auto garch = GarchEstimator().fit(index.returns, GarchKind::GARCH);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalTrend);
    auto vecm = VecmAnalyzer().fallback({"IDX"}, 1, "no related series");
    auto d = run_diagnostics(index.returns, garch, kalman, vecm);
    EXPECT_GE(d.quality_score, 0.0);
    EXPECT_LE(d.quality_score, 1.0);
    EXPECT_GT(d.cross_validation.folds, 0);

    auto u = assess_model_uncertainty(nullptr, d);
    EXPECT_DOUBLE_EQ(u.confidence_level, 1.0 - u.overall_uncertainty);
    EXPECT_DOUBLE_EQ(u.ensemble_uncertainty, 0.0);
}

TEST_F(OrchestratorTest, ConfidenceIntervals_Bracketing) {
    RiskMetrics risk;
    risk.var_95 = -0.02;
    risk.sharpe_ratio = 0.8;
    auto ci = compute_confidence_intervals({0.01, 0.02, 0.03}, risk);
    EXPECT_DOUBLE_EQ(ci.forecast.point, 0.03);
    EXPECT_LT(ci.forecast.lower_95, ci.forecast.point);
    EXPECT_GT(ci.forecast.upper_95, ci.forecast.point);
    EXPECT_NEAR(ci.var_95.upper_95 - ci.var_95.lower_95, 2.0 * 1.96 * 0.002, 1e-12);
    EXPECT_NEAR(ci.sharpe_ratio.lower_95, 0.8 - 0.196, 1e-12);
}

TEST_F(OrchestratorTest, ConfidenceIntervals_NoForecastLeavesForecastUnset) {
    RiskMetrics risk;
    risk.var_95 = -0.02;
    risk.sharpe_ratio = 0.8;
    auto ci = compute_confidence_intervals({}, risk);
    EXPECT_FALSE(ci.has_forecast);
    EXPECT_DOUBLE_EQ(ci.forecast.point, 0.0);
    EXPECT_DOUBLE_EQ(ci.var_95.point, -0.02);

    auto with = compute_confidence_intervals({0.01}, risk);
    EXPECT_TRUE(with.has_forecast);
}

// ===========================================================================
// Anomalies
// ===========================================================================
TEST_F(OrchestratorTest, Anomalies_TooFewReturnsThrows) {
    EXPECT_THROW(detect_anomalies(iid_normal(40, 0.01, 2)), UnderdeterminedModelError);
}

TEST_F(OrchestratorTest, Anomalies_SpikeFlagged) {
    auto r = iid_normal(200, 0.01, 6);
    r[100] = 0.2;
    std::vector<int64_t> ts(r.size());
    std::iota(ts.begin(), ts.end(), int64_t{1000});
    auto a = detect_anomalies(r, ts);
    EXPECT_TRUE(a.statistical[100]);
    EXPECT_TRUE(a.combined[100]);
    ASSERT_EQ(a.timestamps.size(), a.indices.size());
    auto it = std::find(a.indices.begin(), a.indices.end(), size_t{100});
    ASSERT_NE(it, a.indices.end());
    EXPECT_EQ(a.timestamps[static_cast<size_t>(it - a.indices.begin())], 1100);
    EXPECT_EQ(a.count, static_cast<int>(a.indices.size()));
}

// ===========================================================================
// Report assembly and narrative
// ===========================================================================
TEST_F(OrchestratorTest, Builder_MissingSectionsAreDegraded) {
    auto report = CompositeReportBuilder().series(make_series("IDX", random_walk(50, 3))).build();
    EXPECT_EQ(report.symbol, "IDX");
    EXPECT_EQ(report.num_observations, 50u);
    EXPECT_TRUE(report.risk.is_degraded());
    EXPECT_EQ(report.risk.reason, "section not computed");
    EXPECT_TRUE(report.best_garch().degraded);
    EXPECT_EQ(report.best_garch().conditional_volatility.size(), 49u);
    EXPECT_EQ(report.garch.candidates.size(), 3u);
    auto degraded = report.degraded_sections();
    EXPECT_TRUE(contains(degraded, "garch"));
    EXPECT_TRUE(contains(degraded, "narrative"));
    EXPECT_TRUE(contains(degraded, "patterns"));
    EXPECT_EQ(degraded.size(), 14u);
}

TEST_F(OrchestratorTest, Builder_SetModelSectionsPassThrough) {
    auto index = garch_index(300, 5);
    auto sel = GarchEstimator().fit_best(index.returns);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalLevel);
    auto vecm = VecmAnalyzer().fallback({"IDX"}, 2, "no related series supplied");

    auto report = CompositeReportBuilder()
                      .series(index)
                      .garch(sel)
                      .kalman(kalman)
                      .cointegration(vecm)
                      .build();
    EXPECT_EQ(report.best_garch().kind, sel.best.kind);
    EXPECT_EQ(report.best_garch().degraded, sel.best.degraded);
    EXPECT_EQ(report.best_garch().conditional_volatility, sel.best.conditional_volatility);
    EXPECT_EQ(report.kalman.kind, KalmanKind::LocalLevel);
    EXPECT_FALSE(report.kalman.degraded);
    EXPECT_EQ(report.cointegration.degraded_reason, "no related series supplied");
    EXPECT_EQ(contains(report.degraded_sections(), "garch"), sel.best.degraded);
    EXPECT_FALSE(contains(report.degraded_sections(), "kalman"));
}

TEST_F(OrchestratorTest, Narrative_PatternAndFeatureInsights) {
    PatternAnalysis pa;
    pa.patterns.momentum_strength = 0.7;
    pa.patterns.volatility_clustering = 0.8;
    pa.patterns.mean_reversion_tendency = 0.65;
    pa.patterns.trend_persistence = 0.7;
    pa.correlation.has_reference = true;
    pa.correlation.correlation_risk = 0.75;

    EnsembleForecast f;
    f.feature_importance = {{"return_lag_1", 0.7}, {"volume", 0.3}};

    auto report = CompositeReportBuilder()
                      .series(make_series("IDX", random_walk(50, 3)))
                      .patterns(StageResult<PatternAnalysis>::ok(pa))
                      .ensemble(StageResult<EnsembleForecast>::ok(f))
                      .build();
    auto n = build_narrative(report);
    EXPECT_TRUE(contains(n.insights, "Most predictive feature: return_lag_1 (importance: 0.700)"));
    EXPECT_TRUE(contains(n.insights, "Strong momentum patterns detected (strength: 0.70)"));
    EXPECT_TRUE(contains(n.insights, "Significant volatility clustering suggests GARCH effects"));
    EXPECT_TRUE(contains(n.recommendations, "Strong mean reversion suggests contrarian strategies"));
    EXPECT_TRUE(contains(n.recommendations, "Trend persistence supports momentum strategies"));
    EXPECT_TRUE(contains(n.recommendations, "High correlation risk indicates need for alternative assets"));

    auto degraded = CompositeReportBuilder()
                        .series(make_series("IDX", random_walk(50, 3)))
                        .patterns(StageResult<PatternAnalysis>::degraded(pa, "failed"))
                        .build();
    auto m = build_narrative(degraded);
    EXPECT_FALSE(contains(m.recommendations, "Trend persistence supports momentum strategies"));
}

TEST_F(OrchestratorTest, Narrative_ReadsOnlyOkSections) {
    RegimeAnalysis regimes;
    regimes.current_regime = "crisis";
    regimes.volatility.persistence = 0.9;
    RiskMetrics risk;
    risk.var_95 = -0.05;
    risk.sharpe_ratio = 2.0;

    auto series = make_series("IDX", random_walk(50, 3));
    auto with_risk = CompositeReportBuilder()
                         .series(series)
                         .regime(StageResult<RegimeAnalysis>::ok(regimes))
                         .risk(StageResult<RiskMetrics>::ok(risk))
                         .build();
    auto n = build_narrative(with_risk);
    EXPECT_TRUE(contains(n.insights, "GARCH model selected as best volatility model"));
    EXPECT_TRUE(contains(n.insights, "High regime persistence - volatility states tend to cluster"));
    EXPECT_TRUE(contains(n.recommendations, "Current high volatility regime suggests defensive positioning"));
    EXPECT_TRUE(contains(n.recommendations, "High VaR indicates significant downside risk - implement hedging"));
    EXPECT_TRUE(contains(n.recommendations,
                         "Strong risk-adjusted performance - consider maintaining current allocation"));

    auto degraded_risk = CompositeReportBuilder()
                             .series(series)
                             .risk(StageResult<RiskMetrics>::degraded(risk, "failed"))
                             .build();
    auto m = build_narrative(degraded_risk);
    EXPECT_FALSE(contains(m.recommendations, "High VaR indicates significant downside risk - implement hedging"));
}

TEST_F(OrchestratorTest, CompareModels_OneRowPerGarchCandidate) {
    auto index = garch_index(500, 5);
    auto sel = GarchEstimator().fit_best(index.returns);
    auto kalman = KalmanEstimator().fit(index.prices, KalmanKind::LocalTrend);
    auto c = compare_models(sel, kalman, VecmAnalyzer().fallback({"IDX"}, 1, "none"));
    ASSERT_EQ(c.garch.size(), 3u);
    EXPECT_EQ(c.best_garch, sel.best.kind);
    EXPECT_DOUBLE_EQ(c.kalman_log_likelihood, kalman.log_likelihood);
}
