// index_analyzer_test.cpp — end-to-end IndexAnalyzer runs
//
// Tests a full analysis of a GARCH-driven index with and without a related
// cointegrated series, the pattern section's correlation reference, up-front
// DataShapeError rejection, and that short inputs or failed model fits
// degrade sections instead of throwing.

#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "orchestrator/index_analyzer.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

AnalyzerConfig light_config() {
    AnalyzerConfig cfg;
    cfg.ensemble.learners = {LearnerKind::Ridge};
    cfg.ensemble.horizon = 10;
    cfg.rolling_window = 250;
    return cfg;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

}  // anonymous namespace

class IndexAnalyzerTest : public ::testing::Test {
protected:
    IndexAnalyzer analyzer_{light_config()};
};

// ===========================================================================
// Full runs
// ===========================================================================
TEST_F(IndexAnalyzerTest, SingleIndex_AllCoreSectionsOk) {
    auto index = garch_index(600, 21);
    auto report = analyzer_.analyze(index);

    EXPECT_EQ(report.symbol, "IDX");
    EXPECT_EQ(report.num_observations, 600u);
    EXPECT_EQ(report.returns.size(), 599u);
    EXPECT_FALSE(report.best_garch().degraded) << report.best_garch().degraded_reason;
    EXPECT_FALSE(report.kalman.degraded) << report.kalman.degraded_reason;

    EXPECT_TRUE(report.regime.is_ok()) << report.regime.reason;
    EXPECT_TRUE(report.risk.is_ok()) << report.risk.reason;
    EXPECT_TRUE(report.signals.is_ok()) << report.signals.reason;
    EXPECT_TRUE(report.ensemble.is_ok()) << report.ensemble.reason;
    EXPECT_TRUE(report.diagnostics.is_ok()) << report.diagnostics.reason;
    EXPECT_TRUE(report.confidence_intervals.is_ok()) << report.confidence_intervals.reason;
    EXPECT_TRUE(report.model_uncertainty.is_ok()) << report.model_uncertainty.reason;
    EXPECT_TRUE(report.anomalies.is_ok()) << report.anomalies.reason;
    EXPECT_TRUE(report.rolling_garch.is_ok()) << report.rolling_garch.reason;
    EXPECT_TRUE(report.patterns.is_ok()) << report.patterns.reason;
    EXPECT_TRUE(report.confidence_intervals.value.has_forecast);
    EXPECT_TRUE(report.narrative.is_ok()) << report.narrative.reason;

    // No related series: cointegration is a degraded fallback, not an error.
    EXPECT_TRUE(report.cointegration.degraded);
    EXPECT_TRUE(contains(report.degraded_sections(), "cointegration"));

    EXPECT_EQ(report.ensemble.value.forecast.size(), 10u);
    EXPECT_EQ(report.signals.value.combined.size(), report.returns.size());
    EXPECT_EQ(report.comparison.garch.size(), 3u);
    EXPECT_FALSE(report.narrative.value.insights.empty());
}

TEST_F(IndexAnalyzerTest, PatternsSection_UsesFirstRelatedSeriesAsReference) {
    auto index = garch_index(400, 22);
    auto alone = analyzer_.analyze(index);
    ASSERT_TRUE(alone.patterns.is_ok()) << alone.patterns.reason;
    EXPECT_FALSE(alone.patterns.value.correlation.has_reference);
    EXPECT_GT(alone.patterns.value.microstructure.spread_proxy, 0.0);

    auto related = make_series("REL", random_walk(400, 23, 1.0, 1000.0));
    auto paired = analyzer_.analyze(index, {related});
    ASSERT_TRUE(paired.patterns.is_ok()) << paired.patterns.reason;
    EXPECT_TRUE(paired.patterns.value.correlation.has_reference);
    EXPECT_EQ(paired.patterns.value.correlation.reference, "REL");
    EXPECT_EQ(paired.patterns.value.correlation.windows, 399 - 30);
}

TEST_F(IndexAnalyzerTest, RelatedCointegratedSeries_FitsVecm) {
    auto [x, y] = cointegrated_pair(500, 11);
    auto report = analyzer_.analyze(make_series("X", x), {make_series("Y", y)});
    ASSERT_FALSE(report.cointegration.degraded) << report.cointegration.degraded_reason;
    EXPECT_EQ(report.cointegration.johansen.n_cointegrating, 1);
    EXPECT_EQ(report.cointegration.names, (std::vector<std::string>{"X", "Y"}));
    EXPECT_TRUE(report.diagnostics.is_ok());
    EXPECT_EQ(report.diagnostics.value.vecm.n_cointegrating, 1);
    EXPECT_TRUE(contains(report.narrative.value.recommendations,
                         "Cointegration detected - consider pairs trading strategies"));
}

// ===========================================================================
// Shape errors propagate
// ===========================================================================
TEST_F(IndexAnalyzerTest, UnequalRelatedLength_ThrowsDataShapeError) {
    auto index = garch_index(300, 1);
    auto related = make_series("REL", random_walk(299, 2));
    EXPECT_THROW(analyzer_.analyze(index, {related}), DataShapeError);
}

TEST_F(IndexAnalyzerTest, RelatedSeriesSharingIndexSymbol_ThrowsDataShapeError) {
    auto index = garch_index(300, 1);
    auto related = make_series("IDX", random_walk(300, 2));
    EXPECT_THROW(analyzer_.analyze(index, {related}), DataShapeError);
}

TEST_F(IndexAnalyzerTest, NonFinitePrice_ThrowsDataShapeError) {
    auto prices = random_walk(100, 2);
    prices[40] = std::nan("");
    EXPECT_THROW(analyzer_.analyze(make_series("BAD", prices)), DataShapeError);
}

TEST_F(IndexAnalyzerTest, TooFewPrices_ThrowsDataShapeError) {
    EXPECT_THROW(analyzer_.analyze(make_series("TINY", {100.0, 101.0})), DataShapeError);
}

// ===========================================================================
// Degradation instead of failure
// ===========================================================================
TEST_F(IndexAnalyzerTest, ShortSeries_DegradesWithoutThrowing) {
    auto index = garch_index(25, 9);
    CompositeReport report;
    ASSERT_NO_THROW(report = analyzer_.analyze(index));

    EXPECT_TRUE(report.best_garch().degraded);
    EXPECT_TRUE(report.anomalies.is_degraded());
    EXPECT_TRUE(report.rolling_garch.is_degraded());
    EXPECT_FALSE(report.anomalies.reason.empty());
    EXPECT_EQ(report.best_garch().conditional_volatility.size(), report.returns.size());

    // Derived sections that only need a fallback fit still run.
    EXPECT_TRUE(report.risk.is_ok());
    EXPECT_TRUE(report.narrative.is_ok());
}

TEST_F(IndexAnalyzerTest, DegradedEnsemble_ConfidenceIntervalsOmitForecast) {
    // Every ensemble component degrades: GARCH stops at its iteration cap,
    // the noiseless trend filter hits a singular innovation variance, and no
    // learners are configured.
    auto cfg = light_config();
    cfg.garch.max_iterations = 1;
    cfg.kalman.observation_noise_share = 0.0;
    cfg.kalman.trend_level_share = 0.0;
    cfg.kalman.trend_slope_share = 0.0;
    cfg.ensemble.learners = {};
    auto report = IndexAnalyzer(cfg).analyze(garch_index(300, 4));

    ASSERT_TRUE(report.best_garch().degraded);
    ASSERT_TRUE(report.kalman.degraded);
    ASSERT_TRUE(report.ensemble.is_degraded());
    ASSERT_TRUE(report.confidence_intervals.is_ok()) << report.confidence_intervals.reason;
    EXPECT_FALSE(report.confidence_intervals.value.has_forecast);
    EXPECT_DOUBLE_EQ(report.confidence_intervals.value.forecast.point, 0.0);
    EXPECT_DOUBLE_EQ(report.confidence_intervals.value.var_95.point, report.risk.value.var_95);
}

TEST_F(IndexAnalyzerTest, DisabledStagesReportedAsNotComputed) {
    auto cfg = light_config();
    cfg.enable_rolling = false;
    cfg.enable_anomalies = false;
    auto report = IndexAnalyzer(cfg).analyze(garch_index(300, 4));
    EXPECT_TRUE(report.rolling_garch.is_degraded());
    EXPECT_EQ(report.rolling_garch.reason, "section not computed");
    EXPECT_TRUE(report.anomalies.is_degraded());
}
