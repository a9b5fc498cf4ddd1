// kalman_estimator_test.cpp — local level / local trend / regime-switching filters
//
// Tests slope recovery on ramps, convergence on constant series, the RTS
// smoother variance bound, regime labelling and the moving-average fallback.

#include <gtest/gtest.h>
#include "estimators/kalman_estimator.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

void expect_smoothed_not_above_filtered(const KalmanFit& fit) {
    ASSERT_EQ(fit.smoothed_covariances.size(), fit.state_covariances.size());
    for (size_t t = 0; t < fit.state_covariances.size(); ++t) {
        const auto& P = fit.state_covariances[t];
        const auto& Ps = fit.smoothed_covariances[t];
        for (Eigen::Index i = 0; i < P.rows(); ++i) {
            double tol = 1e-9 * std::max(1.0, std::abs(P(i, i)));
            EXPECT_LE(Ps(i, i), P(i, i) + tol) << "t=" << t << " i=" << i;
        }
    }
}

}  // anonymous namespace

class KalmanEstimatorTest : public ::testing::Test {
protected:
    KalmanEstimator estimator_;
};

TEST_F(KalmanEstimatorTest, LocalTrend_RampSlopeConvergesToIncrement) {
    auto prices = ramp(200, 100.0, 0.5);
    auto fit = estimator_.fit(prices, KalmanKind::LocalTrend);
    ASSERT_FALSE(fit.degraded) << fit.degraded_reason;
    ASSERT_EQ(fit.state_dim, 2);
    auto slope = slope_path(fit);
    EXPECT_NEAR(slope.back(), 0.5, 1e-3);
    EXPECT_NEAR(level_path(fit).back(), prices.back(), 1e-3);
}

TEST_F(KalmanEstimatorTest, LocalTrend_NoisyRampSlopeNearIncrement) {
    auto noise = iid_normal(500, 0.2, 31);
    auto prices = ramp(500, 100.0, 0.5);
    for (size_t t = 0; t < prices.size(); ++t) prices[t] += noise[t];
    auto fit = estimator_.fit(prices, KalmanKind::LocalTrend);
    ASSERT_FALSE(fit.degraded);
    auto slope = slope_path(fit);
    double avg = 0.0;
    for (size_t t = 400; t < 500; ++t) avg += slope[t];
    EXPECT_NEAR(avg / 100.0, 0.5, 0.1);
}

TEST_F(KalmanEstimatorTest, LocalLevel_ConstantSeriesConverges) {
    std::vector<double> prices(100, 42.0);
    auto fit = estimator_.fit(prices, KalmanKind::LocalLevel);
    ASSERT_FALSE(fit.degraded) << fit.degraded_reason;
    for (double l : level_path(fit)) EXPECT_NEAR(l, 42.0, 1e-9);
    EXPECT_TRUE(std::isfinite(fit.log_likelihood));
}

TEST_F(KalmanEstimatorTest, LocalTrend_ConstantSeriesHasZeroSlope) {
    std::vector<double> prices(100, 42.0);
    auto fit = estimator_.fit(prices, KalmanKind::LocalTrend);
    ASSERT_FALSE(fit.degraded);
    EXPECT_NEAR(slope_path(fit).back(), 0.0, 1e-9);
    EXPECT_NEAR(level_path(fit).back(), 42.0, 1e-9);
}

TEST_F(KalmanEstimatorTest, Smoother_VarianceNotAboveFiltered) {
    auto prices = random_walk(300, 5);
    expect_smoothed_not_above_filtered(estimator_.fit(prices, KalmanKind::LocalLevel));
    expect_smoothed_not_above_filtered(estimator_.fit(prices, KalmanKind::LocalTrend));
}

TEST_F(KalmanEstimatorTest, OutputLengthsMatchInput) {
    auto prices = random_walk(150, 6);
    auto fit = estimator_.fit(prices, KalmanKind::LocalTrend);
    EXPECT_EQ(fit.filtered_states.size(), prices.size());
    EXPECT_EQ(fit.smoothed_states.size(), prices.size());
    EXPECT_EQ(fit.innovations.size(), prices.size());
    for (double s : fit.innovation_variances) EXPECT_GT(s, 0.0);
}

TEST_F(KalmanEstimatorTest, RegimeSwitching_LabelsAndProbabilities) {
    auto r = simulate_garch(400, 1e-5, 0.1, 0.85, 12);
    auto prices = prices_from_returns(r, 500.0);
    auto fit = estimator_.fit(prices, KalmanKind::RegimeSwitching);
    ASSERT_FALSE(fit.degraded) << fit.degraded_reason;
    ASSERT_EQ(fit.regime_labels.size(), prices.size());
    ASSERT_EQ(fit.state_probabilities.size(), prices.size());
    int high = 0;
    for (size_t t = 0; t < prices.size(); ++t) {
        high += fit.regime_labels[t];
        EXPECT_DOUBLE_EQ(fit.state_probabilities[t][0] + fit.state_probabilities[t][1], 1.0);
    }
    EXPECT_GT(high, 0);
    EXPECT_LT(high, static_cast<int>(prices.size()));
    EXPECT_TRUE(fit.params.count("high_vol_level_noise"));
}

TEST_F(KalmanEstimatorTest, RegimeSwitching_ShortSeriesUsesSingleRegime) {
    auto prices = random_walk(15, 4);
    auto fit = estimator_.fit(prices, KalmanKind::RegimeSwitching);
    ASSERT_FALSE(fit.degraded);
    for (int l : fit.regime_labels) EXPECT_EQ(l, 0);
}

TEST_F(KalmanEstimatorTest, TooFewPrices_DegradedMovingAverage) {
    auto fit = estimator_.fit({100.0, 101.0}, KalmanKind::LocalTrend);
    EXPECT_TRUE(fit.degraded);
    ASSERT_EQ(fit.filtered_states.size(), 2u);
    EXPECT_DOUBLE_EQ(fit.filtered_states[1][0], 100.5);
}

TEST_F(KalmanEstimatorTest, ZeroNoise_SingularInnovationDegradesToMovingAverage) {
    KalmanConfig cfg;
    cfg.observation_noise_share = 0.0;
    cfg.level_noise_share = 0.0;
    auto prices = random_walk(100, 13);
    auto fit = KalmanEstimator(cfg).fit(prices, KalmanKind::LocalLevel);
    EXPECT_TRUE(fit.degraded);
    EXPECT_NE(fit.degraded_reason.find("singular innovation variance"), std::string::npos)
        << fit.degraded_reason;

    auto ma = kalman::moving_average(prices, cfg.fallback_window);
    ASSERT_EQ(fit.filtered_states.size(), prices.size());
    ASSERT_EQ(fit.state_covariances.size(), prices.size());
    for (size_t t = 0; t < prices.size(); ++t) {
        EXPECT_DOUBLE_EQ(fit.filtered_states[t][0], ma[t]);
        EXPECT_TRUE(fit.state_covariances[t].isIdentity());
        EXPECT_TRUE(fit.smoothed_covariances[t].isIdentity());
        EXPECT_DOUBLE_EQ(fit.innovation_variances[t], 1.0);
    }
}

TEST_F(KalmanEstimatorTest, ParseKind) {
    EXPECT_EQ(parse_kalman_kind("local_trend"), KalmanKind::LocalTrend);
    EXPECT_THROW(parse_kalman_kind("ukf"), std::invalid_argument);
}
