// ensemble_learners_test.cpp — feature layout and the three return learners
//
// Tests build_ensemble_features alignment, the feature scaler, and that
// Ridge / XGBoost / MLP learners fit a learnable linear target, reject bad
// input and refuse to predict before fit(). Also covers the per-feature
// importance each learner reports.

#include <gtest/gtest.h>
#include "ensemble/features.hpp"
#include "ensemble/learner_factory.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

// y = 2 x0 - x1 + small noise
struct LinearData {
    FeatureMatrix X;
    std::vector<double> y;
};

LinearData make_linear_data(size_t n, size_t dim = 6) {
    auto noise = iid_normal(n, 0.01, 99);
    auto a = iid_normal(n * dim, 1.0, 98);
    LinearData d;
    for (size_t i = 0; i < n; ++i) {
        FeatureRow row(dim);
        for (size_t j = 0; j < dim; ++j) row[j] = a[i * dim + j];
        d.y.push_back(2.0 * row[0] - row[1] + noise[i]);
        d.X.push_back(row);
    }
    return d;
}

EnsembleConfig small_config() {
    EnsembleConfig cfg;
    cfg.gbt_rounds = 50;
    cfg.mlp_epochs = 300;
    cfg.mlp_learning_rate = 1e-2;
    return cfg;
}

}  // anonymous namespace

class EnsembleLearnersTest : public ::testing::Test {};

// ===========================================================================
// Features
// ===========================================================================
TEST_F(EnsembleLearnersTest, Features_ShapeAndNames) {
    auto r = simulate_garch(200, 1e-5, 0.05, 0.9, 3);
    auto p = prices_from_returns(r);
    auto X = build_ensemble_features(r, p, {}, {});
    ASSERT_EQ(X.size(), r.size());
    for (const auto& row : X) {
        ASSERT_EQ(row.size(), static_cast<size_t>(ENSEMBLE_FEATURE_DIM));
        for (double v : row) ASSERT_TRUE(std::isfinite(v));
    }
    EXPECT_EQ(ensemble_feature_names().size(), static_cast<size_t>(ENSEMBLE_FEATURE_DIM));
}

TEST_F(EnsembleLearnersTest, Features_LagsUseOnlyPastReturns) {
    std::vector<double> r = {0.01, 0.02, 0.03, 0.04, 0.05};
    auto X = build_ensemble_features(r, prices_from_returns(r), {}, {});
    EXPECT_DOUBLE_EQ(X[3][0], 0.04);  // lag 1 at row t is returns[t]
    EXPECT_DOUBLE_EQ(X[3][1], 0.03);
    EXPECT_DOUBLE_EQ(X[3][3], 0.01);
    EXPECT_DOUBLE_EQ(X[3][4], 0.0);   // before the start
}

TEST_F(EnsembleLearnersTest, Features_LengthMismatchThrows) {
    std::vector<double> r = {0.01, 0.02, 0.03};
    EXPECT_THROW(build_ensemble_features(r, {1.0, 2.0}, {}, {}), std::invalid_argument);
    EXPECT_THROW(build_ensemble_features(r, prices_from_returns(r), {0.1}, {}), std::invalid_argument);
}

TEST_F(EnsembleLearnersTest, AdvanceFeatures_ShiftsLags) {
    FeatureRow row(ENSEMBLE_FEATURE_DIM, 0.0);
    for (int l = 0; l < NUM_RETURN_LAGS; ++l) row[static_cast<size_t>(l)] = l + 1.0;
    row[NUM_RETURN_LAGS] = 42.0;
    auto next = advance_features(row, 0.5);
    EXPECT_DOUBLE_EQ(next[0], 0.5);
    EXPECT_DOUBLE_EQ(next[1], 1.0);
    EXPECT_DOUBLE_EQ(next[NUM_RETURN_LAGS - 1], NUM_RETURN_LAGS - 1.0);
    EXPECT_DOUBLE_EQ(next[NUM_RETURN_LAGS], 42.0);
}

TEST_F(EnsembleLearnersTest, Scaler_ZeroMeanUnitScale) {
    auto d = make_linear_data(100);
    FeatureScaler s;
    s.fit(d.X);
    auto Z = s.transform(d.X);
    double sum = 0.0;
    for (const auto& row : Z) sum += row[0];
    EXPECT_NEAR(sum / 100.0, 0.0, 1e-12);
    EXPECT_THROW(s.transform({FeatureRow(3, 0.0)}), std::invalid_argument);
}

// ===========================================================================
// Learners
// ===========================================================================
TEST_F(EnsembleLearnersTest, AllLearners_FitLinearTarget) {
    auto train = make_linear_data(300);
    auto cfg = small_config();
    for (auto& learner : LearnerFactory::create_all(cfg)) {
        learner->fit(train.X, train.y);
        auto pred = learner->predict(train.X);
        ASSERT_EQ(pred.size(), train.y.size()) << learner->name();
        EXPECT_GT(stats::r_squared(train.y, pred), 0.8) << learner->name();
    }
}

TEST_F(EnsembleLearnersTest, Ridge_CoefficientsRecoverSigns) {
    auto d = make_linear_data(300);
    RidgeLearner ridge(0.1);
    ridge.fit(d.X, d.y);
    ASSERT_EQ(ridge.coefficients().size(), 6u);
    EXPECT_GT(ridge.coefficients()[0], 1.5);
    EXPECT_LT(ridge.coefficients()[1], -0.5);
    EXPECT_NEAR(ridge.intercept(), stats::mean(d.y), 1e-12);
}

TEST_F(EnsembleLearnersTest, Mlp_TrainingLossDecreases) {
    auto d = make_linear_data(200);
    MlpLearner mlp(100, 16, 1e-2, 7);
    mlp.fit(d.X, d.y);
    EXPECT_LT(mlp.last_training().final_loss, mlp.last_training().initial_loss);
}

TEST_F(EnsembleLearnersTest, Mlp_DeterministicForSeed) {
    auto d = make_linear_data(100);
    MlpLearner a(50, 8, 1e-2, 11);
    MlpLearner b(50, 8, 1e-2, 11);
    a.fit(d.X, d.y);
    b.fit(d.X, d.y);
    auto pa = a.predict(d.X);
    auto pb = b.predict(d.X);
    for (size_t i = 0; i < pa.size(); ++i) EXPECT_DOUBLE_EQ(pa[i], pb[i]);
}

// ===========================================================================
// Feature importance
// ===========================================================================
TEST_F(EnsembleLearnersTest, Gbt_GainImportanceConcentratesOnDrivers) {
    auto d = make_linear_data(300);
    GbtLearner gbt(50, 3, 42);
    EXPECT_THROW(gbt.feature_importance(), std::runtime_error);
    gbt.fit(d.X, d.y);
    auto imp = gbt.feature_importance();
    ASSERT_EQ(imp.size(), 6u);
    double total = 0.0;
    for (double v : imp) {
        EXPECT_GE(v, 0.0);
        total += v;
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_GT(imp[0] + imp[1], 0.8);
    EXPECT_GT(imp[0], imp[1]);
}

TEST_F(EnsembleLearnersTest, Ridge_ImportanceIsNormalisedAbsCoefficients) {
    auto d = make_linear_data(300);
    RidgeLearner ridge(0.1);
    EXPECT_THROW(ridge.feature_importance(), std::runtime_error);
    ridge.fit(d.X, d.y);
    auto imp = ridge.feature_importance();
    ASSERT_EQ(imp.size(), 6u);
    double total = 0.0;
    for (double c : ridge.coefficients()) total += std::abs(c);
    for (size_t j = 0; j < imp.size(); ++j) {
        EXPECT_NEAR(imp[j], std::abs(ridge.coefficients()[j]) / total, 1e-12);
    }
    EXPECT_GT(imp[0], imp[1]);
}

TEST_F(EnsembleLearnersTest, Mlp_ReportsNoImportance) {
    auto d = make_linear_data(100);
    MlpLearner mlp(20, 8, 1e-2, 7);
    mlp.fit(d.X, d.y);
    EXPECT_TRUE(mlp.feature_importance().empty());
}

TEST_F(EnsembleLearnersTest, PredictBeforeFit_Throws) {
    auto cfg = small_config();
    for (auto& learner : LearnerFactory::create_all(cfg)) {
        EXPECT_THROW(learner->predict({FeatureRow(6, 0.0)}), std::runtime_error) << learner->name();
    }
}

TEST_F(EnsembleLearnersTest, MismatchedTrainingData_Throws) {
    auto d = make_linear_data(20);
    d.y.pop_back();
    auto cfg = small_config();
    for (auto& learner : LearnerFactory::create_all(cfg)) {
        EXPECT_THROW(learner->fit(d.X, d.y), std::invalid_argument) << learner->name();
    }
}

TEST_F(EnsembleLearnersTest, Factory_NamesAndParsing) {
    auto cfg = small_config();
    EXPECT_EQ(LearnerFactory::create(LearnerKind::Ridge, cfg)->name(), "Ridge");
    EXPECT_EQ(LearnerFactory::create(LearnerKind::GradientBoosting, cfg)->name(), "XGBoost");
    EXPECT_EQ(LearnerFactory::create(LearnerKind::NeuralNet, cfg)->name(), "MLP");
    EXPECT_EQ(parse_learner_kind("gbt"), LearnerKind::GradientBoosting);
    EXPECT_THROW(parse_learner_kind("svm"), std::invalid_argument);
}
