#pragma once

#include "ensemble/features.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LearnerKind — regression learners available to the ensemble forecast
// ---------------------------------------------------------------------------
enum class LearnerKind { Ridge, GradientBoosting, NeuralNet };

inline std::string to_string(LearnerKind kind) {
    switch (kind) {
        case LearnerKind::Ridge: return "Ridge";
        case LearnerKind::GradientBoosting: return "XGBoost";
        case LearnerKind::NeuralNet: return "MLP";
    }
    return "Unknown";
}

inline LearnerKind parse_learner_kind(const std::string& s) {
    if (s == "ridge" || s == "Ridge") return LearnerKind::Ridge;
    if (s == "gbt" || s == "xgboost" || s == "XGBoost") return LearnerKind::GradientBoosting;
    if (s == "mlp" || s == "MLP") return LearnerKind::NeuralNet;
    throw std::invalid_argument("Unknown learner: " + s + " (expected ridge, gbt or mlp)");
}

// ---------------------------------------------------------------------------
// EnsembleConfig
// ---------------------------------------------------------------------------
struct EnsembleConfig {
    int horizon = 30;
    double holdout_fraction = 0.2;
    int min_samples = 60;
    std::vector<LearnerKind> learners = {
        LearnerKind::Ridge, LearnerKind::GradientBoosting, LearnerKind::NeuralNet};
    double ridge_lambda = 1.0;
    int gbt_rounds = 100;
    int gbt_max_depth = 3;
    int mlp_epochs = 200;
    int mlp_hidden = 32;
    double mlp_learning_rate = 1e-3;
    uint64_t seed = 42;
};

// ---------------------------------------------------------------------------
// ReturnLearner — abstract next-period return regressor
// ---------------------------------------------------------------------------
class ReturnLearner {
public:
    virtual ~ReturnLearner() = default;
    virtual std::string name() const = 0;
    virtual void fit(const FeatureMatrix& X, const std::vector<double>& y) = 0;
    virtual std::vector<double> predict(const FeatureMatrix& X) const = 0;

    // Per-feature importance summing to 1; empty when the learner has none.
    virtual std::vector<double> feature_importance() const { return {}; }
};

// Shared argument check for fit() implementations.
inline void check_training_data(const FeatureMatrix& X, const std::vector<double>& y) {
    if (X.empty() || y.empty()) {
        throw std::invalid_argument("Training data must not be empty");
    }
    if (X.size() != y.size()) {
        throw std::invalid_argument("X.size() != y.size()");
    }
}
