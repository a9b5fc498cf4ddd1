#pragma once

#include "ensemble/gbt_learner.hpp"
#include "ensemble/mlp_learner.hpp"
#include "ensemble/return_learner.hpp"
#include "ensemble/ridge_learner.hpp"

#include <memory>
#include <vector>

class LearnerFactory {
public:
    static std::unique_ptr<ReturnLearner> create(LearnerKind kind, const EnsembleConfig& config) {
        switch (kind) {
            case LearnerKind::Ridge:
                return std::make_unique<RidgeLearner>(config.ridge_lambda);
            case LearnerKind::GradientBoosting:
                return std::make_unique<GbtLearner>(config.gbt_rounds, config.gbt_max_depth, config.seed);
            case LearnerKind::NeuralNet:
                return std::make_unique<MlpLearner>(config.mlp_epochs, config.mlp_hidden,
                                                    config.mlp_learning_rate, config.seed);
        }
        return nullptr;
    }

    static std::vector<std::unique_ptr<ReturnLearner>> create_all(const EnsembleConfig& config) {
        std::vector<std::unique_ptr<ReturnLearner>> learners;
        for (LearnerKind kind : config.learners) learners.push_back(create(kind, config));
        return learners;
    }
};
