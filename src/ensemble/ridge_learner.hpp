#pragma once

#include "ensemble/return_learner.hpp"
#include "linalg/least_squares.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RidgeLearner — closed-form L2-penalised least squares on z-scored features
//
// The intercept is the training-target mean and is not penalised.
// ---------------------------------------------------------------------------
class RidgeLearner : public ReturnLearner {
public:
    explicit RidgeLearner(double lambda = 1.0) : lambda_(lambda) {}

    std::string name() const override { return "Ridge"; }

    void fit(const FeatureMatrix& X, const std::vector<double>& y) override {
        check_training_data(X, y);
        scaler_.fit(X);
        auto Z = scaler_.transform(X);

        intercept_ = stats::mean(y);
        std::vector<double> yc(y.size());
        for (size_t i = 0; i < y.size(); ++i) yc[i] = y[i] - intercept_;

        Eigen::MatrixXd A = linalg::from_rows(Z);
        Eigen::MatrixXd AtA = A.transpose() * A;
        AtA.diagonal().array() += lambda_;
        Eigen::LDLT<Eigen::MatrixXd> ldlt(AtA);
        if (ldlt.info() != Eigen::Success) {
            throw NumericalDivergenceError("ridge normal equations not solvable");
        }
        coefficients_ = linalg::to_vector(ldlt.solve(A.transpose() * linalg::to_eigen(yc)));
        fitted_ = true;
    }

    std::vector<double> predict(const FeatureMatrix& X) const override {
        if (!fitted_) {
            throw std::runtime_error("Model not trained - call fit() first");
        }
        auto Z = scaler_.transform(X);
        std::vector<double> out(Z.size(), intercept_);
        for (size_t i = 0; i < Z.size(); ++i)
            for (size_t j = 0; j < coefficients_.size(); ++j) out[i] += Z[i][j] * coefficients_[j];
        return out;
    }

    // |coefficient| on the z-scored features, normalised to sum to 1.
    std::vector<double> feature_importance() const override {
        if (!fitted_) {
            throw std::runtime_error("Model not trained - call fit() first");
        }
        std::vector<double> out(coefficients_.size());
        double total = 0.0;
        for (size_t j = 0; j < out.size(); ++j) {
            out[j] = std::abs(coefficients_[j]);
            total += out[j];
        }
        if (total > 0.0) {
            for (double& v : out) v /= total;
        }
        return out;
    }

    const std::vector<double>& coefficients() const { return coefficients_; }
    double intercept() const { return intercept_; }

private:
    double lambda_;
    FeatureScaler scaler_;
    std::vector<double> coefficients_;
    double intercept_ = 0.0;
    bool fitted_ = false;
};
