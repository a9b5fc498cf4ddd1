#pragma once

#include "ensemble/return_learner.hpp"

#include <torch/torch.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ReturnMLPImpl — 2-hidden-layer regression MLP
//
//   Linear input_dim → hidden, ReLU
//   Linear hidden → hidden / 2, ReLU
//   Linear hidden / 2 → 1
// ---------------------------------------------------------------------------
struct ReturnMLPImpl : torch::nn::Module {
    ReturnMLPImpl(int input_dim = ENSEMBLE_FEATURE_DIM, int hidden = 32)
        : fc1(register_module("fc1", torch::nn::Linear(input_dim, hidden))),
          fc2(register_module("fc2", torch::nn::Linear(hidden, hidden / 2))),
          fc3(register_module("fc3", torch::nn::Linear(hidden / 2, 1)))
    {}

    torch::Tensor forward(torch::Tensor x) {
        x = torch::relu(fc1(x));
        x = torch::relu(fc2(x));
        return fc3(x).squeeze(1);
    }

    torch::nn::Linear fc1{nullptr}, fc2{nullptr}, fc3{nullptr};
};

TORCH_MODULE(ReturnMLP);

// ---------------------------------------------------------------------------
// RegressionTrainResult — output of train_regressor()
// ---------------------------------------------------------------------------
struct RegressionTrainResult {
    float initial_loss = 0.0f;
    float final_loss = 0.0f;
    int epochs = 0;
};

// ---------------------------------------------------------------------------
// train_regressor — full-batch Adam on MSE loss
//
// clip_gradients: if true, applies clip_grad_norm_(max_norm=1.0) before step.
// ---------------------------------------------------------------------------
template <typename ModelType>
RegressionTrainResult train_regressor(
    ModelType& model,
    const torch::Tensor& input_tensor,
    const torch::Tensor& target_tensor,
    int max_epochs,
    double lr,
    bool clip_gradients)
{
    torch::optim::Adam optimizer(model->parameters(), torch::optim::AdamOptions(lr));

    RegressionTrainResult result;
    for (int epoch = 0; epoch < max_epochs; ++epoch) {
        optimizer.zero_grad();

        auto output = model->forward(input_tensor);
        auto loss = torch::mse_loss(output, target_tensor);

        loss.backward();
        if (clip_gradients) {
            torch::nn::utils::clip_grad_norm_(model->parameters(), 1.0);
        }
        optimizer.step();

        float loss_val = loss.template item<float>();
        if (epoch == 0) result.initial_loss = loss_val;
        result.final_loss = loss_val;
        result.epochs = epoch + 1;
    }
    return result;
}

// ---------------------------------------------------------------------------
// MlpLearner — libtorch MLP on z-scored features and a z-scored target
//
// Deterministic: sets torch::manual_seed(seed) before building the network.
// ---------------------------------------------------------------------------
class MlpLearner : public ReturnLearner {
public:
    explicit MlpLearner(int epochs = 200, int hidden = 32, double lr = 1e-3, uint64_t seed = 42)
        : epochs_(epochs), hidden_(hidden), lr_(lr), seed_(seed) {}

    std::string name() const override { return "MLP"; }

    void fit(const FeatureMatrix& X, const std::vector<double>& y) override {
        check_training_data(X, y);
        if (hidden_ < 2) {
            throw std::invalid_argument("MlpLearner: hidden width must be >= 2");
        }
        torch::manual_seed(seed_);

        scaler_.fit(X);
        y_mean_ = stats::mean(y);
        double s = stats::stddev(y);
        y_scale_ = s > 1e-12 ? s : 1.0;

        std::vector<double> yz(y.size());
        for (size_t i = 0; i < y.size(); ++i) yz[i] = (y[i] - y_mean_) / y_scale_;

        auto input = to_tensor(scaler_.transform(X));
        auto target = torch::tensor(std::vector<float>(yz.begin(), yz.end()));

        model_ = ReturnMLP(static_cast<int>(X.front().size()), hidden_);
        model_->train();
        last_train_ = train_regressor(model_, input, target, epochs_, lr_, /*clip_gradients=*/true);
        model_->eval();
        fitted_ = true;
    }

    std::vector<double> predict(const FeatureMatrix& X) const override {
        if (!fitted_) {
            throw std::runtime_error("Model not trained - call fit() first");
        }
        if (X.empty()) return {};
        torch::NoGradGuard no_grad;
        auto out = model_->forward(to_tensor(scaler_.transform(X))).contiguous();
        auto acc = out.accessor<float, 1>();
        std::vector<double> predictions(X.size());
        for (size_t i = 0; i < X.size(); ++i) {
            predictions[i] = y_mean_ + y_scale_ * static_cast<double>(acc[static_cast<int64_t>(i)]);
        }
        return predictions;
    }

    const RegressionTrainResult& last_training() const { return last_train_; }

private:
    int epochs_;
    int hidden_;
    double lr_;
    uint64_t seed_;
    FeatureScaler scaler_;
    double y_mean_ = 0.0;
    double y_scale_ = 1.0;
    mutable ReturnMLP model_{nullptr};  // forward() is non-const
    RegressionTrainResult last_train_;
    bool fitted_ = false;

    static torch::Tensor to_tensor(const FeatureMatrix& X) {
        int64_t n = static_cast<int64_t>(X.size());
        int64_t d = static_cast<int64_t>(X.front().size());
        auto t = torch::zeros({n, d});
        auto acc = t.accessor<float, 2>();
        for (int64_t i = 0; i < n; ++i)
            for (int64_t j = 0; j < d; ++j)
                acc[i][j] = static_cast<float>(X[static_cast<size_t>(i)][static_cast<size_t>(j)]);
        return t;
    }
};
