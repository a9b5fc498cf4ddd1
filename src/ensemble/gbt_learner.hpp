#pragma once

#include "ensemble/return_learner.hpp"

#include <xgboost/c_api.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GbtLearner — XGBoost C API booster for next-period return regression
// ---------------------------------------------------------------------------
class GbtLearner : public ReturnLearner {
public:
    explicit GbtLearner(int num_rounds = 100, int max_depth = 3, uint64_t seed = 42)
        : booster_(nullptr), num_rounds_(num_rounds), max_depth_(max_depth), seed_(seed) {}

    ~GbtLearner() override {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    // Non-copyable
    GbtLearner(const GbtLearner&) = delete;
    GbtLearner& operator=(const GbtLearner&) = delete;

    GbtLearner(GbtLearner&& other) noexcept
        : booster_(other.booster_), num_rounds_(other.num_rounds_),
          max_depth_(other.max_depth_), seed_(other.seed_), num_features_(other.num_features_) {
        other.booster_ = nullptr;
    }
    GbtLearner& operator=(GbtLearner&& other) noexcept {
        if (this != &other) {
            if (booster_) XGBoosterFree(booster_);
            booster_ = other.booster_;
            num_rounds_ = other.num_rounds_;
            max_depth_ = other.max_depth_;
            seed_ = other.seed_;
            num_features_ = other.num_features_;
            other.booster_ = nullptr;
        }
        return *this;
    }

    std::string name() const override { return "XGBoost"; }

    void fit(const FeatureMatrix& X, const std::vector<double>& y) override {
        check_training_data(X, y);

        int n = static_cast<int>(X.size());
        std::vector<float> flabels(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) flabels[static_cast<size_t>(i)] = static_cast<float>(y[static_cast<size_t>(i)]);

        auto dmat = make_dmatrix(X);
        check(XGDMatrixSetFloatInfo(dmat.handle, "label", flabels.data(), static_cast<bst_ulong>(n)));

        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }

        DMatrixHandle dmats[] = {dmat.handle};
        check(XGBoosterCreate(dmats, 1, &booster_));

        check(XGBoosterSetParam(booster_, "objective", "reg:squarederror"));
        check(XGBoosterSetParam(booster_, "max_depth", std::to_string(max_depth_).c_str()));
        check(XGBoosterSetParam(booster_, "learning_rate", "0.1"));
        check(XGBoosterSetParam(booster_, "subsample", "1.0"));
        check(XGBoosterSetParam(booster_, "colsample_bytree", "1.0"));
        check(XGBoosterSetParam(booster_, "min_child_weight", "1"));
        check(XGBoosterSetParam(booster_, "seed", std::to_string(seed_).c_str()));
        check(XGBoosterSetParam(booster_, "nthread", "1"));

        for (int i = 0; i < num_rounds_; ++i) {
            check(XGBoosterUpdateOneIter(booster_, i, dmat.handle));
        }
        num_features_ = X.front().size();
    }

    std::vector<double> predict(const FeatureMatrix& X) const override {
        if (!booster_) {
            throw std::runtime_error("Model not trained - call fit() first");
        }
        if (X.empty()) return {};

        auto dmat = make_dmatrix(X);

        bst_ulong out_len = 0;
        const float* out_result = nullptr;
        check(XGBoosterPredict(booster_, dmat.handle, 0, 0, 0, &out_len, &out_result));
        if (out_len != static_cast<bst_ulong>(X.size())) {
            throw std::runtime_error("XGBoost returned " + std::to_string(out_len) +
                                     " predictions for " + std::to_string(X.size()) + " rows");
        }

        std::vector<double> predictions(X.size());
        for (size_t i = 0; i < X.size(); ++i) predictions[i] = static_cast<double>(out_result[i]);
        return predictions;
    }

    // Total split gain per feature, normalised to sum to 1. Features the
    // trees never split on score 0.
    std::vector<double> feature_importance() const override {
        if (!booster_) {
            throw std::runtime_error("Model not trained - call fit() first");
        }
        bst_ulong n_scored = 0;
        const char** names = nullptr;
        bst_ulong dim = 0;
        const bst_ulong* shape = nullptr;
        const float* scores = nullptr;
        check(XGBoosterFeatureScore(booster_, R"({"importance_type": "total_gain", "feature_map": ""})",
                                    &n_scored, &names, &dim, &shape, &scores));

        // Unnamed DMatrix columns are reported as "f<index>".
        std::vector<double> out(num_features_, 0.0);
        for (bst_ulong i = 0; i < n_scored; ++i) {
            std::string name(names[i]);
            if (name.size() < 2 || name[0] != 'f') continue;
            size_t idx = std::stoul(name.substr(1));
            if (idx < out.size()) out[idx] = static_cast<double>(scores[i]);
        }
        double total = 0.0;
        for (double v : out) total += v;
        if (total > 0.0) {
            for (double& v : out) v /= total;
        }
        return out;
    }

private:
    BoosterHandle booster_;
    int num_rounds_;
    int max_depth_;
    uint64_t seed_;
    size_t num_features_ = 0;

    // RAII guard for DMatrixHandle — prevents leaks on exception
    struct DMatrixGuard {
        DMatrixHandle handle = nullptr;
        explicit DMatrixGuard(DMatrixHandle h) : handle(h) {}
        ~DMatrixGuard() { if (handle) XGDMatrixFree(handle); }
        DMatrixGuard(const DMatrixGuard&) = delete;
        DMatrixGuard& operator=(const DMatrixGuard&) = delete;
    };

    static DMatrixGuard make_dmatrix(const FeatureMatrix& X) {
        size_t n = X.size();
        size_t d = X.front().size();
        std::vector<float> flat(n * d);
        for (size_t i = 0; i < n; ++i) {
            if (X[i].size() != d) throw std::invalid_argument("GbtLearner: ragged feature rows");
            for (size_t j = 0; j < d; ++j) flat[i * d + j] = static_cast<float>(X[i][j]);
        }
        DMatrixHandle dmat;
        check(XGDMatrixCreateFromMat(flat.data(), static_cast<bst_ulong>(n),
                                     static_cast<bst_ulong>(d), -1e30f, &dmat));
        return DMatrixGuard(dmat);
    }

    static void check(int rc) {
        if (rc != 0) {
            throw std::runtime_error(std::string("XGBoost error: ") + XGBGetLastError());
        }
    }
};
