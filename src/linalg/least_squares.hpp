#pragma once

#include "core/errors.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// linalg — thin helpers over Eigen shared by the estimators and the tests
//
// Every routine that can meet a singular or indefinite matrix reports it
// as NumericalDivergenceError so stage boundaries can degrade.
// ---------------------------------------------------------------------------
namespace linalg {

// Relative pivot tolerance for the rank check in ols().
constexpr double RANK_TOLERANCE = 1e-10;

struct OlsFit {
    Eigen::MatrixXd coefficients;   // p x m
    Eigen::MatrixXd residuals;      // n x m
    Eigen::VectorXd rss;            // per response column
};

inline Eigen::MatrixXd symmetrize(const Eigen::MatrixXd& a) {
    return 0.5 * (a + a.transpose());
}

inline Eigen::MatrixXd from_rows(const std::vector<std::vector<double>>& rows) {
    Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    Eigen::Index m = rows.empty() ? 0 : static_cast<Eigen::Index>(rows.front().size());
    Eigen::MatrixXd out(n, m);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& r = rows[static_cast<size_t>(i)];
        if (static_cast<Eigen::Index>(r.size()) != m) {
            throw DataShapeError("ragged rows: expected " + std::to_string(m) + " columns");
        }
        for (Eigen::Index j = 0; j < m; ++j) out(i, j) = r[static_cast<size_t>(j)];
    }
    return out;
}

inline std::vector<double> to_vector(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

inline Eigen::VectorXd to_eigen(const std::vector<double>& v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

// Least squares Y = X B + E via column-pivoted Householder QR. A
// rank-deficient design throws instead of returning an arbitrary solution.
inline OlsFit ols(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y) {
    if (X.rows() != Y.rows()) {
        throw DataShapeError("ols: design has " + std::to_string(X.rows()) +
                             " rows, response has " + std::to_string(Y.rows()));
    }
    if (X.rows() < X.cols()) {
        throw NumericalDivergenceError("ols: fewer observations than regressors");
    }
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
    qr.setThreshold(RANK_TOLERANCE);
    if (qr.rank() < X.cols()) {
        throw NumericalDivergenceError("ols: rank-deficient design (rank " +
                                       std::to_string(qr.rank()) + " of " +
                                       std::to_string(X.cols()) + ")");
    }
    OlsFit fit;
    fit.coefficients = qr.solve(Y);
    fit.residuals = Y - X * fit.coefficients;
    fit.rss = fit.residuals.colwise().squaredNorm().transpose();
    return fit;
}

inline OlsFit ols(const Eigen::MatrixXd& X, const std::vector<double>& y) {
    return ols(X, Eigen::MatrixXd(to_eigen(y)));
}

// (XᵀX)⁻¹ for coefficient standard errors.
inline Eigen::MatrixXd normal_inverse(const Eigen::MatrixXd& X) {
    Eigen::LDLT<Eigen::MatrixXd> ldlt(X.transpose() * X);
    if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) {
        throw NumericalDivergenceError("singular normal matrix");
    }
    return ldlt.solve(Eigen::MatrixXd::Identity(X.cols(), X.cols()));
}

inline double log_det_spd(const Eigen::MatrixXd& a) {
    Eigen::LLT<Eigen::MatrixXd> llt(symmetrize(a));
    if (llt.info() != Eigen::Success) {
        throw NumericalDivergenceError("matrix not positive definite");
    }
    return 2.0 * llt.matrixLLT().diagonal().array().log().sum();
}

// A⁻¹ B for symmetric positive definite A.
inline Eigen::MatrixXd spd_solve(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
    Eigen::LLT<Eigen::MatrixXd> llt(symmetrize(a));
    if (llt.info() != Eigen::Success) {
        throw NumericalDivergenceError("matrix not positive definite");
    }
    return llt.solve(b);
}

}  // namespace linalg
