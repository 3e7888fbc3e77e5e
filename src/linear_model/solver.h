#pragma once
#include <Eigen/Dense>
#include <Eigen/Cholesky>
#include <Eigen/QR>
#include <string>
#include <stdexcept>
#include <cmath>

namespace dagstat {

// Decomposition strategy
enum class SolverStrategy {
    AUTO,       // Attempt LDLT, fallback to QR if rank deficient
    CHOLESKY,   // Force LDLT (fastest, but fails if singular)
    QR          // Force QR (robust, slower, more memory)
};

/**
 * @brief Design matrix with observation weights
 *
 * Avoids materialising the n x n diagonal W when forming X^T W X.
 * Holds X by reference: the matrix must outlive this object.
 */
class WeightedDesignMatrix {
public:
    WeightedDesignMatrix(const Eigen::MatrixXd& X, const Eigen::VectorXd& weights)
        : X_(X), weights_(weights) {
        if (X.rows() != weights.size()) {
            throw std::invalid_argument("Dimension mismatch: X.rows() != weights.size()");
        }
    }

    // X^T W X
    Eigen::MatrixXd compute_gram() const {
        return X_.transpose() * weights_.asDiagonal() * X_;
    }

    // X^T W y
    Eigen::VectorXd compute_XTWy(const Eigen::VectorXd& y) const {
        return X_.transpose() * weights_.asDiagonal() * y;
    }

    // sqrt(W) X, only materialised for the QR path
    Eigen::MatrixXd compute_sqrt_weighted_X() const {
        return weights_.cwiseSqrt().asDiagonal() * X_;
    }

    const Eigen::MatrixXd& X() const { return X_; }
    const Eigen::VectorXd& weights() const { return weights_; }
    int rows() const { return X_.rows(); }
    int cols() const { return X_.cols(); }

private:
    const Eigen::MatrixXd& X_;
    Eigen::VectorXd weights_;
};

/**
 * @brief Weighted least squares solver
 *
 * Solves (X^T W X) beta = X^T W y. LDLT by default, falling back to
 * column-pivoted QR when the Gram matrix is not positive definite.
 * The decomposition is cached until reset().
 */
class WeightedSolver {
public:
    WeightedSolver(SolverStrategy strategy = SolverStrategy::AUTO)
        : strategy_(strategy), is_decomposed_(false), use_qr_fallback_(false) {}

    // Invalidate the cached decomposition (call when weights change)
    void reset() {
        is_decomposed_ = false;
        use_qr_fallback_ = false;
    }

    Eigen::VectorXd solve(const WeightedDesignMatrix& wdm, const Eigen::VectorXd& y);

    /**
     * @brief Unscaled covariance (X^T W X)^-1
     *
     * The residual variance is not included; callers multiply by sigma^2.
     * On the QR path the Moore-Penrose pseudo-inverse is returned.
     */
    Eigen::MatrixXd variance_covariance() const;

    std::string current_strategy_name() const {
        if (use_qr_fallback_) return "QR (Fallback)";
        if (strategy_ == SolverStrategy::QR) return "QR (Forced)";
        return "LDLT (Cholesky)";
    }

    int rank() const;

private:
    void compute_decomposition_if_needed(const WeightedDesignMatrix& wdm);
    bool on_qr_path() const { return use_qr_fallback_ || strategy_ == SolverStrategy::QR; }

    SolverStrategy strategy_;
    bool is_decomposed_;
    bool use_qr_fallback_;

    Eigen::MatrixXd gram_;
    Eigen::LDLT<Eigen::MatrixXd> ldlt_;
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr_;
};

} // namespace dagstat
