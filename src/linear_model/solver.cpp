#include "solver.h"

namespace dagstat {

Eigen::VectorXd WeightedSolver::solve(const WeightedDesignMatrix& wdm, const Eigen::VectorXd& y) {
    if (y.size() != wdm.rows()) {
        throw std::invalid_argument("Dimension mismatch: y.size() != X.rows()");
    }
    compute_decomposition_if_needed(wdm);

    if (on_qr_path()) {
        // min || sqrt(W) X beta - sqrt(W) y ||
        Eigen::VectorXd weighted_y = wdm.weights().cwiseSqrt().asDiagonal() * y;
        return qr_.solve(weighted_y);
    }
    return ldlt_.solve(wdm.compute_XTWy(y));
}

Eigen::MatrixXd WeightedSolver::variance_covariance() const {
    if (!is_decomposed_) {
        throw std::runtime_error("solve() must be run before accessing covariance.");
    }
    if (on_qr_path()) {
        return gram_.completeOrthogonalDecomposition().pseudoInverse();
    }
    const int p = ldlt_.rows();
    return ldlt_.solve(Eigen::MatrixXd::Identity(p, p));
}

int WeightedSolver::rank() const {
    if (!is_decomposed_) return 0;
    if (on_qr_path()) return qr_.rank();
    return ldlt_.vectorD().size();
}

void WeightedSolver::compute_decomposition_if_needed(const WeightedDesignMatrix& wdm) {
    if (is_decomposed_) return;

    gram_ = wdm.compute_gram();

    if (strategy_ == SolverStrategy::QR) {
        qr_.compute(wdm.compute_sqrt_weighted_X());
        is_decomposed_ = true;
        return;
    }

    ldlt_.compute(gram_);

    // LDLT reports Success on semi-definite input, so also look for a
    // vanishing pivot relative to the largest one.
    bool is_good = (ldlt_.info() == Eigen::Success);
    if (is_good) {
        Eigen::VectorXd d = ldlt_.vectorD().cwiseAbs();
        double d_max = d.size() > 0 ? d.maxCoeff() : 0.0;
        is_good = d_max > 0.0 && d.minCoeff() > d_max * 1e-12;
    }

    if (!is_good && strategy_ == SolverStrategy::AUTO) {
        use_qr_fallback_ = true;
        qr_.compute(wdm.compute_sqrt_weighted_X());
    } else if (!is_good) {
        throw std::runtime_error("LDLT decomposition failed. Matrix might be singular.");
    } else {
        use_qr_fallback_ = false;
    }
    is_decomposed_ = true;
}

} // namespace dagstat
