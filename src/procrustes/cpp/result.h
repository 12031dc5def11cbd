#ifndef PROCRUSTES_RESULT_H
#define PROCRUSTES_RESULT_H

#include <Eigen/Dense>
#include <optional>

namespace procrustes {

/**
 * Outcome of a Procrustes solver. Built once, read-only afterwards.
 *
 * new_a and new_b are the inputs after preprocessing; transformation is the
 * right-hand (or only) transformation and secondary_transformation the
 * left-hand one of two-sided problems.
 */
class ProcrustesResult {
public:
    ProcrustesResult(
        double error,
        Eigen::MatrixXd new_a,
        Eigen::MatrixXd new_b,
        Eigen::MatrixXd transformation,
        std::optional<Eigen::MatrixXd> secondary_transformation = std::nullopt
    );

    double error() const { return error_; }
    const Eigen::MatrixXd& new_a() const { return new_a_; }
    const Eigen::MatrixXd& new_b() const { return new_b_; }
    const Eigen::MatrixXd& transformation() const { return transformation_; }
    const std::optional<Eigen::MatrixXd>& secondary_transformation() const {
        return secondary_transformation_;
    }

private:
    double error_;
    Eigen::MatrixXd new_a_;
    Eigen::MatrixXd new_b_;
    Eigen::MatrixXd transformation_;
    std::optional<Eigen::MatrixXd> secondary_transformation_;
};

/**
 * Squared Frobenius norm of the residual A - B.
 */
double frobenius_error(const Eigen::MatrixXd& A, const Eigen::MatrixXd& B);

/**
 * One-sided error ||A * right - B||^2.
 */
double frobenius_error(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& right
);

/**
 * Two-sided error ||left * A * right - B||^2.
 *
 * @throws ShapeError if the product and B do not conform
 */
double frobenius_error(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& left,
    const Eigen::MatrixXd& right
);

} // namespace procrustes

#endif // PROCRUSTES_RESULT_H
