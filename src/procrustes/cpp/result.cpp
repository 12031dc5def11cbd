/**
 * Result container and error model
 *
 * Squared Frobenius residuals ||left A right - B||^2 shared by every solver
 * and by the k-opt refiner.
 */

#include "result.h"
#include "errors.h"
#include <string>
#include <utility>

namespace procrustes {

namespace {

std::string shape_of(Eigen::Index rows, Eigen::Index cols) {
    return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
}

double residual(const Eigen::MatrixXd& X, const Eigen::MatrixXd& B) {
    if (X.rows() != B.rows() || X.cols() != B.cols()) {
        throw ShapeError(
            "frobenius_error: transformed matrix " + shape_of(X.rows(), X.cols())
            + " does not match reference " + shape_of(B.rows(), B.cols())
        );
    }
    // Tr[(X - B)^T (X - B)]
    return (X - B).squaredNorm();
}

} // namespace

ProcrustesResult::ProcrustesResult(
    double error,
    Eigen::MatrixXd new_a,
    Eigen::MatrixXd new_b,
    Eigen::MatrixXd transformation,
    std::optional<Eigen::MatrixXd> secondary_transformation
)
    : error_(error),
      new_a_(std::move(new_a)),
      new_b_(std::move(new_b)),
      transformation_(std::move(transformation)),
      secondary_transformation_(std::move(secondary_transformation)) {}

double frobenius_error(const Eigen::MatrixXd& A, const Eigen::MatrixXd& B) {
    return residual(A, B);
}

double frobenius_error(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& right
) {
    if (A.cols() != right.rows()) {
        throw ShapeError(
            "frobenius_error: cannot multiply A " + shape_of(A.rows(), A.cols())
            + " by transformation " + shape_of(right.rows(), right.cols())
        );
    }
    return residual(A * right, B);
}

double frobenius_error(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& left,
    const Eigen::MatrixXd& right
) {
    if (left.cols() != A.rows() || A.cols() != right.rows()) {
        throw ShapeError(
            "frobenius_error: left " + shape_of(left.rows(), left.cols())
            + ", A " + shape_of(A.rows(), A.cols())
            + " and right " + shape_of(right.rows(), right.cols()) + " do not conform"
        );
    }
    return residual(left * A * right, B);
}

} // namespace procrustes
