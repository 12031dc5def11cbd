#ifndef PROCRUSTES_DECOMPOSITION_H
#define PROCRUSTES_DECOMPOSITION_H

#include <Eigen/Dense>
#include <string>

namespace procrustes {

/**
 * SVD backend.
 *
 * Robust uses one-sided Jacobi rotations (slower, the gesvd analogue);
 * Fast uses divide and conquer bidiagonalization (the gesdd analogue).
 */
enum class PinvDriver {
    Robust,
    Fast
};

/**
 * Parse a driver name: "robust"/"gesvd" or "fast"/"gesdd".
 * Throws InvalidDriverError for anything else.
 */
PinvDriver parse_pinv_driver(const std::string& name);

std::string to_string(PinvDriver driver);

struct SVDResult {
    Eigen::MatrixXd U;
    Eigen::VectorXd singular_values;  // descending
    Eigen::MatrixXd V;
};

struct EigenResult {
    Eigen::VectorXd eigenvalues;   // descending
    Eigen::MatrixXd eigenvectors;
};

/**
 * Full singular value decomposition M = U * diag(s) * V^T.
 *
 * @throws NumericalError if the decomposition does not converge
 */
SVDResult svd(const Eigen::MatrixXd& M, PinvDriver driver = PinvDriver::Robust);

/**
 * Numerical rank of M: number of singular values above
 * s_max * max(rows, cols) * machine epsilon.
 */
Eigen::Index matrix_rank(const Eigen::MatrixXd& M);

/**
 * Diagonalizability test: after trimming zero padding, M must be square and
 * rank(U) of its SVD must equal rank(M).
 *
 * @throws ShapeError if the trimmed matrix is not square
 */
bool is_diagonalizable(const Eigen::MatrixXd& M);

/**
 * Eigendecomposition of a symmetric matrix, eigenvalues sorted descending.
 *
 * @param M Square symmetric matrix
 * @param arrange_rows Reorder the rows of the eigenvector matrix by the sort
 *        permutation instead of its columns (used by two-sided single
 *        transformation callers)
 * @throws ShapeError if M is not square
 * @throws NotDiagonalizableError if is_diagonalizable(M) is false
 * @throws NumericalError if the solver does not converge
 */
EigenResult symmetric_eigendecomposition(const Eigen::MatrixXd& M, bool arrange_rows = false);

/**
 * Moore-Penrose pseudo-inverse. Singular values at or below
 * s_max * max(rows, cols) * machine epsilon are treated as zero.
 */
Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& M, PinvDriver driver = PinvDriver::Robust);

} // namespace procrustes

#endif // PROCRUSTES_DECOMPOSITION_H
