#ifndef PROCRUSTES_GENERIC_H
#define PROCRUSTES_GENERIC_H

#include "decomposition.h"
#include "result.h"
#include "utils.h"
#include <Eigen/Dense>
#include <vector>

namespace procrustes {

struct GenericOptions : PreprocessOptions {
    PinvDriver driver = PinvDriver::Robust;
};

/**
 * Generic one-sided Procrustes.
 *
 * Finds the unconstrained transformation T minimizing ||A T - B||_F^2 from
 * the normal equations T = (A^T A)^+ A^T B, after running the preprocessing
 * pipeline configured in options.
 *
 * When A has fewer rows than columns after preprocessing the system is
 * underdetermined and T is one of infinitely many minimizers.
 *
 * @param A Matrix to be transformed (m x n)
 * @param B Reference matrix
 * @param options Preprocessing flags and pseudo-inverse driver
 * @return ProcrustesResult with transformation T (n x n')
 * @throws ShapeError if A and B do not have the same number of rows after preprocessing
 */
ProcrustesResult generic(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const GenericOptions& options = GenericOptions()
);

/**
 * Least-squares transformation (A^T A)^+ A^T B of already preprocessed
 * matrices with equal row counts.
 */
Eigen::MatrixXd least_squares_transformation(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    PinvDriver driver = PinvDriver::Robust
);

/**
 * Solve independent (A, B) pairs with the same options.
 *
 * Pairs are solved in parallel when built with OpenMP. If any pair fails,
 * the error of the lowest failing index is rethrown.
 */
std::vector<ProcrustesResult> generic_batch(
    const std::vector<Eigen::MatrixXd>& As,
    const std::vector<Eigen::MatrixXd>& Bs,
    const GenericOptions& options = GenericOptions()
);

} // namespace procrustes

#endif // PROCRUSTES_GENERIC_H
