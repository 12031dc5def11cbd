#ifndef PROCRUSTES_PERMUTATION_H
#define PROCRUSTES_PERMUTATION_H

#include "decomposition.h"
#include "result.h"
#include "utils.h"
#include <Eigen/Dense>

namespace procrustes {

struct PermutationOptions : PreprocessOptions {
    PinvDriver driver = PinvDriver::Robust;
    // Polish the rounded permutation with the k-opt heuristic
    bool kopt = true;
    // Capped at the number of columns, so the default also fits n < 3
    int kopt_k = 3;
    double kopt_tol = 1e-8;
};

/**
 * Round a square matrix to a permutation matrix.
 *
 * Greedy assignment: the largest entry whose row and column are both still
 * free is set to 1, until every row is assigned. Ties go to the lowest row,
 * then the lowest column.
 *
 * This is a rounding step, not an exact assignment: the total of the picked
 * entries can be below the optimum (for [[3, 2], [2, 0]] it picks the
 * diagonal). permutation() follows it with the k-opt search, whose
 * neighborhood repairs such choices; k = 2 covers every pairwise swap.
 *
 * @throws ShapeError if M is not square
 */
Eigen::MatrixXd snap_to_permutation(const Eigen::MatrixXd& M);

/**
 * One-sided permutation Procrustes: min ||A P - B||^2 over permutations P.
 *
 * The least-squares transformation of generic() is rounded with
 * snap_to_permutation and, when options.kopt is set, refined by
 * kopt_heuristic_single with k = min(options.kopt_k, n). The result is
 * locally optimal only.
 *
 * @throws ShapeError if the preprocessed A and B differ in shape or A is not square in columns
 */
ProcrustesResult permutation(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const PermutationOptions& options = PermutationOptions()
);

} // namespace procrustes

#endif // PROCRUSTES_PERMUTATION_H
