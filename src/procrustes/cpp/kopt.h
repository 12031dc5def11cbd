#ifndef PROCRUSTES_KOPT_H
#define PROCRUSTES_KOPT_H

#include <Eigen/Dense>
#include <functional>
#include <optional>

namespace procrustes {

struct KoptOptions {
    // Number of indices reordered by one move
    int k = 3;
    // Error at or below which the search stops immediately
    double tol = 1e-8;
};

struct KoptResult {
    Eigen::MatrixXd permutation;
    double error;
    int moves;
};

struct KoptDoubleResult {
    Eigen::MatrixXd left;
    Eigen::MatrixXd right;
    double error;
    int moves;
};

using Objective = std::function<double(const Eigen::MatrixXd&)>;
using DoubleObjective = std::function<double(const Eigen::MatrixXd&, const Eigen::MatrixXd&)>;

/**
 * True if M is square with 0/1 entries (within tol) and unit row and column sums.
 */
bool is_permutation_matrix(const Eigen::MatrixXd& M, double tol = 1e-8);

/**
 * Locally optimal permutation matrix by the k-opt (greedy) heuristic.
 *
 * Moves reorder k columns of the current permutation. Index subsets are
 * visited in lexicographic order and, within a subset, arrangements in
 * std::next_permutation order, skipping the identity. The first strictly
 * improving move is accepted and the scan restarts from the first subset.
 * The search ends when a full scan finds no improvement, or as soon as the
 * error is at or below options.tol.
 *
 * @param fun Objective to minimize
 * @param p0 Initial permutation matrix
 * @param options Neighborhood size k (2 <= k <= n) and early-stop tolerance
 * @throws InvalidArgumentError if k is out of range or p0 is not a permutation
 * @throws ShapeError if p0 is not square
 */
KoptResult kopt_heuristic_single(
    const Objective& fun,
    const Eigen::MatrixXd& p0,
    const KoptOptions& options = KoptOptions()
);

/**
 * k-opt refinement of ||A P - B||^2.
 */
KoptResult kopt_heuristic_single(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& p0,
    const KoptOptions& options = KoptOptions()
);

/**
 * Locally optimal pair of permutations (P, Q) by alternating k-opt searches.
 *
 * P is improved by row reorderings with Q held fixed until no move helps,
 * then Q by column reorderings with P held fixed; rounds repeat until one
 * changes neither side. Same enumeration order and tolerance stop as the
 * single-sided search.
 */
KoptDoubleResult kopt_heuristic_double(
    const DoubleObjective& fun,
    const Eigen::MatrixXd& p0,
    const Eigen::MatrixXd& q0,
    const KoptOptions& options = KoptOptions()
);

/**
 * k-opt refinement of ||P A Q - B||^2. Missing p0/q0 default to identity.
 *
 * @throws ShapeError if A and B differ in shape or p0/q0 do not match A
 */
KoptDoubleResult kopt_heuristic_double(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const std::optional<Eigen::MatrixXd>& p0 = std::nullopt,
    const std::optional<Eigen::MatrixXd>& q0 = std::nullopt,
    const KoptOptions& options = KoptOptions()
);

} // namespace procrustes

#endif // PROCRUSTES_KOPT_H
