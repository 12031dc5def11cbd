/**
 * One-sided permutation Procrustes
 *
 * Algorithm:
 * 1. Preprocess A and B
 * 2. Relaxed solution: least-squares T = (A^T A)^+ A^T B
 * 3. Round T to a permutation matrix (greedy largest entry)
 * 4. Polish with the k-opt heuristic on ||A P - B||^2
 */

#include "permutation.h"
#include "errors.h"
#include "generic.h"
#include "kopt.h"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>
#include <string>
#include <tuple>
#include <vector>

namespace procrustes {

Eigen::MatrixXd snap_to_permutation(const Eigen::MatrixXd& M) {
    if (M.rows() != M.cols()) {
        throw ShapeError(
            "snap_to_permutation: matrix must be square, got (" + std::to_string(M.rows())
            + ", " + std::to_string(M.cols()) + ")"
        );
    }

    Eigen::Index n = M.rows();
    std::vector<bool> row_taken(n, false);
    std::vector<bool> col_taken(n, false);
    Eigen::MatrixXd P = Eigen::MatrixXd::Zero(n, n);

    for (Eigen::Index step = 0; step < n; ++step) {
        Eigen::Index best_row = -1;
        Eigen::Index best_col = -1;
        double best = -std::numeric_limits<double>::infinity();
        for (Eigen::Index i = 0; i < n; ++i) {
            if (row_taken[i]) {
                continue;
            }
            for (Eigen::Index j = 0; j < n; ++j) {
                if (!col_taken[j] && (best_row < 0 || M(i, j) > best)) {
                    best = M(i, j);
                    best_row = i;
                    best_col = j;
                }
            }
        }
        P(best_row, best_col) = 1.0;
        row_taken[best_row] = true;
        col_taken[best_col] = true;
    }

    return P;
}

ProcrustesResult permutation(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const PermutationOptions& options
) {
    if (options.kopt && options.kopt_k < 2) {
        throw InvalidArgumentError("permutation: kopt_k must be >= 2, got " + std::to_string(options.kopt_k));
    }

    Eigen::MatrixXd new_a;
    Eigen::MatrixXd new_b;
    std::tie(new_a, new_b) = setup_input_arrays(A, B, options);

    if (new_a.rows() != new_b.rows() || new_a.cols() != new_b.cols()) {
        throw ShapeError(
            "permutation: A and B must have the same shape after preprocessing, got ("
            + std::to_string(new_a.rows()) + ", " + std::to_string(new_a.cols()) + ") and ("
            + std::to_string(new_b.rows()) + ", " + std::to_string(new_b.cols()) + ")"
        );
    }

    Eigen::MatrixXd relaxed = least_squares_transformation(new_a, new_b, options.driver);
    Eigen::MatrixXd P = snap_to_permutation(relaxed);
    double error = frobenius_error(new_a, new_b, P);

    BOOST_LOG_TRIVIAL(debug) << "permutation: rounded relaxed solution, error " << error;

    Eigen::Index n = P.rows();
    if (options.kopt && n >= 2) {
        KoptOptions kopt_options;
        // k cannot exceed the number of columns
        kopt_options.k = static_cast<int>(std::min<Eigen::Index>(options.kopt_k, n));
        kopt_options.tol = options.kopt_tol;

        KoptResult refined = kopt_heuristic_single(new_a, new_b, P, kopt_options);
        P = refined.permutation;
        error = refined.error;
    }

    return ProcrustesResult(error, new_a, new_b, P);
}

} // namespace procrustes
