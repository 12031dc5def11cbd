/**
 * K-opt (greedy) permutation refinement
 *
 * Local search over reorderings of k rows or columns of a permutation
 * matrix. Used to polish permutations obtained by rounding a relaxed
 * solution; it is not a global assignment solver.
 *
 * The neighborhood of an n x n permutation has C(n, k) * (k! - 1) moves,
 * so k is expected to stay small (2 or 3).
 */

#include "kopt.h"
#include "errors.h"
#include "result.h"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace procrustes {

namespace {

enum class Axis { Rows, Cols };

std::string shape_of(const Eigen::MatrixXd& M) {
    return "(" + std::to_string(M.rows()) + ", " + std::to_string(M.cols()) + ")";
}

std::string join(const std::vector<Eigen::Index>& indices) {
    std::ostringstream out;
    for (size_t i = 0; i < indices.size(); ++i) {
        out << (i ? "," : "") << indices[i];
    }
    return out.str();
}

// Advance subset to the next k-combination of {0..n-1} in lexicographic order
bool next_combination(std::vector<Eigen::Index>& subset, Eigen::Index n) {
    Eigen::Index k = static_cast<Eigen::Index>(subset.size());
    for (Eigen::Index i = k - 1; i >= 0; --i) {
        if (subset[i] < n - k + i) {
            ++subset[i];
            for (Eigen::Index j = i + 1; j < k; ++j) {
                subset[j] = subset[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

// Row/column subset[i] of the result is row/column arrangement[i] of P
Eigen::MatrixXd reorder(
    const Eigen::MatrixXd& P,
    const std::vector<Eigen::Index>& subset,
    const std::vector<Eigen::Index>& arrangement,
    Axis axis
) {
    Eigen::MatrixXd candidate = P;
    for (size_t i = 0; i < subset.size(); ++i) {
        if (axis == Axis::Rows) {
            candidate.row(subset[i]) = P.row(arrangement[i]);
        } else {
            candidate.col(subset[i]) = P.col(arrangement[i]);
        }
    }
    return candidate;
}

// Hill-climb one permutation until no move improves; returns accepted moves
int local_search(
    const Objective& fun,
    Eigen::MatrixXd& P,
    double& error,
    int k,
    double tol,
    Axis axis,
    const char* side
) {
    int moves = 0;
    Eigen::Index n = P.rows();
    bool improved = true;

    while (improved && error > tol) {
        improved = false;

        std::vector<Eigen::Index> subset(k);
        std::iota(subset.begin(), subset.end(), 0);
        do {
            std::vector<Eigen::Index> arrangement = subset;
            while (std::next_permutation(arrangement.begin(), arrangement.end())) {
                Eigen::MatrixXd candidate = reorder(P, subset, arrangement, axis);
                double candidate_error = fun(candidate);
                if (candidate_error < error) {
                    P = candidate;
                    error = candidate_error;
                    ++moves;
                    improved = true;
                    BOOST_LOG_TRIVIAL(trace) << "kopt: " << side << " move {" << join(subset)
                                             << "} <- {" << join(arrangement)
                                             << "}, error " << error;
                    break;
                }
            }
        } while (!improved && next_combination(subset, n));
    }

    return moves;
}

void check_permutation(const Eigen::MatrixXd& P, const char* name) {
    if (P.rows() != P.cols()) {
        throw ShapeError(std::string("kopt: ") + name + " must be square, got " + shape_of(P));
    }
    if (!is_permutation_matrix(P)) {
        throw InvalidArgumentError(std::string("kopt: ") + name + " is not a permutation matrix");
    }
}

void check_options(const KoptOptions& options, Eigen::Index dimension) {
    if (options.k < 2) {
        throw InvalidArgumentError("kopt: k must be an integer >= 2, got k=" + std::to_string(options.k));
    }
    if (options.k > dimension) {
        throw InvalidArgumentError(
            "kopt: k must not exceed the permutation size, got k=" + std::to_string(options.k)
            + " > " + std::to_string(dimension)
        );
    }
    if (!(options.tol >= 0.0)) {
        throw InvalidArgumentError("kopt: tol must be non-negative");
    }
}

} // namespace

bool is_permutation_matrix(const Eigen::MatrixXd& M, double tol) {
    if (M.rows() != M.cols()) {
        return false;
    }
    if (M.size() == 0) {
        return true;
    }
    for (Eigen::Index i = 0; i < M.rows(); ++i) {
        for (Eigen::Index j = 0; j < M.cols(); ++j) {
            double value = M(i, j);
            if (std::abs(value) > tol && std::abs(value - 1.0) > tol) {
                return false;
            }
        }
    }
    Eigen::VectorXd row_sums = M.rowwise().sum();
    Eigen::RowVectorXd col_sums = M.colwise().sum();
    return (row_sums.array() - 1.0).abs().maxCoeff() <= tol
        && (col_sums.array() - 1.0).abs().maxCoeff() <= tol;
}

KoptResult kopt_heuristic_single(
    const Objective& fun,
    const Eigen::MatrixXd& p0,
    const KoptOptions& options
) {
    check_permutation(p0, "p0");
    check_options(options, p0.rows());

    KoptResult result;
    result.permutation = p0;
    result.error = fun(p0);

    BOOST_LOG_TRIVIAL(debug) << "kopt_heuristic_single: k=" << options.k
                             << ", n=" << p0.rows() << ", initial error " << result.error;

    result.moves = local_search(fun, result.permutation, result.error,
                                options.k, options.tol, Axis::Cols, "column");

    BOOST_LOG_TRIVIAL(debug) << "kopt_heuristic_single: " << result.moves
                             << " moves, final error " << result.error;
    return result;
}

KoptResult kopt_heuristic_single(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& p0,
    const KoptOptions& options
) {
    if (A.rows() != B.rows() || A.cols() != p0.rows() || B.cols() != p0.cols()) {
        throw ShapeError(
            "kopt_heuristic_single: A " + shape_of(A) + ", B " + shape_of(B)
            + " and p0 " + shape_of(p0) + " are incompatible with ||A P - B||"
        );
    }

    return kopt_heuristic_single(
        [&A, &B](const Eigen::MatrixXd& P) { return frobenius_error(A, B, P); },
        p0,
        options
    );
}

KoptDoubleResult kopt_heuristic_double(
    const DoubleObjective& fun,
    const Eigen::MatrixXd& p0,
    const Eigen::MatrixXd& q0,
    const KoptOptions& options
) {
    check_permutation(p0, "p0");
    check_permutation(q0, "q0");
    check_options(options, std::min(p0.rows(), q0.rows()));

    KoptDoubleResult result;
    result.left = p0;
    result.right = q0;
    result.error = fun(p0, q0);
    result.moves = 0;

    BOOST_LOG_TRIVIAL(debug) << "kopt_heuristic_double: k=" << options.k
                             << ", initial error " << result.error;

    Eigen::MatrixXd& P = result.left;
    Eigen::MatrixXd& Q = result.right;
    Objective left_fun = [&fun, &Q](const Eigen::MatrixXd& candidate) { return fun(candidate, Q); };
    Objective right_fun = [&fun, &P](const Eigen::MatrixXd& candidate) { return fun(P, candidate); };

    int rounds = 0;
    while (result.error > options.tol) {
        ++rounds;
        int left_moves = local_search(left_fun, P, result.error,
                                      options.k, options.tol, Axis::Rows, "left");
        int right_moves = 0;
        if (result.error > options.tol) {
            right_moves = local_search(right_fun, Q, result.error,
                                       options.k, options.tol, Axis::Cols, "right");
        }
        result.moves += left_moves + right_moves;
        if (left_moves == 0 && right_moves == 0) {
            break;
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "kopt_heuristic_double: " << result.moves << " moves in "
                             << rounds << " rounds, final error " << result.error;
    return result;
}

KoptDoubleResult kopt_heuristic_double(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const std::optional<Eigen::MatrixXd>& p0,
    const std::optional<Eigen::MatrixXd>& q0,
    const KoptOptions& options
) {
    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        throw ShapeError(
            "kopt_heuristic_double: B should have the same shape as A, got "
            + shape_of(B) + " != " + shape_of(A)
        );
    }

    Eigen::MatrixXd P = p0 ? *p0 : Eigen::MatrixXd::Identity(A.rows(), A.rows());
    Eigen::MatrixXd Q = q0 ? *q0 : Eigen::MatrixXd::Identity(A.cols(), A.cols());
    if (P.rows() != A.rows() || Q.rows() != A.cols()) {
        throw ShapeError(
            "kopt_heuristic_double: p0 " + shape_of(P) + " and q0 " + shape_of(Q)
            + " do not match A " + shape_of(A)
        );
    }

    return kopt_heuristic_double(
        [&A, &B](const Eigen::MatrixXd& left, const Eigen::MatrixXd& right) {
            return frobenius_error(A, B, left, right);
        },
        P,
        Q,
        options
    );
}

} // namespace procrustes
