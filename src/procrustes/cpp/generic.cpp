/**
 * Generic Procrustes implementation using Eigen
 *
 * Finds the least-squares linear transformation mapping A onto B.
 *
 * Algorithm:
 * 1. Preprocess: unpad, translate, weight, scale, pad
 * 2. Pseudo-inverse of A^T A (Jacobi or divide and conquer SVD)
 * 3. T = (A^T A)^+ A^T B
 * 4. Error: ||A T - B||_F^2
 */

#include "generic.h"
#include "errors.h"
#include <boost/log/trivial.hpp>
#include <exception>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace procrustes {

Eigen::MatrixXd least_squares_transformation(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    PinvDriver driver
) {
    if (A.rows() != B.rows()) {
        throw ShapeError(
            "least_squares_transformation: A and B must have the same number of rows ("
            + std::to_string(A.rows()) + " != " + std::to_string(B.rows()) + ")"
        );
    }
    Eigen::MatrixXd a_inv = pseudo_inverse(A.transpose() * A, driver);
    return a_inv * A.transpose() * B;
}

ProcrustesResult generic(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const GenericOptions& options
) {
    Eigen::MatrixXd new_a;
    Eigen::MatrixXd new_b;
    std::tie(new_a, new_b) = setup_input_arrays(A, B, options);

    if (new_a.rows() != new_b.rows()) {
        throw ShapeError(
            "generic: A and B must have the same number of rows after preprocessing ("
            + std::to_string(new_a.rows()) + " != " + std::to_string(new_b.rows()) + ")"
        );
    }
    if (new_a.rows() < new_a.cols()) {
        BOOST_LOG_TRIVIAL(warning) << "generic: underdetermined system (" << new_a.rows()
                                   << " rows < " << new_a.cols()
                                   << " columns), transformation is not unique";
    }

    BOOST_LOG_TRIVIAL(debug) << "generic: pseudo-inverse driver " << to_string(options.driver);

    Eigen::MatrixXd T = least_squares_transformation(new_a, new_b, options.driver);

    double error = frobenius_error(new_a, new_b, T);

    return ProcrustesResult(error, new_a, new_b, T);
}

std::vector<ProcrustesResult> generic_batch(
    const std::vector<Eigen::MatrixXd>& As,
    const std::vector<Eigen::MatrixXd>& Bs,
    const GenericOptions& options
) {
    if (As.size() != Bs.size()) {
        throw ShapeError(
            "generic_batch: got " + std::to_string(As.size()) + " A matrices but "
            + std::to_string(Bs.size()) + " B matrices"
        );
    }

    int n = static_cast<int>(As.size());
    std::vector<std::optional<ProcrustesResult>> slots(n);
    std::vector<std::exception_ptr> failures(n);

    // Exceptions cannot leave an OpenMP region
    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        try {
            slots[i].emplace(generic(As[i], Bs[i], options));
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    std::vector<ProcrustesResult> results;
    results.reserve(n);
    for (int i = 0; i < n; ++i) {
        if (failures[i]) {
            BOOST_LOG_TRIVIAL(debug) << "generic_batch: pair " << i << " failed";
            std::rethrow_exception(failures[i]);
        }
        results.push_back(std::move(*slots[i]));
    }

    return results;
}

} // namespace procrustes
