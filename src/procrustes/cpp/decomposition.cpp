/**
 * Decomposition wrappers around Eigen
 *
 * SVD (Jacobi or divide and conquer), numerical rank, pseudo-inverse, and
 * sorted symmetric eigendecomposition with a diagonalizability check.
 */

#include "decomposition.h"
#include "errors.h"
#include "utils.h"
#include <Eigen/SVD>
#include <Eigen/Eigenvalues>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>
#include <vector>

namespace procrustes {

namespace {

template <typename Solver>
SVDResult run_svd(const Eigen::MatrixXd& M, const std::string& driver_name) {
    Solver solver(M, Eigen::ComputeFullU | Eigen::ComputeFullV);
    if (solver.info() != Eigen::Success) {
        BOOST_LOG_TRIVIAL(warning) << "svd: " << driver_name << " driver failed on a "
                                   << M.rows() << "x" << M.cols() << " matrix";
        throw NumericalError("svd: " + driver_name + " SVD did not converge");
    }

    SVDResult result;
    result.U = solver.matrixU();
    result.singular_values = solver.singularValues();
    result.V = solver.matrixV();
    return result;
}

template <typename Solver>
Eigen::MatrixXd run_pinv(const Eigen::MatrixXd& M, const std::string& driver_name) {
    Solver solver(M, Eigen::ComputeThinU | Eigen::ComputeThinV);
    if (solver.info() != Eigen::Success) {
        BOOST_LOG_TRIVIAL(warning) << "pseudo_inverse: " << driver_name << " driver failed on a "
                                   << M.rows() << "x" << M.cols() << " matrix";
        throw NumericalError("pseudo_inverse: " + driver_name + " SVD did not converge");
    }

    const Eigen::VectorXd& s = solver.singularValues();
    double cutoff = s.size() > 0
        ? s.maxCoeff() * static_cast<double>(std::max(M.rows(), M.cols())) * std::numeric_limits<double>::epsilon()
        : 0.0;

    Eigen::VectorXd s_inv = Eigen::VectorXd::Zero(s.size());
    for (Eigen::Index i = 0; i < s.size(); ++i) {
        if (s(i) > cutoff) {
            s_inv(i) = 1.0 / s(i);
        }
    }

    return solver.matrixV() * s_inv.asDiagonal() * solver.matrixU().transpose();
}

} // namespace

PinvDriver parse_pinv_driver(const std::string& name) {
    if (name == "robust" || name == "gesvd") {
        return PinvDriver::Robust;
    } else if (name == "fast" || name == "gesdd") {
        return PinvDriver::Fast;
    } else {
        throw InvalidDriverError("Unknown pseudo-inverse driver: " + name + " (expected 'robust' or 'fast')");
    }
}

std::string to_string(PinvDriver driver) {
    switch (driver) {
        case PinvDriver::Robust: return "robust";
        case PinvDriver::Fast: return "fast";
    }
    return "unknown";
}

SVDResult svd(const Eigen::MatrixXd& M, PinvDriver driver) {
    if (M.size() == 0) {
        SVDResult result;
        result.U = Eigen::MatrixXd::Identity(M.rows(), M.rows());
        result.singular_values = Eigen::VectorXd(0);
        result.V = Eigen::MatrixXd::Identity(M.cols(), M.cols());
        return result;
    }
    if (driver == PinvDriver::Fast) {
        return run_svd<Eigen::BDCSVD<Eigen::MatrixXd>>(M, to_string(driver));
    }
    return run_svd<Eigen::JacobiSVD<Eigen::MatrixXd>>(M, to_string(driver));
}

Eigen::Index matrix_rank(const Eigen::MatrixXd& M) {
    if (M.size() == 0) {
        return 0;
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> solver(M);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("matrix_rank: SVD did not converge");
    }

    const Eigen::VectorXd& s = solver.singularValues();
    double tol = s.maxCoeff() * static_cast<double>(std::max(M.rows(), M.cols()))
                 * std::numeric_limits<double>::epsilon();
    return static_cast<Eigen::Index>((s.array() > tol).count());
}

bool is_diagonalizable(const Eigen::MatrixXd& M) {
    Eigen::MatrixXd trimmed = trim_padding(M);
    if (trimmed.rows() != trimmed.cols()) {
        throw ShapeError(
            "is_diagonalizable: matrix must be square, got (" + std::to_string(trimmed.rows())
            + ", " + std::to_string(trimmed.cols()) + ") after removing zero padding"
        );
    }

    // Eigenvectors must span the whole space
    SVDResult decomposition = svd(trimmed);
    return matrix_rank(decomposition.U) == matrix_rank(trimmed);
}

EigenResult symmetric_eigendecomposition(const Eigen::MatrixXd& M, bool arrange_rows) {
    if (M.rows() != M.cols()) {
        throw ShapeError(
            "symmetric_eigendecomposition: matrix must be square, got ("
            + std::to_string(M.rows()) + ", " + std::to_string(M.cols()) + ")"
        );
    }
    if (!is_diagonalizable(M)) {
        throw NotDiagonalizableError("symmetric_eigendecomposition: the input matrix is not diagonalizable");
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(M);
    if (solver.info() != Eigen::Success) {
        BOOST_LOG_TRIVIAL(warning) << "symmetric_eigendecomposition: solver failed on a "
                                   << M.rows() << "x" << M.cols() << " matrix";
        throw NumericalError("symmetric_eigendecomposition: eigenvalue decomposition failed");
    }

    // Eigen returns ascending eigenvalues, so descending order is the reverse
    Eigen::Index n = M.rows();
    std::vector<Eigen::Index> order(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        order[i] = n - 1 - i;
    }

    const Eigen::VectorXd& values = solver.eigenvalues();
    const Eigen::MatrixXd& vectors = solver.eigenvectors();

    EigenResult result;
    result.eigenvalues.resize(n);
    result.eigenvectors.resize(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        result.eigenvalues(i) = values(order[i]);
        if (arrange_rows) {
            result.eigenvectors.row(i) = vectors.row(order[i]);
        } else {
            result.eigenvectors.col(i) = vectors.col(order[i]);
        }
    }

    return result;
}

Eigen::MatrixXd pseudo_inverse(const Eigen::MatrixXd& M, PinvDriver driver) {
    if (M.size() == 0) {
        return Eigen::MatrixXd::Zero(M.cols(), M.rows());
    }
    if (driver == PinvDriver::Fast) {
        return run_pinv<Eigen::BDCSVD<Eigen::MatrixXd>>(M, to_string(driver));
    }
    return run_pinv<Eigen::JacobiSVD<Eigen::MatrixXd>>(M, to_string(driver));
}

} // namespace procrustes
