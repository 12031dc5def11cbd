/**
 * Preprocessing utilities shared by every solver
 *
 * Pure functions over Eigen matrices: padding and unpadding with zero
 * rows/columns, translation of centroids, Frobenius-norm scaling, and the
 * pipeline that chains them.
 */

#include "utils.h"
#include "errors.h"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cmath>
#include <tuple>

namespace procrustes {

namespace {

std::string shape_of(const Eigen::MatrixXd& M) {
    return "(" + std::to_string(M.rows()) + ", " + std::to_string(M.cols()) + ")";
}

// Drop near-zero rows from the bottom up to the first non-zero row
Eigen::MatrixXd trim_rows(const Eigen::MatrixXd& M) {
    Eigen::Index rows = M.rows();
    while (rows > 0) {
        if (M.cols() > 0 && M.row(rows - 1).cwiseAbs().maxCoeff() > kZeroPaddingTolerance) {
            break;
        }
        --rows;
    }
    return M.topRows(rows);
}

// Drop near-zero columns from the right up to the first non-zero column
Eigen::MatrixXd trim_cols(const Eigen::MatrixXd& M) {
    Eigen::Index cols = M.cols();
    while (cols > 0) {
        if (M.rows() > 0 && M.col(cols - 1).cwiseAbs().maxCoeff() > kZeroPaddingTolerance) {
            break;
        }
        --cols;
    }
    return M.leftCols(cols);
}

Eigen::MatrixXd pad_to(const Eigen::MatrixXd& M, Eigen::Index rows, Eigen::Index cols) {
    Eigen::MatrixXd padded = Eigen::MatrixXd::Zero(std::max(rows, M.rows()), std::max(cols, M.cols()));
    padded.topLeftCorner(M.rows(), M.cols()) = M;
    return padded;
}

} // namespace

PadMode parse_pad_mode(const std::string& name) {
    if (name == "row") {
        return PadMode::Row;
    } else if (name == "col") {
        return PadMode::Col;
    } else if (name == "row-col") {
        return PadMode::RowCol;
    } else if (name == "square") {
        return PadMode::Square;
    } else {
        throw InvalidArgumentError("Unknown padding mode: " + name);
    }
}

std::string to_string(PadMode mode) {
    switch (mode) {
        case PadMode::Row: return "row";
        case PadMode::Col: return "col";
        case PadMode::RowCol: return "row-col";
        case PadMode::Square: return "square";
    }
    return "unknown";
}

Eigen::RowVectorXd compute_centroid(const Eigen::MatrixXd& M) {
    if (M.rows() == 0) {
        throw ShapeError("compute_centroid: matrix has no rows");
    }
    return M.colwise().mean();
}

double frobenius_norm(const Eigen::MatrixXd& M) {
    return M.norm();
}

Eigen::MatrixXd trim_padding(const Eigen::MatrixXd& M) {
    return trim_cols(trim_rows(M));
}

Eigen::VectorXd trim_padding(const Eigen::VectorXd& v) {
    Eigen::Index size = v.size();
    while (size > 0 && std::abs(v(size - 1)) <= kZeroPaddingTolerance) {
        --size;
    }
    return v.head(size);
}

TranslateResult translate_to_origin(const Eigen::MatrixXd& M) {
    Eigen::RowVectorXd centroid = compute_centroid(M);

    TranslateResult result;
    result.matrix = M.rowwise() - centroid;
    result.translation = -centroid;
    return result;
}

TranslateResult translate_to_origin(const Eigen::MatrixXd& M, const Eigen::MatrixXd& reference) {
    if (M.cols() != reference.cols()) {
        throw ShapeError(
            "translate_to_origin: M and reference must have the same number of columns, got "
            + shape_of(M) + " and " + shape_of(reference)
        );
    }

    // Offset between the two centroids
    Eigen::RowVectorXd shift = compute_centroid(M) - compute_centroid(reference);

    TranslateResult result;
    result.matrix = M.rowwise() - shift;
    result.translation = -shift;
    return result;
}

ScaleResult scale_unit_norm(const Eigen::MatrixXd& M) {
    double norm = frobenius_norm(M);
    if (norm == 0.0) {
        throw DegenerateInputError("scale_unit_norm: cannot scale a matrix with zero Frobenius norm");
    }

    ScaleResult result;
    result.factor = 1.0 / norm;
    result.matrix = M * result.factor;
    return result;
}

ScaleResult scale_unit_norm(const Eigen::MatrixXd& M, const Eigen::MatrixXd& reference) {
    double norm = frobenius_norm(M);
    if (norm == 0.0) {
        throw DegenerateInputError("scale_unit_norm: cannot scale a matrix with zero Frobenius norm");
    }

    ScaleResult result;
    result.factor = frobenius_norm(reference) / norm;
    result.matrix = M * result.factor;
    return result;
}

std::pair<Eigen::MatrixXd, Eigen::MatrixXd> pad_to_common_shape(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    PadMode mode
) {
    if (A.rows() == B.rows() && A.cols() == B.cols()) {
        return {A, B};
    }

    switch (mode) {
        case PadMode::Row: {
            Eigen::Index rows = std::max(A.rows(), B.rows());
            return {pad_to(A, rows, A.cols()), pad_to(B, rows, B.cols())};
        }
        case PadMode::Col: {
            Eigen::Index cols = std::max(A.cols(), B.cols());
            return {pad_to(A, A.rows(), cols), pad_to(B, B.rows(), cols)};
        }
        case PadMode::RowCol: {
            Eigen::Index rows = std::max(A.rows(), B.rows());
            Eigen::Index cols = std::max(A.cols(), B.cols());
            return {pad_to(A, rows, cols), pad_to(B, rows, cols)};
        }
        case PadMode::Square: {
            Eigen::Index dim = std::max({A.rows(), A.cols(), B.rows(), B.cols()});
            return {pad_to(A, dim, dim), pad_to(B, dim, dim)};
        }
    }
    throw InvalidArgumentError("pad_to_common_shape: unknown padding mode");
}

std::pair<Eigen::MatrixXd, Eigen::MatrixXd> setup_input_arrays(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const PreprocessOptions& options
) {
    if (options.check_finite) {
        if (!A.allFinite()) {
            throw NumericalError("setup_input_arrays: A contains NaN or Inf entries");
        }
        if (!B.allFinite()) {
            throw NumericalError("setup_input_arrays: B contains NaN or Inf entries");
        }
    }

    Eigen::MatrixXd new_a = A;
    Eigen::MatrixXd new_b = B;

    if (options.unpad_row) {
        new_a = trim_rows(new_a);
        new_b = trim_rows(new_b);
    }
    if (options.unpad_col) {
        new_a = trim_cols(new_a);
        new_b = trim_cols(new_b);
    }

    if (options.translate) {
        new_a = translate_to_origin(new_a).matrix;
        new_b = translate_to_origin(new_b).matrix;
        BOOST_LOG_TRIVIAL(debug) << "setup_input_arrays: translated A and B to the origin";
    }

    if (options.weight) {
        const Eigen::VectorXd& weight = *options.weight;
        if (weight.size() != new_a.rows()) {
            throw ShapeError(
                "setup_input_arrays: weight has " + std::to_string(weight.size())
                + " entries but A has " + std::to_string(new_a.rows()) + " rows"
            );
        }
        if (options.check_finite && !weight.allFinite()) {
            throw NumericalError("setup_input_arrays: weight contains NaN or Inf entries");
        }
        if (weight.size() > 0 && weight.minCoeff() < 0.0) {
            throw InvalidArgumentError("setup_input_arrays: weights must be non-negative");
        }
        new_a = weight.asDiagonal() * new_a;
    }

    if (options.scale) {
        new_a = scale_unit_norm(new_a).matrix;
        new_b = scale_unit_norm(new_b).matrix;
        BOOST_LOG_TRIVIAL(debug) << "setup_input_arrays: scaled A and B to unit Frobenius norm";
    }

    if (options.pad) {
        std::tie(new_a, new_b) = pad_to_common_shape(new_a, new_b, options.pad_mode);
    }

    BOOST_LOG_TRIVIAL(debug) << "setup_input_arrays: A " << shape_of(new_a)
                             << ", B " << shape_of(new_b)
                             << ", pad mode " << to_string(options.pad_mode);

    return {new_a, new_b};
}

} // namespace procrustes
