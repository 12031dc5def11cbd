#ifndef PROCRUSTES_UTILS_H
#define PROCRUSTES_UTILS_H

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <utility>

namespace procrustes {

/// Entries with absolute value at or below this are treated as padding.
constexpr double kZeroPaddingTolerance = 1e-8;

enum class PadMode {
    Row,     // match row counts
    Col,     // match column counts
    RowCol,  // match both, independently
    Square   // pad both to max(n1, m1, n2, m2) square
};

/**
 * Parse a padding mode name: "row", "col", "row-col" or "square".
 * Throws InvalidArgumentError for anything else.
 */
PadMode parse_pad_mode(const std::string& name);

std::string to_string(PadMode mode);

struct TranslateResult {
    Eigen::MatrixXd matrix;
    // Vector added to every row of the input.
    Eigen::RowVectorXd translation;
};

struct ScaleResult {
    Eigen::MatrixXd matrix;
    double factor;
};

/**
 * Options of the shared preprocessing pipeline.
 *
 * Steps run in the order unpad, translate, weight, scale, pad.
 */
struct PreprocessOptions {
    bool pad = true;
    bool translate = false;
    bool scale = false;
    bool unpad_row = false;
    bool unpad_col = false;
    bool check_finite = true;
    // Per-row weights of A, applied as diag(weight) * A.
    std::optional<Eigen::VectorXd> weight;
    PadMode pad_mode = PadMode::RowCol;
};

/**
 * Column-wise mean of M as a row vector.
 */
Eigen::RowVectorXd compute_centroid(const Eigen::MatrixXd& M);

double frobenius_norm(const Eigen::MatrixXd& M);

/**
 * Remove trailing near-zero rows (from the bottom) and columns (from the right).
 *
 * Scanning stops at the first row/column holding an entry larger than
 * kZeroPaddingTolerance. An all-zero matrix trims down to 0 x 0.
 */
Eigen::MatrixXd trim_padding(const Eigen::MatrixXd& M);

/**
 * Remove trailing near-zero entries of a vector.
 */
Eigen::VectorXd trim_padding(const Eigen::VectorXd& v);

/**
 * Move the centroid of M to the origin.
 */
TranslateResult translate_to_origin(const Eigen::MatrixXd& M);

/**
 * Move the centroid of M onto the centroid of reference.
 */
TranslateResult translate_to_origin(const Eigen::MatrixXd& M, const Eigen::MatrixXd& reference);

/**
 * Scale M to unit Frobenius norm. Throws DegenerateInputError if ||M|| = 0.
 */
ScaleResult scale_unit_norm(const Eigen::MatrixXd& M);

/**
 * Scale M so that its Frobenius norm equals the norm of reference.
 */
ScaleResult scale_unit_norm(const Eigen::MatrixXd& M, const Eigen::MatrixXd& reference);

/**
 * Zero-pad A and/or B (rows at the bottom, columns on the right) so their
 * shapes agree along the axes selected by mode.
 *
 * @return (padded A, padded B); inputs are returned unchanged when their
 *         shapes already match.
 */
std::pair<Eigen::MatrixXd, Eigen::MatrixXd> pad_to_common_shape(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    PadMode mode
);

/**
 * Run the preprocessing pipeline on A (transformed) and B (reference).
 *
 * @throws ShapeError if the weight vector does not match the rows of A
 * @throws InvalidArgumentError if a weight is negative
 * @throws NumericalError if check_finite is set and an input holds NaN/Inf
 * @throws DegenerateInputError if scaling is requested for a zero matrix
 */
std::pair<Eigen::MatrixXd, Eigen::MatrixXd> setup_input_arrays(
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const PreprocessOptions& options
);

} // namespace procrustes

#endif // PROCRUSTES_UTILS_H
