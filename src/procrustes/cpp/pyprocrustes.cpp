#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "decomposition.h"
#include "errors.h"
#include "generic.h"
#include "kopt.h"
#include "permutation.h"
#include "result.h"
#include "utils.h"
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

void fill_preprocess(
    procrustes::PreprocessOptions& options,
    bool pad,
    bool translate,
    bool scale,
    bool unpad_col,
    bool unpad_row,
    bool check_finite,
    const std::optional<Eigen::VectorXd>& weight
) {
    options.pad = pad;
    options.translate = translate;
    options.scale = scale;
    options.unpad_col = unpad_col;
    options.unpad_row = unpad_row;
    options.check_finite = check_finite;
    options.weight = weight;
}

} // namespace

PYBIND11_MODULE(procrustes_core_py, m) {
    m.doc() = "Procrustes analysis module - C++ implementation with Eigen";

    // Base classes first: the most recently registered translator is tried first
    auto& base = py::register_exception<procrustes::ProcrustesError>(m, "ProcrustesError");
    py::register_exception<procrustes::ShapeError>(m, "ShapeError", base.ptr());
    auto& invalid = py::register_exception<procrustes::InvalidArgumentError>(m, "InvalidArgumentError", base.ptr());
    py::register_exception<procrustes::InvalidDriverError>(m, "InvalidDriverError", invalid.ptr());
    auto& degenerate = py::register_exception<procrustes::DegenerateInputError>(m, "DegenerateInputError", base.ptr());
    py::register_exception<procrustes::NotDiagonalizableError>(m, "NotDiagonalizableError", degenerate.ptr());
    py::register_exception<procrustes::NumericalError>(m, "NumericalError", base.ptr());

    py::class_<procrustes::ProcrustesResult>(m, "ProcrustesResult")
        .def_property_readonly("error", &procrustes::ProcrustesResult::error)
        .def_property_readonly("new_a", &procrustes::ProcrustesResult::new_a)
        .def_property_readonly("new_b", &procrustes::ProcrustesResult::new_b)
        .def_property_readonly("t", &procrustes::ProcrustesResult::transformation)
        .def_property_readonly("s", &procrustes::ProcrustesResult::secondary_transformation)
        .def("__repr__", [](const procrustes::ProcrustesResult& r) {
            return "<ProcrustesResult error=" + std::to_string(r.error()) + ">";
        });

    py::class_<procrustes::KoptResult>(m, "KoptResult")
        .def_readonly("p", &procrustes::KoptResult::permutation)
        .def_readonly("error", &procrustes::KoptResult::error)
        .def_readonly("moves", &procrustes::KoptResult::moves);

    py::class_<procrustes::KoptDoubleResult>(m, "KoptDoubleResult")
        .def_readonly("p", &procrustes::KoptDoubleResult::left)
        .def_readonly("q", &procrustes::KoptDoubleResult::right)
        .def_readonly("error", &procrustes::KoptDoubleResult::error)
        .def_readonly("moves", &procrustes::KoptDoubleResult::moves);

    // Preprocessing
    m.def("trim_padding",
          py::overload_cast<const Eigen::MatrixXd&>(&procrustes::trim_padding),
          py::arg("array"),
          "Remove trailing zero rows (bottom) and columns (right)");

    m.def("translate_to_origin",
          [](const Eigen::MatrixXd& a, const std::optional<Eigen::MatrixXd>& reference) {
              procrustes::TranslateResult r = reference
                  ? procrustes::translate_to_origin(a, *reference)
                  : procrustes::translate_to_origin(a);
              return py::make_tuple(r.matrix, r.translation);
          },
          py::arg("array"),
          py::arg("reference") = py::none(),
          R"pbdoc(
              Translate array so its centroid sits at the origin, or at the
              centroid of reference when given.

              Returns
              -------
              (numpy.ndarray, numpy.ndarray)
                  Translated array and the translation vector added to each row.
          )pbdoc");

    m.def("scale_unit_norm",
          [](const Eigen::MatrixXd& a, const std::optional<Eigen::MatrixXd>& reference) {
              procrustes::ScaleResult r = reference
                  ? procrustes::scale_unit_norm(a, *reference)
                  : procrustes::scale_unit_norm(a);
              return py::make_tuple(r.matrix, r.factor);
          },
          py::arg("array"),
          py::arg("reference") = py::none(),
          "Scale array to unit Frobenius norm, or to the norm of reference when given");

    m.def("pad_to_common_shape",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, const std::string& mode) {
              return procrustes::pad_to_common_shape(a, b, procrustes::parse_pad_mode(mode));
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("mode") = "row-col",
          "Zero-pad a and b to matching shape; mode is 'row', 'col', 'row-col' or 'square'");

    m.def("compute_centroid", &procrustes::compute_centroid, py::arg("array"),
          "Column-wise mean of array");

    m.def("frobenius_norm", &procrustes::frobenius_norm, py::arg("array"));

    m.def("setup_input_arrays",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b,
             bool pad, bool translate, bool scale, bool unpad_col, bool unpad_row,
             bool check_finite, const std::optional<Eigen::VectorXd>& weight,
             const std::string& pad_mode) {
              procrustes::PreprocessOptions options;
              fill_preprocess(options, pad, translate, scale, unpad_col, unpad_row, check_finite, weight);
              options.pad_mode = procrustes::parse_pad_mode(pad_mode);
              return procrustes::setup_input_arrays(a, b, options);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("pad") = true,
          py::arg("translate") = false,
          py::arg("scale") = false,
          py::arg("unpad_col") = false,
          py::arg("unpad_row") = false,
          py::arg("check_finite") = true,
          py::arg("weight") = py::none(),
          py::arg("pad_mode") = "row-col",
          R"pbdoc(
              Run the preprocessing pipeline (unpad, translate, weight, scale, pad).

              Returns
              -------
              (numpy.ndarray, numpy.ndarray)
                  Prepared a and b.
          )pbdoc");

    // Decompositions
    m.def("svd",
          [](const Eigen::MatrixXd& a, const std::string& driver) {
              procrustes::SVDResult r = procrustes::svd(a, procrustes::parse_pinv_driver(driver));
              return py::make_tuple(r.U, r.singular_values, r.V);
          },
          py::arg("array"),
          py::arg("driver") = "robust",
          "Singular value decomposition, returns (U, s, V) with a = U diag(s) V^T");

    m.def("symmetric_eigendecomposition",
          [](const Eigen::MatrixXd& a, bool arrange_rows) {
              procrustes::EigenResult r = procrustes::symmetric_eigendecomposition(a, arrange_rows);
              return py::make_tuple(r.eigenvalues, r.eigenvectors);
          },
          py::arg("array"),
          py::arg("arrange_rows") = false,
          "Eigendecomposition of a symmetric matrix, eigenvalues sorted descending");

    m.def("is_diagonalizable", &procrustes::is_diagonalizable, py::arg("array"));

    m.def("matrix_rank", &procrustes::matrix_rank, py::arg("array"),
          "Number of singular values above s_max * max(shape) * eps");

    m.def("pseudo_inverse",
          [](const Eigen::MatrixXd& a, const std::string& driver) {
              return procrustes::pseudo_inverse(a, procrustes::parse_pinv_driver(driver));
          },
          py::arg("array"),
          py::arg("driver") = "robust",
          "Moore-Penrose pseudo-inverse through the selected SVD driver");

    // Error model
    m.def("frobenius_error",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b,
             const std::optional<Eigen::MatrixXd>& left,
             const std::optional<Eigen::MatrixXd>& right) {
              Eigen::MatrixXd l = left ? *left : Eigen::MatrixXd::Identity(b.rows(), a.rows());
              Eigen::MatrixXd r = right ? *right : Eigen::MatrixXd::Identity(a.cols(), b.cols());
              return procrustes::frobenius_error(a, b, l, r);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("left") = py::none(),
          py::arg("right") = py::none(),
          "Squared Frobenius norm of left @ a @ right - b");

    // Solvers
    m.def("generic",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b,
             bool pad, bool translate, bool scale, bool unpad_col, bool unpad_row,
             bool check_finite, const std::optional<Eigen::VectorXd>& weight,
             const std::string& driver) {
              procrustes::GenericOptions options;
              fill_preprocess(options, pad, translate, scale, unpad_col, unpad_row, check_finite, weight);
              options.driver = procrustes::parse_pinv_driver(driver);
              return procrustes::generic(a, b, options);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("pad") = true,
          py::arg("translate") = false,
          py::arg("scale") = false,
          py::arg("unpad_col") = false,
          py::arg("unpad_row") = false,
          py::arg("check_finite") = true,
          py::arg("weight") = py::none(),
          py::arg("driver") = "robust",
          R"pbdoc(
              Generic one-sided Procrustes: min ||a t - b|| over all real t.

              Parameters
              ----------
              a : numpy.ndarray
                  Matrix to be transformed
              b : numpy.ndarray
                  Reference matrix
              driver : str, optional
                  Pseudo-inverse SVD driver, "robust" (gesvd) or "fast" (gesdd)

              Returns
              -------
              ProcrustesResult
          )pbdoc");

    m.def("generic_batch",
          [](const std::vector<Eigen::MatrixXd>& as, const std::vector<Eigen::MatrixXd>& bs,
             bool pad, bool translate, bool scale, bool unpad_col, bool unpad_row,
             bool check_finite, const std::string& driver) {
              procrustes::GenericOptions options;
              fill_preprocess(options, pad, translate, scale, unpad_col, unpad_row, check_finite, std::nullopt);
              options.driver = procrustes::parse_pinv_driver(driver);
              py::gil_scoped_release release;
              return procrustes::generic_batch(as, bs, options);
          },
          py::arg("a_list"),
          py::arg("b_list"),
          py::arg("pad") = true,
          py::arg("translate") = false,
          py::arg("scale") = false,
          py::arg("unpad_col") = false,
          py::arg("unpad_row") = false,
          py::arg("check_finite") = true,
          py::arg("driver") = "robust",
          "Solve independent (a, b) pairs with generic(); results follow the input order");

    m.def("permutation",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b,
             bool pad, bool translate, bool scale, bool unpad_col, bool unpad_row,
             bool check_finite, const std::optional<Eigen::VectorXd>& weight,
             bool kopt, int kopt_k, double kopt_tol) {
              procrustes::PermutationOptions options;
              fill_preprocess(options, pad, translate, scale, unpad_col, unpad_row, check_finite, weight);
              options.kopt = kopt;
              options.kopt_k = kopt_k;
              options.kopt_tol = kopt_tol;
              return procrustes::permutation(a, b, options);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("pad") = true,
          py::arg("translate") = false,
          py::arg("scale") = false,
          py::arg("unpad_col") = false,
          py::arg("unpad_row") = false,
          py::arg("check_finite") = true,
          py::arg("weight") = py::none(),
          py::arg("kopt") = true,
          py::arg("kopt_k") = 3,
          py::arg("kopt_tol") = 1e-8,
          "One-sided permutation Procrustes (rounded least squares + k-opt)");

    m.def("snap_to_permutation", &procrustes::snap_to_permutation, py::arg("array"),
          "Round a square matrix to a permutation matrix by greedy largest-entry assignment");

    // K-opt refinement
    m.def("is_permutation_matrix", &procrustes::is_permutation_matrix,
          py::arg("array"),
          py::arg("tol") = 1e-8);

    m.def("kopt_heuristic_single",
          [](const procrustes::Objective& fun, const Eigen::MatrixXd& p0, int k, double tol) {
              procrustes::KoptOptions options;
              options.k = k;
              options.tol = tol;
              return procrustes::kopt_heuristic_single(fun, p0, options);
          },
          py::arg("fun"),
          py::arg("p0"),
          py::arg("k") = 3,
          py::arg("tol") = 1e-8,
          "Locally optimal permutation matrix for objective fun by k-opt column reorderings");

    m.def("kopt_heuristic_single",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, const Eigen::MatrixXd& p0,
             int k, double tol) {
              procrustes::KoptOptions options;
              options.k = k;
              options.tol = tol;
              return procrustes::kopt_heuristic_single(a, b, p0, options);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("p0"),
          py::arg("k") = 3,
          py::arg("tol") = 1e-8,
          "Locally optimal permutation matrix p minimizing ||a p - b|| by k-opt column reorderings");

    m.def("kopt_heuristic_double",
          [](const Eigen::MatrixXd& a, const Eigen::MatrixXd& b,
             const std::optional<Eigen::MatrixXd>& p0,
             const std::optional<Eigen::MatrixXd>& q0,
             int k, double tol) {
              procrustes::KoptOptions options;
              options.k = k;
              options.tol = tol;
              return procrustes::kopt_heuristic_double(a, b, p0, q0, options);
          },
          py::arg("a"),
          py::arg("b"),
          py::arg("p0") = py::none(),
          py::arg("q0") = py::none(),
          py::arg("k") = 3,
          py::arg("tol") = 1e-8,
          "Locally optimal (p, q) minimizing ||p a q - b|| by alternating k-opt searches");

    m.def("kopt_heuristic_double",
          [](const procrustes::DoubleObjective& fun, const Eigen::MatrixXd& p0,
             const Eigen::MatrixXd& q0, int k, double tol) {
              procrustes::KoptOptions options;
              options.k = k;
              options.tol = tol;
              return procrustes::kopt_heuristic_double(fun, p0, q0, options);
          },
          py::arg("fun"),
          py::arg("p0"),
          py::arg("q0"),
          py::arg("k") = 3,
          py::arg("tol") = 1e-8,
          "Locally optimal (p, q) for objective fun(p, q) by alternating k-opt searches");
}
