#include <catch2/catch.hpp>

#include "errors.h"
#include "kopt.h"
#include "result.h"

using namespace procrustes;

namespace {

Eigen::MatrixXd columns_example() {
    Eigen::MatrixXd A(4, 4);
    A << 1, 5, 8, 4,
         1, 5, 7, 2,
         1, 6, 9, 3,
         2, 7, 9, 4;
    return A;
}

Eigen::MatrixXd columns_permutation() {
    Eigen::MatrixXd P(4, 4);
    P << 0, 0, 0, 1,
         0, 0, 1, 0,
         1, 0, 0, 0,
         0, 1, 0, 0;
    return P;
}

} // namespace

TEST_CASE("is_permutation_matrix", "[kopt]") {
    REQUIRE(is_permutation_matrix(Eigen::MatrixXd::Identity(3, 3)));
    REQUIRE(is_permutation_matrix(columns_permutation()));
    REQUIRE(is_permutation_matrix(Eigen::MatrixXd(0, 0)));

    Eigen::MatrixXd doubled = Eigen::MatrixXd::Identity(3, 3);
    doubled(0, 1) = 1.0;
    REQUIRE_FALSE(is_permutation_matrix(doubled));

    Eigen::MatrixXd fractional = Eigen::MatrixXd::Constant(2, 2, 0.5);
    REQUIRE_FALSE(is_permutation_matrix(fractional));

    REQUIRE_FALSE(is_permutation_matrix(Eigen::MatrixXd::Identity(3, 2)));
}

TEST_CASE("kopt_heuristic_single recovers a column permutation", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd P = columns_permutation();
    Eigen::MatrixXd B = A * P;
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    SECTION("k = 2") {
        KoptOptions options;
        options.k = 2;
        KoptResult r = kopt_heuristic_single(A, B, I, options);
        REQUIRE(r.permutation == P);
        REQUIRE(r.error == Approx(0.0).margin(1e-10));
        REQUIRE(r.moves == 3);
        REQUIRE(is_permutation_matrix(r.permutation));
    }

    SECTION("k = 3") {
        KoptOptions options;
        options.k = 3;
        KoptResult r = kopt_heuristic_single(A, B, I, options);
        REQUIRE(r.permutation == P);
        REQUIRE(r.error == Approx(0.0).margin(1e-10));
    }

    SECTION("k equal to the size") {
        KoptOptions options;
        options.k = 4;
        KoptResult r = kopt_heuristic_single(A, B, I, options);
        REQUIRE(r.permutation == P);
    }
}

TEST_CASE("kopt_heuristic_single never increases the error", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd B(4, 4);
    B << 3, 1, 0, 2,
         6, 2, 1, 9,
         0, 4, 4, 1,
         5, 5, 2, 8;

    Objective fun = [&](const Eigen::MatrixXd& P) {
        return frobenius_error(A, B, P);
    };

    Eigen::MatrixXd p0 = columns_permutation();
    double initial = fun(p0);
    for (int k : {2, 3, 4}) {
        KoptOptions options;
        options.k = k;
        KoptResult r = kopt_heuristic_single(fun, p0, options);
        REQUIRE(r.error <= initial);
        REQUIRE(r.error == Approx(fun(r.permutation)));
        REQUIRE(is_permutation_matrix(r.permutation));
    }
}

TEST_CASE("kopt_heuristic_single stops at the tolerance", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd B = A * columns_permutation();
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    SECTION("Initial error already within tolerance") {
        KoptOptions options;
        options.tol = 300.0;
        KoptResult r = kopt_heuristic_single(A, B, I, options);
        REQUIRE(r.moves == 0);
        REQUIRE(r.permutation == I);
        REQUIRE(r.error == Approx(270.0));
    }

    SECTION("Stops after the first move that reaches the tolerance") {
        KoptOptions options;
        options.k = 2;
        options.tol = 100.0;
        KoptResult r = kopt_heuristic_single(A, B, I, options);
        REQUIRE(r.moves == 1);
        REQUIRE(r.error == Approx(88.0));
    }

    SECTION("Exact match returns immediately") {
        KoptResult r = kopt_heuristic_single(A, A, I);
        REQUIRE(r.moves == 0);
        REQUIRE(r.error == 0.0);
    }
}

TEST_CASE("kopt_heuristic_single without an improving move is not an error", "[kopt]") {
    Eigen::MatrixXd A = Eigen::MatrixXd::Identity(2, 2);
    Eigen::MatrixXd B(2, 2);
    B << 2, 0,
         0, 1;

    KoptOptions options;
    options.k = 2;
    KoptResult r = kopt_heuristic_single(A, B, Eigen::MatrixXd::Identity(2, 2), options);
    REQUIRE(r.moves == 0);
    REQUIRE(r.error == Approx(1.0));
    REQUIRE(r.permutation == Eigen::MatrixXd::Identity(2, 2));
}

TEST_CASE("kopt_heuristic_single is deterministic", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd B(4, 4);
    B << 4, 4, 1, 5,
         2, 7, 1, 5,
         3, 9, 1, 6,
         4, 9, 2, 7;
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    KoptOptions options;
    options.k = 2;
    KoptResult first = kopt_heuristic_single(A, B, I, options);
    KoptResult second = kopt_heuristic_single(A, B, I, options);
    REQUIRE(first.permutation == second.permutation);
    REQUIRE(first.error == second.error);
    REQUIRE(first.moves == second.moves);
}

TEST_CASE("kopt_heuristic_single validates its arguments", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    SECTION("k below 2") {
        KoptOptions options;
        options.k = 1;
        REQUIRE_THROWS_AS(kopt_heuristic_single(A, A, I, options), InvalidArgumentError);
    }

    SECTION("k above the size") {
        KoptOptions options;
        options.k = 5;
        REQUIRE_THROWS_AS(kopt_heuristic_single(A, A, I, options), InvalidArgumentError);
    }

    SECTION("Negative tolerance") {
        KoptOptions options;
        options.tol = -1.0;
        REQUIRE_THROWS_AS(kopt_heuristic_single(A, A, I, options), InvalidArgumentError);
    }

    SECTION("Initial matrix is not a permutation") {
        Eigen::MatrixXd p0 = I;
        p0(0, 0) = 0.5;
        REQUIRE_THROWS_AS(kopt_heuristic_single(A, A, p0), InvalidArgumentError);
    }

    SECTION("Initial matrix is not square") {
        Objective fun = [](const Eigen::MatrixXd&) { return 1.0; };
        REQUIRE_THROWS_AS(kopt_heuristic_single(fun, Eigen::MatrixXd::Identity(4, 3)), ShapeError);
    }

    SECTION("A and B do not fit A P - B") {
        REQUIRE_THROWS_AS(kopt_heuristic_single(A, Eigen::MatrixXd::Ones(3, 4), I), ShapeError);
    }
}

TEST_CASE("kopt_heuristic_double recovers both permutations", "[kopt]") {
    SECTION("3 x 3") {
        Eigen::MatrixXd A(3, 3);
        A << 1, 2, 3,
             4, 5, 6,
             7, 8, 10;
        Eigen::MatrixXd P(3, 3);
        P << 0, 1, 0,
             1, 0, 0,
             0, 0, 1;
        Eigen::MatrixXd Q(3, 3);
        Q << 0, 0, 1,
             1, 0, 0,
             0, 1, 0;
        Eigen::MatrixXd B = P * A * Q;

        KoptOptions options;
        options.k = 2;
        KoptDoubleResult r = kopt_heuristic_double(A, B, std::nullopt, std::nullopt, options);
        REQUIRE(r.left == P);
        REQUIRE(r.right == Q);
        REQUIRE(r.error == Approx(0.0).margin(1e-10));
        REQUIRE(r.moves == 3);
    }

    SECTION("4 x 4") {
        Eigen::MatrixXd A = columns_example();
        Eigen::MatrixXd P(4, 4);
        P << 0, 0, 1, 0,
             1, 0, 0, 0,
             0, 0, 0, 1,
             0, 1, 0, 0;
        Eigen::MatrixXd Q = columns_permutation();
        Eigen::MatrixXd B = P * A * Q;

        for (int k : {2, 3}) {
            KoptOptions options;
            options.k = k;
            KoptDoubleResult r = kopt_heuristic_double(A, B, std::nullopt, std::nullopt, options);
            REQUIRE(r.error == Approx(0.0).margin(1e-10));
            REQUIRE(r.left == P);
            REQUIRE(r.right == Q);
            REQUIRE(is_permutation_matrix(r.left));
            REQUIRE(is_permutation_matrix(r.right));
        }
    }

    SECTION("Rectangular input") {
        Eigen::MatrixXd A(2, 3);
        A << 1, 2, 3,
             4, 5, 6;
        Eigen::MatrixXd P(2, 2);
        P << 0, 1,
             1, 0;
        Eigen::MatrixXd Q(3, 3);
        Q << 0, 0, 1,
             1, 0, 0,
             0, 1, 0;
        Eigen::MatrixXd B = P * A * Q;

        KoptOptions options;
        options.k = 2;
        KoptDoubleResult r = kopt_heuristic_double(A, B, std::nullopt, std::nullopt, options);
        REQUIRE(r.error == Approx(0.0).margin(1e-10));
        REQUIRE(r.left.rows() == 2);
        REQUIRE(r.right.rows() == 3);
    }
}

TEST_CASE("kopt_heuristic_double stops at the tolerance", "[kopt]") {
    Eigen::MatrixXd A(3, 3);
    A << 1, 2, 3,
         4, 5, 6,
         7, 8, 10;
    Eigen::MatrixXd P(3, 3);
    P << 0, 1, 0,
         1, 0, 0,
         0, 0, 1;
    Eigen::MatrixXd Q(3, 3);
    Q << 0, 0, 1,
         1, 0, 0,
         0, 1, 0;
    Eigen::MatrixXd B = P * A * Q;
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(3, 3);

    int right_side_calls = 0;
    DoubleObjective fun = [&](const Eigen::MatrixXd& left, const Eigen::MatrixXd& right) {
        if (right != I) {
            ++right_side_calls;
        }
        return frobenius_error(A, B, left, right);
    };

    SECTION("Initial error already within tolerance") {
        KoptOptions options;
        options.k = 2;
        options.tol = 100.0;
        KoptDoubleResult r = kopt_heuristic_double(fun, I, I, options);
        REQUIRE(r.moves == 0);
        REQUIRE(r.error == Approx(80.0));
        REQUIRE(r.left == I);
        REQUIRE(r.right == I);
    }

    SECTION("Left move reaching the tolerance skips the right side") {
        KoptOptions options;
        options.k = 2;
        options.tol = 30.0;
        KoptDoubleResult r = kopt_heuristic_double(fun, I, I, options);
        REQUIRE(r.moves == 1);
        REQUIRE(r.error == Approx(26.0));
        REQUIRE(r.left == P);
        REQUIRE(r.right == I);
        REQUIRE(right_side_calls == 0);
    }
}

TEST_CASE("kopt_heuristic_double with an objective callable", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd B(4, 4);
    B << 3, 1, 0, 2,
         6, 2, 1, 9,
         0, 4, 4, 1,
         5, 5, 2, 8;
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    int calls = 0;
    DoubleObjective fun = [&](const Eigen::MatrixXd& P, const Eigen::MatrixXd& Q) {
        ++calls;
        return frobenius_error(A, B, P, Q);
    };

    KoptDoubleResult r = kopt_heuristic_double(fun, I, I);
    REQUIRE(calls > 1);
    REQUIRE(r.error <= frobenius_error(A, B, I, I));
    REQUIRE(r.error == Approx(frobenius_error(A, B, r.left, r.right)));
    REQUIRE(is_permutation_matrix(r.left));
    REQUIRE(is_permutation_matrix(r.right));
}

TEST_CASE("kopt_heuristic_double validates its arguments", "[kopt]") {
    Eigen::MatrixXd A = columns_example();
    Eigen::MatrixXd I = Eigen::MatrixXd::Identity(4, 4);

    SECTION("A and B differ in shape") {
        REQUIRE_THROWS_AS(kopt_heuristic_double(A, Eigen::MatrixXd::Ones(4, 3)), ShapeError);
    }

    SECTION("Initial permutations do not match A") {
        REQUIRE_THROWS_AS(
            kopt_heuristic_double(A, A, Eigen::MatrixXd(Eigen::MatrixXd::Identity(3, 3))),
            ShapeError
        );
    }

    SECTION("k above the smaller side") {
        Eigen::MatrixXd wide = Eigen::MatrixXd::Ones(2, 4);
        KoptOptions options;
        options.k = 3;
        REQUIRE_THROWS_AS(
            kopt_heuristic_double(wide, wide, std::nullopt, std::nullopt, options),
            InvalidArgumentError
        );
    }

    SECTION("k below 2") {
        KoptOptions options;
        options.k = 0;
        REQUIRE_THROWS_AS(kopt_heuristic_double(A, A, I, I, options), InvalidArgumentError);
    }

    SECTION("Non-permutation q0") {
        Eigen::MatrixXd q0 = Eigen::MatrixXd::Ones(4, 4);
        REQUIRE_THROWS_AS(kopt_heuristic_double(A, A, I, q0), InvalidArgumentError);
    }
}
