/**
 * @file test_hamiltonian.cpp
 * @brief Tests for the model, the charge sector and the assembled many-body Hamiltonian.
 *
 * Validates:
 *  - Hopping matrix built from links and symmetrized
 *  - Diagonal terms (onsite with -U/2 shift, interaction U/2 n^2)
 *  - Hopping matrix elements with bosonic normalization
 *  - Hermiticity, single boson reduction, coordinate <-> compressed row
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "hamiltonian.hpp"
#include "neighbours.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <Eigen/Dense>
#include <Eigen/Eigenvalues>

// ============================================================================
// Test Utilities
// ============================================================================

static Eigen::MatrixXd dense(const BH::SparseHamiltonian& H) {
    return Eigen::MatrixXd(H);
}

static double asymmetry(const BH::SparseHamiltonian& H) {
    const Eigen::MatrixXd D = dense(H);
    return (D - D.transpose()).cwiseAbs().maxCoeff();
}

// ============================================================================
// Model
// ============================================================================

TEST_CASE("Model: hopping matrix from links", "[model]") {
    SECTION("Default amplitude and symmetrization") {
        const BH::Model model({0, 0, 0}, {{0, 1}, {1, 2, 0.5}}, 1.0);
        const Eigen::MatrixXd H0 = model.hopping();
        Eigen::MatrixXd expected(3, 3);
        expected << 0, -1, 0,
                   -1, 0, 0.5,
                    0, 0.5, 0;
        REQUIRE(H0 == expected);
    }

    SECTION("Repeated and reversed links accumulate") {
        const BH::Model model({0, 0}, {{0, 1}, {1, 0}, {0, 1, 0.25}}, 0.0);
        const Eigen::MatrixXd H0 = model.hopping();
        REQUIRE(H0(0, 1) == Approx(-1.75));
        REQUIRE(H0(1, 0) == Approx(-1.75));
        REQUIRE(H0(0, 0) == 0.0);
    }

    SECTION("Onsite energies") {
        const BH::Model model({1.0, -0.5}, {}, 3.0);
        REQUIRE(model.sites() == 2);
        REQUIRE(model.interaction() == 3.0);
        REQUIRE(model.onsite() == Eigen::Vector2d(1.0, -0.5));
        REQUIRE(model.shifted_onsite() == Eigen::Vector2d(-0.5, -2.0));
    }
}

TEST_CASE("Model: invalid parameters", "[model]") {
    REQUIRE_THROWS_AS(BH::Model({}, {}, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(BH::Model({0, 0, 0}, {{0, 3}}, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(BH::Model({0, 0, 0}, {{-1, 2}}, 1.0), std::invalid_argument);
    REQUIRE_THROWS_WITH(BH::Model({0, 0}, {{0, 1}, {1, 5}}, 1.0), Catch::Contains("1 -> 5"));

    const BH::Model model({0, 0}, {{0, 1}}, 1.0);
    REQUIRE_THROWS_AS(model.chargestate(-1), std::invalid_argument);
}

// The sector borrows its model, so temporaries are rejected at compile time:
// ChargeState(Model&&, int) and Model::chargestate(int) const&& are deleted.
static_assert(std::is_constructible<BH::ChargeState, const BH::Model&, int>::value,
              "a sector is built over a named model");
static_assert(!std::is_constructible<BH::ChargeState, BH::Model&&, int>::value,
              "a sector cannot borrow a temporary model");

// ============================================================================
// Charge sector
// ============================================================================

TEST_CASE("ChargeState: basis introspection", "[sector]") {
    const BH::Model model({0, 0, 0, 0}, Neighbours::chain_links(4), 2.0);
    const BH::ChargeState sector = model.chargestate(2);
    REQUIRE(sector.sites() == 4);
    REQUIRE(sector.bosons() == 2);
    REQUIRE(sector.size() == 10);
    REQUIRE(sector.basis() == BH::generate_basis(4, 2));
    REQUIRE(&sector.index().states() == &sector.basis());
    for (int k = 0; k < sector.size(); ++k) {
        REQUIRE(sector.index().index_of(sector.basis().col(k)) == k);
    }
}

// ============================================================================
// Diagonal terms
// ============================================================================

TEST_CASE("Diagonal: onsite and interaction terms", "[diagonal]") {
    const Eigen::MatrixXi states = BH::generate_basis(2, 2);

    const Eigen::VectorXd onsite = BH::onsite_hamiltonian(Eigen::Vector2d(-1.0, -1.0), states);
    REQUIRE(onsite == Eigen::Vector3d(-2.0, -2.0, -2.0));

    const Eigen::VectorXd tilted = BH::onsite_hamiltonian(Eigen::Vector2d(0.5, 2.0), states);
    REQUIRE(tilted == Eigen::Vector3d(1.0, 2.5, 4.0));

    const Eigen::VectorXd interaction = BH::interaction_hamiltonian(2.0, states);
    REQUIRE(interaction == Eigen::Vector3d(4.0, 2.0, 4.0));

    REQUIRE_THROWS_AS(BH::onsite_hamiltonian(Eigen::Vector3d(0, 0, 0), states), std::invalid_argument);
}

TEST_CASE("Diagonal: n(n-1) interaction after the onsite shift", "[diagonal]") {
    const double U = 1.5;
    const BH::Model model({0.2, -0.3, 0.7}, {}, U);
    const BH::ChargeState sector = model.chargestate(4);
    const Eigen::MatrixXd H = dense(sector.hamiltonian());

    for (int k = 0; k < sector.size(); ++k) {
        double expected = 0.0;
        for (int i = 0; i < 3; ++i) {
            const double ni = sector.basis()(i, k);
            expected += model.onsite()[i] * ni + 0.5 * U * ni * (ni - 1);
        }
        REQUIRE(H(k, k) == Approx(expected));
    }
}

// ============================================================================
// Hopping term
// ============================================================================

TEST_CASE("Hopping: bosonic matrix elements", "[hopping]") {
    const BH::Model model({0, 0}, {{0, 1}}, 2.0);
    const BH::ChargeState sector = model.chargestate(2);

    SECTION("Coordinate entries") {
        const BH::CooMatrix coo = BH::hopping_hamiltonian(sector.index(), model.hopping());
        REQUIRE(coo.n_rows == 3);
        REQUIRE(coo.n_cols == 3);
        REQUIRE(coo.values.size() == 4);
        // site 0 -> 1 from [2,0] and [1,1]
        REQUIRE(coo.rows[0] == 0);
        REQUIRE(coo.cols[0] == 1);
        REQUIRE(coo.values[0] == Approx(-std::sqrt(2.0)));
        REQUIRE(coo.rows[1] == 1);
        REQUIRE(coo.cols[1] == 2);
        REQUIRE(coo.values[1] == Approx(-std::sqrt(2.0)));
    }

    SECTION("Assembled matrix") {
        const Eigen::MatrixXd H = dense(sector.hamiltonian());
        const double s = std::sqrt(2.0);
        Eigen::MatrixXd expected(3, 3);
        expected << 2, -s, 0,
                   -s, 0, -s,
                    0, -s, 2;
        REQUIRE((H - expected).cwiseAbs().maxCoeff() < 1e-12);
    }

    SECTION("Free bosons on two sites") {
        const BH::Model hopping_only({0, 0}, {{0, 1}}, 0.0);
        const BH::ChargeState pair = hopping_only.chargestate(2);
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(dense(pair.hamiltonian()));
        REQUIRE(solver.eigenvalues()[0] == Approx(-2.0));
        REQUIRE(solver.eigenvalues()[1] == Approx(0.0).margin(1e-12));
        REQUIRE(solver.eigenvalues()[2] == Approx(2.0));
    }

    SECTION("Hopping matrix of the wrong size") {
        REQUIRE_THROWS_AS(BH::hopping_hamiltonian(sector.index(), Eigen::MatrixXd::Zero(3, 3)), std::invalid_argument);
    }

    SECTION("Destination state missing from a truncated basis") {
        // [2,0] and [1,1] only, the hop 0 -> 1 from [1,1] leads to the missing [0,2]
        const Eigen::MatrixXi truncated = BH::generate_basis(2, 2).leftCols(2);
        const BH::BasisIndex index(truncated);
        REQUIRE_THROWS_AS(BH::hopping_hamiltonian(index, model.hopping()), BH::BasisLookupError);
        REQUIRE_THROWS_WITH(BH::hopping_hamiltonian(index, model.hopping()), Catch::Contains("0 -> 1"));
        REQUIRE_THROWS_WITH(BH::hopping_hamiltonian(index, model.hopping()), Catch::Contains("from state 1 [1, 1]"));
        REQUIRE_THROWS_WITH(BH::hopping_hamiltonian(index, model.hopping()), Catch::Contains("[0, 2]"));
    }
}

// ============================================================================
// Properties of the assembled Hamiltonian
// ============================================================================

TEST_CASE("Hamiltonian: Hermiticity", "[hamiltonian]") {
    SECTION("Ring with interaction") {
        const BH::Model model({0, 0.1, 0.2, 0.3, 0.4}, Neighbours::chain_links(5), 2.0);
        REQUIRE(asymmetry(model.chargestate(3).hamiltonian()) < 1e-12);
    }

    SECTION("Irregular links and amplitudes") {
        const BH::Model model({1, -1, 0.5, 0},
                              {{0, 1, 0.3}, {0, 2, -0.7}, {3, 1, 1.1}, {2, 3}, {1, 2, 0.05}},
                              0.8);
        for (int nb = 0; nb <= 4; ++nb) {
            INFO("nb = " << nb);
            REQUIRE(asymmetry(model.chargestate(nb).hamiltonian()) < 1e-12);
        }
    }

    SECTION("Square lattice") {
        const BH::Model model(std::vector<double>(9, 0.0), Neighbours::square_links(9), 1.0);
        REQUIRE(asymmetry(model.chargestate(2).hamiltonian()) < 1e-12);
    }
}

TEST_CASE("Hamiltonian: single boson reduces to the hopping matrix", "[hamiltonian]") {
    const std::vector<double> omegas = {0.5, -1.25, 2.0, 0.75};
    const BH::Model model(omegas, {{0, 1, -0.4}, {1, 2, 0.9}, {2, 3}, {3, 0, 0.2}, {0, 2, 1.5}}, 3.0);
    const BH::ChargeState sector = model.chargestate(1);
    REQUIRE(sector.size() == 4);

    const Eigen::MatrixXd H = dense(sector.hamiltonian());
    Eigen::MatrixXd expected = model.hopping();
    for (int i = 0; i < 4; ++i) {
        expected(i, i) += omegas[i];
    }
    REQUIRE((H - expected).cwiseAbs().maxCoeff() < 1e-12);
}

TEST_CASE("Hamiltonian: two bosons on two uncoupled sites", "[hamiltonian]") {
    const BH::Model model({0, 0}, {}, 2.0);
    const BH::ChargeState sector = model.chargestate(2);

    Eigen::MatrixXi expected_basis(2, 3);
    expected_basis << 2, 1, 0,
                      0, 1, 2;
    REQUIRE(sector.basis() == expected_basis);

    const BH::SparseHamiltonian H = sector.hamiltonian();
    REQUIRE(H.rows() == 3);
    REQUIRE(H.cols() == 3);
    REQUIRE(H.nonZeros() == 3);
    const Eigen::MatrixXd D = dense(H);
    REQUIRE(D.diagonal() == Eigen::Vector3d(2.0, 0.0, 2.0));
    REQUIRE((D - Eigen::MatrixXd(D.diagonal().asDiagonal())).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("Hamiltonian: single boson on a three site ring", "[hamiltonian]") {
    const BH::Model model({0, 0, 0}, {{0, 1, -1}, {1, 2, -1}, {2, 0, -1}}, 2.0);
    const BH::ChargeState sector = model.chargestate(1);

    const Eigen::MatrixXd H = dense(sector.hamiltonian());
    Eigen::MatrixXd expected(3, 3);
    expected << 0, -1, -1,
               -1, 0, -1,
               -1, -1, 0;
    REQUIRE((H - expected).cwiseAbs().maxCoeff() < 1e-12);
    REQUIRE(model.hopping() == expected);
}

TEST_CASE("Hamiltonian: empty sector", "[hamiltonian]") {
    const BH::Model model({0.3, 0.4}, {{0, 1}}, 5.0);
    const BH::ChargeState sector = model.chargestate(0);
    REQUIRE(sector.size() == 1);
    const Eigen::MatrixXd H = dense(sector.hamiltonian());
    REQUIRE(H.rows() == 1);
    REQUIRE(H(0, 0) == 0.0);
}

// ============================================================================
// Sparse formats
// ============================================================================

TEST_CASE("Sparse formats: coordinate and compressed row", "[sparse]") {
    SECTION("Duplicates are summed") {
        BH::CooMatrix coo;
        coo.n_rows = 2;
        coo.n_cols = 3;
        coo.rows = {0, 1, 0, 1};
        coo.cols = {2, 0, 2, 1};
        coo.values = {1.0, 2.0, 0.5, -1.0};
        const BH::SparseHamiltonian H = BH::to_csr(coo);
        REQUIRE(H.rows() == 2);
        REQUIRE(H.cols() == 3);
        REQUIRE(H.nonZeros() == 3);
        REQUIRE(H.coeff(0, 2) == Approx(1.5));
        REQUIRE(H.coeff(1, 0) == Approx(2.0));
        REQUIRE(H.coeff(1, 1) == Approx(-1.0));
    }

    SECTION("Compressed row back to coordinates, row by row") {
        const BH::Model model({0, 0, 0}, Neighbours::chain_links(3), 1.0);
        const BH::SparseHamiltonian H = model.chargestate(2).hamiltonian();
        const BH::CooMatrix coo = BH::to_coo(H);
        REQUIRE(coo.n_rows == H.rows());
        REQUIRE(coo.values.size() == static_cast<std::size_t>(H.nonZeros()));
        for (std::size_t e = 1; e < coo.rows.size(); ++e) {
            REQUIRE(coo.rows[e - 1] <= coo.rows[e]);
        }
        REQUIRE(dense(BH::to_csr(coo)) == dense(H));
    }

    SECTION("Malformed coordinate lists") {
        BH::CooMatrix coo;
        coo.n_rows = 2;
        coo.n_cols = 2;
        coo.rows = {0, 2};
        coo.cols = {0, 0};
        coo.values = {1.0, 1.0};
        REQUIRE_THROWS_AS(BH::to_csr(coo), std::invalid_argument);
        coo.rows = {0};
        REQUIRE_THROWS_AS(BH::to_csr(coo), std::invalid_argument);
    }
}
