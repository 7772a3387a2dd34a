#include <cmath>
#include <cstddef>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "hamiltonian.hpp"


/////  IMPLEMENTATION OF THE MODEL AND OF THE HAMILTONIAN  /////


    /* MODEL */

BH::Model::Model(std::vector<double> omegas, std::vector<Link> links, double U)
    : links_(std::move(links)), U_(U) {
    const int m = static_cast<int>(omegas.size());
    if (m == 0) {
        throw std::invalid_argument("The model needs at least one site.");
    }
    for (const Link& link : links_) {
        if (link.from < 0 || link.from >= m || link.to < 0 || link.to >= m) {
            throw std::invalid_argument("The link " + std::to_string(link.from) + " -> " + std::to_string(link.to) + " refers to a site outside [0, " + std::to_string(m) + ").");
        }
    }
    omegas_ = Eigen::Map<const Eigen::VectorXd>(omegas.data(), m);
}

Eigen::VectorXd BH::Model::shifted_onsite() const {
    return (omegas_.array() - U_ / 2).matrix();
}

/* Build the hopping matrix from the links and symmetrize it */
Eigen::MatrixXd BH::Model::hopping() const {
    const int m = sites();
    Eigen::MatrixXd H0 = Eigen::MatrixXd::Zero(m, m);
    for (const Link& link : links_) {
        H0(link.from, link.to) += link.amplitude;
    }
    return H0 + H0.transpose();
}

BH::ChargeState BH::Model::chargestate(int nb) const& {
    return ChargeState(*this, nb);
}


    /* CHARGE SECTOR */

BH::ChargeState::ChargeState(const Model& model, int nb)
    : model_(model), nb_(nb), basis_(generate_basis(model.sites(), nb)), index_(basis_) {}

BH::SparseHamiltonian BH::ChargeState::hamiltonian() const {
    return assemble_hamiltonian(model_.shifted_onsite(), model_.hopping(), model_.interaction(), index_);
}


    /* FILL THE HAMILTONIAN OF THE SYSTEM */

/* Fill the onsite term of the Hamiltonian */
Eigen::VectorXd BH::onsite_hamiltonian(const Eigen::VectorXd& omegas, const Eigen::MatrixXi& states) {
    if (omegas.size() != states.rows()) {
        throw std::invalid_argument("Expected " + std::to_string(states.rows()) + " onsite energies, got " + std::to_string(omegas.size()) + ".");
    }
    return states.cast<double>().transpose() * omegas;
}

/* Fill the interaction term of the Hamiltonian */
Eigen::VectorXd BH::interaction_hamiltonian(double U, const Eigen::MatrixXi& states) {
    Eigen::VectorXd diagonal(states.cols());
    for (int k = 0; k < states.cols(); k++) {
        double value = 0;
        for (int i = 0; i < states.rows(); i++) {
            const double ni = states(i, k);
            value += ni * ni;
        }
        diagonal[k] = 0.5 * U * value;
    }
    return diagonal;
}

/* Fill the hopping term of the Hamiltonian: move one boson from i to l in every state occupying i */
BH::CooMatrix BH::hopping_hamiltonian(const BasisIndex& index, const Eigen::MatrixXd& H0) {
    const Eigen::MatrixXi& states = index.states();
    const int m = static_cast<int>(states.rows());
    if (H0.rows() != m || H0.cols() != m) {
        throw std::invalid_argument("The hopping matrix must be " + std::to_string(m) + "x" + std::to_string(m) + ".");
    }
    CooMatrix coo;
    coo.n_rows = index.size();
    coo.n_cols = index.size();
    for (int i = 0; i < m; i++) {
        std::vector<int> js; // states with a boson on site i
        for (int j = 0; j < states.cols(); j++) {
            if (states(i, j) > 0) {
                js.push_back(j);
            }
        }
        for (int l = 0; l < m; l++) {
            if (H0(i, l) == 0.0) {
                continue;
            }
            for (const int j : js) {
                Eigen::VectorXi state = states.col(j);
                state[i] -= 1;
                state[l] += 1;
                const int k = index.find(state);
                if (k < 0) {
                    throw BasisLookupError("Hopping " + std::to_string(i) + " -> " + std::to_string(l) + " from state " + std::to_string(j) + " " + state_string(states.col(j)) + " leads to " + state_string(state) + ", which is not in the basis.");
                }
                coo.rows.push_back(j);
                coo.cols.push_back(k);
                coo.values.push_back(H0(i, l) * std::sqrt(static_cast<double>(states(i, j)) * (states(l, j) + 1)));
            }
        }
    }
    return coo;
}

/* Create the Hamiltonian of the charge sector */
BH::SparseHamiltonian BH::assemble_hamiltonian(const Eigen::VectorXd& omegas, const Eigen::MatrixXd& H0, double U, const BasisIndex& index) {
    const Eigen::VectorXd diagonal = onsite_hamiltonian(omegas, index.states()) + interaction_hamiltonian(U, index.states());
    CooMatrix coo = hopping_hamiltonian(index, H0);
    coo.rows.reserve(coo.rows.size() + diagonal.size());
    coo.cols.reserve(coo.cols.size() + diagonal.size());
    coo.values.reserve(coo.values.size() + diagonal.size());
    for (int k = 0; k < diagonal.size(); k++) {
        coo.rows.push_back(k);
        coo.cols.push_back(k);
        coo.values.push_back(diagonal[k]);
    }
    return to_csr(coo);
}


    /* SPARSE FORMATS */

BH::SparseHamiltonian BH::to_csr(const CooMatrix& coo) {
    if (coo.rows.size() != coo.values.size() || coo.cols.size() != coo.values.size()) {
        throw std::invalid_argument("The row, column and value lists of a coordinate matrix must have the same length.");
    }
    std::vector<Eigen::Triplet<double>> tripletList;
    tripletList.reserve(coo.values.size());
    for (std::size_t e = 0; e < coo.values.size(); e++) {
        if (coo.rows[e] < 0 || coo.rows[e] >= coo.n_rows || coo.cols[e] < 0 || coo.cols[e] >= coo.n_cols) {
            throw std::invalid_argument("Entry (" + std::to_string(coo.rows[e]) + ", " + std::to_string(coo.cols[e]) + ") is outside the matrix.");
        }
        tripletList.push_back(Eigen::Triplet<double>(coo.rows[e], coo.cols[e], coo.values[e]));
    }
    SparseHamiltonian H(coo.n_rows, coo.n_cols);
    H.setFromTriplets(tripletList.begin(), tripletList.end());
    return H;
}

BH::CooMatrix BH::to_coo(const SparseHamiltonian& csr) {
    CooMatrix coo;
    coo.n_rows = static_cast<int>(csr.rows());
    coo.n_cols = static_cast<int>(csr.cols());
    coo.rows.reserve(csr.nonZeros());
    coo.cols.reserve(csr.nonZeros());
    coo.values.reserve(csr.nonZeros());
    for (int k = 0; k < csr.outerSize(); ++k) {
        for (SparseHamiltonian::InnerIterator it(csr, k); it; ++it) {
            coo.rows.push_back(static_cast<int>(it.row()));
            coo.cols.push_back(static_cast<int>(it.col()));
            coo.values.push_back(it.value());
        }
    }
    return coo;
}
