#pragma once

#include <vector>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "basis.hpp"

namespace BH
{

    using SparseHamiltonian = Eigen::SparseMatrix<double, Eigen::RowMajor>;

    /* hopping of amplitude from site "from" to site "to" */
    struct Link {
        int from;
        int to;
        double amplitude = -1.0;
    };

    /* sparse matrix as parallel lists of row, column and value */
    struct CooMatrix {
        std::vector<int> rows;
        std::vector<int> cols;
        std::vector<double> values;
        int n_rows = 0;
        int n_cols = 0;
    };

    class ChargeState;

// MODEL

    /* Bose-Hubbard model defined by its onsite energies, the links between the sites and the interaction U */
    class Model {
    public:
        Model(std::vector<double> omegas, std::vector<Link> links, double U);

        int sites() const { return static_cast<int>(omegas_.size()); }
        double interaction() const { return U_; }
        const Eigen::VectorXd& onsite() const { return omegas_; }
        const std::vector<Link>& links() const { return links_; }

        /* onsite energies shifted by -U/2, which absorbs the linear part of n(n-1) */
        Eigen::VectorXd shifted_onsite() const;

        /* single particle hopping matrix H0 + H0^T */
        Eigen::MatrixXd hopping() const;

        /* charge sector of nb bosons, the model must outlive it */
        ChargeState chargestate(int nb) const&;
        ChargeState chargestate(int nb) const&& = delete;

    private:
        Eigen::VectorXd omegas_;
        std::vector<Link> links_;
        double U_;
    };

// CHARGE SECTOR

    class ChargeState {
    public:
        ChargeState(const Model& model, int nb);
        ChargeState(Model&&, int) = delete;
        ChargeState(const ChargeState&) = delete;
        ChargeState& operator=(const ChargeState&) = delete;

        int sites() const { return model_.sites(); }
        int bosons() const { return nb_; }
        int size() const { return static_cast<int>(basis_.cols()); }
        const Model& model() const { return model_; }

        /* Fock states of the sector in columns, in generation order */
        const Eigen::MatrixXi& basis() const { return basis_; }
        const BasisIndex& index() const { return index_; }

        /* many-body Hamiltonian in the basis of the sector */
        SparseHamiltonian hamiltonian() const;

    private:
        const Model& model_;
        int nb_;
        Eigen::MatrixXi basis_;
        BasisIndex index_;
    };

// FILL THE HAMILTONIAN OF THE SYSTEM

    /* onsite term: dot(omegas, state) for each state */
    Eigen::VectorXd onsite_hamiltonian(const Eigen::VectorXd& omegas, const Eigen::MatrixXi& states);

    /* interaction term: U/2 sum_i n_i^2 for each state */
    Eigen::VectorXd interaction_hamiltonian(double U, const Eigen::MatrixXi& states);

    /* hopping term in the many-body basis, rows are source states and columns destination states */
    CooMatrix hopping_hamiltonian(const BasisIndex& index, const Eigen::MatrixXd& H0);

    /* sum of the onsite, interaction and hopping terms, omegas already shifted by -U/2 */
    SparseHamiltonian assemble_hamiltonian(const Eigen::VectorXd& omegas, const Eigen::MatrixXd& H0, double U, const BasisIndex& index);

// SPARSE FORMATS

    /* compress a coordinate list, duplicated entries are summed */
    SparseHamiltonian to_csr(const CooMatrix& coo);

    CooMatrix to_coo(const SparseHamiltonian& csr);

}
