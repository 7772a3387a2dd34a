#include <cmath>
#include <string>
#include <vector>
#include <numeric>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include <Eigen/SparseCore>
#include <Eigen/Eigenvalues>
#include <Spectra/SymEigsSolver.h>
#include <Spectra/MatOp/SparseSymMatProd.h>

#include "operator.hpp"

using namespace Spectra;



///// DIAGONALIZATION /////

    /* SORT EIGENVALUES AND EIGENVECTORS IN ASCENDING ORDER */

/* Sort eigenvalues and eigenvectors in ascending order by eigenvalue */
void Op::sort_eigen(Eigen::VectorXd& eigenvalues, Eigen::MatrixXd& eigenvectors) {
    const int n = eigenvalues.size();
    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::sort(indices.begin(), indices.end(), 
              [&eigenvalues](int i, int j) { return eigenvalues[i] < eigenvalues[j]; });

    const Eigen::VectorXd values = eigenvalues;
    const Eigen::MatrixXd vectors = eigenvectors;
    for (int i = 0; i < n; ++i) {
        eigenvalues[i] = values[indices[i]];
        eigenvectors.col(i) = vectors.col(indices[i]);
    }
}

    /* IMPLICITLY RESTARTED LANCZOS METHOD (IRLM) */

/* implement the IRLM for a sparse symmetric matrix to find the smallest nb_eigen eigenvalues */
Eigen::VectorXd Op::IRLM_eigen(const BH::SparseHamiltonian& O, int nb_eigen, Eigen::MatrixXd& eigenvectors, bool& success) {
    const int dim = O.rows();
    if (nb_eigen < 1 || nb_eigen >= dim) {
        throw std::invalid_argument("The Lanczos method needs 0 < nb_eigen < " + std::to_string(dim) + ", got " + std::to_string(nb_eigen) + ".");
    }
    SparseSymMatProd<double, Eigen::Lower, Eigen::RowMajor> op(O); // matrix operation object for a symmetric row major matrix
    SymEigsSolver<SparseSymMatProd<double, Eigen::Lower, Eigen::RowMajor>> eigs(op, nb_eigen, std::min(2 * nb_eigen + 1, dim));
    eigs.init();
    [[maybe_unused]] int nconv = eigs.compute(Spectra::SortRule::SmallestAlge); // find smallest algebraic eigenvalues
    Eigen::VectorXd eigenvalues;
    if (eigs.info() != Spectra::CompInfo::Successful) { // verify if the eigen search is a success
        success = false;
        std::cerr << "Warning: Eigenvalue computation failed." << std::endl;
        eigenvalues = Eigen::VectorXd::Constant(nb_eigen, -1.0);
        eigenvectors = Eigen::MatrixXd::Constant(dim, nb_eigen, -1.0);
        return eigenvalues;
    }
    success = true;
    eigenvalues = eigs.eigenvalues(); // eigenvalues are real for symmetric matrices
    eigenvectors = eigs.eigenvectors(); // eigenvectors of the hamiltonian
    sort_eigen(eigenvalues, eigenvectors);
    return eigenvalues;
}


    /* EXACT DIAGONALIZATION */

/* Calculate the exact eigenvalues and eigenvectors of the hamiltonian by an exact diagonalization */
Eigen::VectorXd Op::exact_eigen(const BH::SparseHamiltonian& O, Eigen::MatrixXd& eigenvectors, bool& success) {
    const Eigen::MatrixXd dense_smat = Eigen::MatrixXd(O); // convert sparse matrix to dense matrix
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigensolver(dense_smat); // solve the eigen problem for the hamiltonian
    Eigen::VectorXd eigenvalues;
    if (eigensolver.info() != Eigen::Success) { // verify if the eigen search is a success
        success = false;
        std::cerr << "Warning: Eigenvalue computation failed." << std::endl;
        eigenvalues = Eigen::VectorXd::Constant(O.rows(), -1.0);
        eigenvectors = Eigen::MatrixXd::Constant(O.rows(), O.cols(), -1.0);
        return eigenvalues;
    }
    success = true;
    eigenvectors = eigensolver.eigenvectors(); // eigenvectors of the hamiltonian, eigenvalues come in ascending order
    eigenvalues = eigensolver.eigenvalues(); // eigenvalues of the hamiltonian
    return eigenvalues;
}
