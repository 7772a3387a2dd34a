#pragma once

#include <cmath>
#include <Eigen/Dense>
#include <Eigen/SparseCore>
#include <Eigen/Eigenvalues>

#include "hamiltonian.hpp"


namespace Op
{

// SORT :

    /* sort eigenvalues and eigenvectors in ascending order */
    void sort_eigen(Eigen::VectorXd& eigenvalues, Eigen::MatrixXd& eigenvectors);


// DIAGONALIZATION : 

    /* nb_eigen lowest eigenpairs by the implicitly restarted Lanczos method, needs 0 < nb_eigen < dimension */
    Eigen::VectorXd IRLM_eigen(const BH::SparseHamiltonian& O, int nb_eigen, Eigen::MatrixXd& eigenvectors, bool& success);
    Eigen::VectorXd exact_eigen(const BH::SparseHamiltonian& O, Eigen::MatrixXd& eigenvectors, bool& success);

}
