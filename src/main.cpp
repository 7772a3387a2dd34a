#include <string>
#include <cstddef>
#include <vector>
#include <iostream>
#include <exception>
#include <algorithm>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "hamiltonian.hpp"
#include "neighbours.hpp"
#include "operator.hpp"
#include "analysis.hpp"
#include "resource.hpp"
#include "options.hpp"

/* Diagonalize exactly the small sectors and with the Lanczos method the large ones */
static Eigen::VectorXd lowest_eigen(const BH::SparseHamiltonian& H, int nb_eigen, Eigen::MatrixXd& eigenvectors, bool& success) {
    constexpr int max_exact_dimension = 1000;
    if (H.rows() <= max_exact_dimension || nb_eigen >= H.rows() - 1) {
        const Eigen::VectorXd eigenvalues = Op::exact_eigen(H, eigenvectors, success);
        eigenvectors.conservativeResize(Eigen::NoChange, nb_eigen);
        return eigenvalues.head(nb_eigen);
    }
    return Op::IRLM_eigen(H, nb_eigen, eigenvectors, success);
}

static int run(int m, int n, double t, double U, double u, const std::string& geometry, bool closed, int nb_eigen, bool print) {

    // Start of the calculations
    Resource::timer();

    // Set the geometry of the lattice
    std::vector<BH::Link> links;
    if (geometry == "chain") {
        links = Neighbours::chain_links(m, closed, t);
    } else if (geometry == "square") {
        links = Neighbours::square_links(m, closed, t);
    } else {
        links = Neighbours::cube_links(m, closed, t);
    }

    // Construct the model and its charge sector
    const BH::Model model(std::vector<double>(m, u), links, U);
    if (print) {
        std::cout << "Hopping Hamiltonian:\n" << model.hopping() << "\n";
    }
    const BH::ChargeState sector = model.chargestate(n);
    std::cout << "Charge sector: " << n << " bosons on " << m << " sites, " << sector.size() << " states ("
              << Resource::estimateBasisMemoryUsage(m, sector.size()) / 1024 << " KB)" << std::endl;

    // Construct the many-body Hamiltonian
    const BH::SparseHamiltonian H = sector.hamiltonian();
    std::cout << "Hamiltonian: " << H.nonZeros() << " non-zero elements ("
              << Resource::estimateSparseMatrixMemoryUsage(H) / 1024 << " KB)" << std::endl;
    if (print) {
        std::cout << "Many-Body Basis:\n";
        for (int k = 0; k < sector.size(); k++) {
            std::cout << "  " << k << "  " << BH::state_string(sector.basis().col(k)) << "\n";
        }
        const BH::CooMatrix coo = BH::to_coo(H);
        std::cout << "Many-Body Hamiltonian:\n";
        for (std::size_t e = 0; e < coo.values.size(); e++) {
            std::cout << "  (" << coo.rows[e] << ", " << coo.cols[e] << ")  " << coo.values[e] << "\n";
        }
    }

    // Lowest part of the spectrum
    nb_eigen = std::min(nb_eigen, sector.size());
    Eigen::MatrixXd eigenvectors;
    bool success = false;
    const Eigen::VectorXd eigenvalues = lowest_eigen(H, nb_eigen, eigenvectors, success);
    if (!success) {
        return 1;
    }
    std::cout << "Lowest eigenvalues: " << eigenvalues.transpose() << std::endl;
    const auto [mean_ni, mean_ni_sq, site_ni] = Analysis::mean_occupations(eigenvectors.col(0), sector.basis());
    std::cout << "Ground state: <n_i> = " << site_ni.transpose() << ", mean <n_i> = " << mean_ni
              << ", mean <n_i^2> = " << mean_ni_sq << std::endl;

    // End of the calculations
    Resource::timer();
    std::cout << " - ";
    Resource::get_memory_usage(true);
    std::cout << std::endl;
    return 0;
}


int main(int argc, char *argv[]) {

    // PARAMETERS OF THE MODEL
    Options::Parameters p;
    const int status = Options::parse_arguments(argc, argv, p);
    if (status >= 0) {
        return status;
    }

    try {
        return run(p.m, p.n, p.t, p.U, p.u, p.geometry, p.closed, p.nb_eigen, p.print);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
