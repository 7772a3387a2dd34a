#include <cmath>
#include <tuple>
#include <string>
#include <stdexcept>

#include <Eigen/Dense>

#include "analysis.hpp"


        /* MEAN OCCUPATIONS */

std::tuple<double, double, Eigen::VectorXd> Analysis::mean_occupations(const Eigen::VectorXd& phi0, const Eigen::MatrixXi& basis){
    const int m = basis.rows();
    const int D = basis.cols();
    if (phi0.size() != D) {
        throw std::invalid_argument("The state has " + std::to_string(phi0.size()) + " components for a basis of " + std::to_string(D) + " states.");
    }
    
    // Compute probabilities |c_k|^2
    const Eigen::VectorXd probs = phi0.array().square().matrix() / phi0.squaredNorm();
    const Eigen::MatrixXd occupations = basis.cast<double>();
    
    // site_ni = sum_k |c_k|^2 * n_i(k)
    const Eigen::VectorXd site_ni = occupations * probs;
    
    // sum_ni = average occupation per site
    const double sum_ni = site_ni.sum() / m;
    
    // sum_ni_sq = average of <n_i^2> per site
    double sum_ni_sq = 0.0;
    for (int i = 0; i < m; ++i) {
        sum_ni_sq += (occupations.row(i).array().square().matrix()).dot(probs);
    }
    sum_ni_sq /= m;
    
    return {sum_ni, sum_ni_sq, site_ni};
}
