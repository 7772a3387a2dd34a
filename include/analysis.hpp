#pragma once

#include <tuple>
#include <Eigen/Dense>


namespace Analysis
{

// MEAN OCCUPATIONS

/* Calculate site occupations of a state given in the basis (states in columns): returns (spatial_avg_ni, spatial_avg_ni_sq, per_site_ni) */
std::tuple<double, double, Eigen::VectorXd> mean_occupations(const Eigen::VectorXd& phi0, const Eigen::MatrixXi& basis);

}
