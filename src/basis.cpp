#include <cmath>
#include <limits>
#include <string>
#include <sstream>
#include <vector>
#include <numeric>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>

#include "basis.hpp"
#include "primes.hpp"


/////  IMPLEMENTATION OF THE BASIS FUNCTIONS  /////


    /* DIMENSION OF THE HILBERT SPACE */

/* Calculate the binomial coefficient, every partial product is itself a binomial coefficient */
long long BH::binomial(int n, int k) {
    if (k < 0 || k > n) {
        return 0;
    }
    k = std::min(k, n - k);
    long long result = 1;
    for (int i = 1; i <= k; i++) {
        const long long factor = n - k + i;
        if (result > std::numeric_limits<long long>::max() / factor) {
            throw std::overflow_error("Binomial coefficient C(" + std::to_string(n) + ", " + std::to_string(k) + ") overflows.");
        }
        result = result * factor / i;
    }
    return result;
}

/* Calculate the dimension of the Hilbert space for n bosons on m sites */
int BH::dimension(int m, int n) {
    if (m <= 0) {
        throw std::invalid_argument("The number of sites must be positive, got " + std::to_string(m) + ".");
    }
    if (n < 0) {
        throw std::invalid_argument("The number of bosons must be non-negative, got " + std::to_string(n) + ".");
    }
    const long long D = binomial(n + m - 1, n);
    if (D > std::numeric_limits<int>::max()) {
        throw std::overflow_error("The Hilbert space of " + std::to_string(n) + " bosons on " + std::to_string(m) + " sites has " + std::to_string(D) + " states, too many to index.");
    }
    return static_cast<int>(D);
}


    /* INITIALIZE THE HILBERT SPACE BASIS */

/* Create the matrix that has the Fock states in columns, each state built from the previous one */
Eigen::MatrixXi BH::generate_basis(int m, int n) {
    const int D = dimension(m, n);
    Eigen::MatrixXi basis = Eigen::MatrixXi::Zero(m, D);
    basis(0, 0) = n;
    int ni = 0; // rightmost site that can give a boson
    for (int k = 1; k < D; k++) {
        basis.col(k).head(m - 1) = basis.col(k - 1).head(m - 1);
        basis(ni, k) -= 1;
        basis(ni + 1, k) += 1 + basis(m - 1, k - 1);
        if (ni >= m - 2) {
            for (int i = m - 2; i >= 0; i--) {
                if (basis(i, k) != 0) {
                    ni = i;
                    break;
                }
            }
        }
        else {
            ni++;
        }
    }
    return basis;
}


    /* HASH THE STATES TO FACILITATE THE SEARCH */

/* Write a state as [n_0, n_1, ...] */
std::string BH::state_string(const Eigen::VectorXi& state) {
    const Eigen::IOFormat fmt(Eigen::StreamPrecision, Eigen::DontAlignCols, ", ", ", ", "", "", "[", "]");
    std::ostringstream out;
    out << state.transpose().format(fmt);
    return out.str();
}

/* Square roots of the m lowest primes */
Eigen::VectorXd BH::hash_weights(int m) {
    const std::vector<int> primes = lowest_primes(m);
    Eigen::VectorXd weights(m);
    for (int i = 0; i < m; i++) {
        weights[i] = std::sqrt(static_cast<double>(primes[i]));
    }
    return weights;
}

/* Calculate the tag of a state */
double BH::fingerprint(const Eigen::VectorXi& state, const Eigen::VectorXd& weights) {
    if (state.size() != weights.size()) {
        throw std::invalid_argument("A state of " + std::to_string(state.size()) + " sites cannot be hashed with " + std::to_string(weights.size()) + " weights.");
    }
    double tag = 0;
    for (int i = 0; i < state.size(); i++) {
        tag += state[i] * weights[i];
    }
    return tag;
}

/* Calculate and store the tags of each state of the basis */
Eigen::VectorXd BH::fingerprints(const Eigen::MatrixXi& states, const Eigen::VectorXd& weights) {
    Eigen::VectorXd tags(states.cols());
    for (int k = 0; k < states.cols(); k++) {
        tags[k] = fingerprint(states.col(k), weights);
    }
    return tags;
}

/* Indices that sort the tags in ascending order */
std::vector<int> BH::sort_permutation(const Eigen::VectorXd& tags) {
    std::vector<int> indices(tags.size());
    std::iota(indices.begin(), indices.end(), 0);
    std::sort(indices.begin(), indices.end(), [&tags](int a, int b) {return tags[a] < tags[b];});
    return indices;
}

/* Binary search of the run of tags equal to key, through the sorter */
std::pair<int, int> BH::fingerprint_range(const Eigen::VectorXd& tags, const std::vector<int>& sorter, double key) {
    const auto first = std::lower_bound(sorter.begin(), sorter.end(), key, [&tags](int a, double x) {return tags[a] < x;});
    const auto last = std::upper_bound(first, sorter.end(), key, [&tags](double x, int a) {return x < tags[a];});
    return std::make_pair(static_cast<int>(first - sorter.begin()), static_cast<int>(last - sorter.begin()));
}

/* Generation-order index of the first state tagged by key */
int BH::search_fingerprint(const Eigen::VectorXd& tags, const std::vector<int>& sorter, double key) {
    const auto [first, last] = fingerprint_range(tags, sorter, key);
    if (first == last) {
        return -1;
    }
    return sorter[first];
}


    /* LOOKUP OF THE STATES IN THE BASIS */

BH::BasisIndex::BasisIndex(const Eigen::MatrixXi& states)
    : states_(states),
      weights_(hash_weights(static_cast<int>(states.rows()))),
      tags_(BH::fingerprints(states, weights_)),
      sorter_(sort_permutation(tags_)) {}

/* Find the state among the states sharing its tag */
int BH::BasisIndex::find(const Eigen::VectorXi& state) const {
    if (state.size() != states_.rows()) {
        return -1;
    }
    const auto [first, last] = fingerprint_range(tags_, sorter_, fingerprint(state, weights_));
    for (int p = first; p < last; p++) {
        if (states_.col(sorter_[p]) == state) {
            return sorter_[p];
        }
    }
    return -1;
}

int BH::BasisIndex::index_of(const Eigen::VectorXi& state) const {
    const int index = find(state);
    if (index < 0) {
        throw BasisLookupError("State " + state_string(state) + " is not in the basis.");
    }
    return index;
}

Eigen::VectorXi BH::BasisIndex::indices_of(const Eigen::MatrixXi& states) const {
    Eigen::VectorXi indices(states.cols());
    for (int k = 0; k < states.cols(); k++) {
        indices[k] = index_of(states.col(k));
    }
    return indices;
}
