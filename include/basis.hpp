#pragma once

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <Eigen/Dense>

namespace BH
{

// DIMENSION OF THE HILBERT SPACE

    /* exact binomial coefficient, throws std::overflow_error when it does not fit in 64 bits */
    long long binomial(int n, int k);

    /* dimension of the Hilbert space for n bosons on m sites */
    int dimension(int m, int n);

// INITIALIZE THE HILBERT SPACE BASIS

    /* creates a matrix that has the Fock states of the charge sector in columns */
    Eigen::MatrixXi generate_basis(int m, int n);

// HASH THE STATES TO FACILITATE THE SEARCH

    /* write a state as [n_0, n_1, ...] */
    std::string state_string(const Eigen::VectorXi& state);

    /* square roots of the m lowest primes */
    Eigen::VectorXd hash_weights(int m);

    /* calculate the tag of a state */
    double fingerprint(const Eigen::VectorXi& state, const Eigen::VectorXd& weights);

    /* calculate the tags of each state (column) of a basis */
    Eigen::VectorXd fingerprints(const Eigen::MatrixXi& states, const Eigen::VectorXd& weights);

    /* indices that sort the tags in ascending order */
    std::vector<int> sort_permutation(const Eigen::VectorXd& tags);

    /* positions [first, last) in sorted order of the tags equal to key */
    std::pair<int, int> fingerprint_range(const Eigen::VectorXd& tags, const std::vector<int>& sorter, double key);

    /* generation-order index of the first state tagged by key, -1 if there is none */
    int search_fingerprint(const Eigen::VectorXd& tags, const std::vector<int>& sorter, double key);

// LOOKUP OF THE STATES IN THE BASIS

    /* raised when a state that must belong to the basis cannot be found */
    class BasisLookupError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    /* State -> index lookup over a basis. The basis is borrowed and must outlive the index. */
    class BasisIndex {
    public:
        explicit BasisIndex(const Eigen::MatrixXi& states);
        BasisIndex(Eigen::MatrixXi&&) = delete;

        int size() const { return static_cast<int>(states_.cols()); }
        const Eigen::MatrixXi& states() const { return states_; }
        const Eigen::VectorXd& fingerprints() const { return tags_; }
        const std::vector<int>& sorter() const { return sorter_; }

        /* index of the state, -1 if it is not in the basis */
        int find(const Eigen::VectorXi& state) const;

        /* index of the state, throws BasisLookupError if it is not in the basis */
        int index_of(const Eigen::VectorXi& state) const;

        /* index of each state (column) */
        Eigen::VectorXi indices_of(const Eigen::MatrixXi& states) const;

    private:
        const Eigen::MatrixXi& states_;
        Eigen::VectorXd weights_;
        Eigen::VectorXd tags_;
        std::vector<int> sorter_;
    };

}
