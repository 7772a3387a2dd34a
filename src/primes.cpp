#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>

#include "primes.hpp"


/////  IMPLEMENTATION OF THE PRIME NUMBERS  /////


/* Find all the primes lower or equal to upto */
std::vector<int> BH::primes(int upto) {
    std::vector<int> result;
    if (upto < 2) {
        return result;
    }
    result.push_back(2);
    // isprime[k] stands for the odd number 2k + 3
    const int nb_odd = (upto - 1) / 2;
    std::vector<bool> isprime(nb_odd, true);
    const int limit = static_cast<int>(std::sqrt(static_cast<double>(upto)));
    for (int k = 0; 2 * k + 3 <= limit; k++) {
        if (!isprime[k]) {
            continue;
        }
        const int factor = 2 * k + 3;
        for (int j = (factor * factor - 3) / 2; j < nb_odd; j += factor) {
            isprime[j] = false;
        }
    }
    for (int k = 0; k < nb_odd; k++) {
        if (isprime[k]) {
            result.push_back(2 * k + 3);
        }
    }
    return result;
}

/* Return the n lowest primes, the sieve bound n^2 always holds n primes for n >= 2 */
std::vector<int> BH::lowest_primes(int n) {
    if (n < 0) {
        throw std::invalid_argument("The number of primes must be non-negative, got " + std::to_string(n) + ".");
    }
    const long long bound = std::max(static_cast<long long>(n) * n, 2LL);
    if (bound > std::numeric_limits<int>::max()) {
        throw std::overflow_error("The sieve bound for the " + std::to_string(n) + " lowest primes does not fit in an int.");
    }
    std::vector<int> result = primes(static_cast<int>(bound));
    result.resize(n);
    return result;
}
