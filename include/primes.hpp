#pragma once

#include <vector>

namespace BH
{

// PRIME NUMBERS

    /* all the primes lower or equal to upto, by an odd-only sieve */
    std::vector<int> primes(int upto);

    /* the n lowest primes in increasing order */
    std::vector<int> lowest_primes(int n);

}
