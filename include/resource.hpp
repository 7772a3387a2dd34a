#pragma once

#include <string>
#include <cstddef>

#include "hamiltonian.hpp"


namespace Resource
{
    /* resident memory of the process in KB, -1 if /proc/self/statm cannot be read */
    long get_memory_usage(bool print = false);

    /* bytes held by the values, column indices and row pointers */
    std::size_t estimateSparseMatrixMemoryUsage(const BH::SparseHamiltonian& matrix);

    /* bytes held by D states on m sites with their tags and sorter */
    std::size_t estimateBasisMemoryUsage(int m, int D);

    /* "1m 4.2s" above a minute, "4.2s" below */
    std::string format_duration(double duration_sec);

    /* first call starts the timer, second call stops it and prints the duration */
    void timer();
}
