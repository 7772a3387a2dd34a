#pragma once

#include <cmath>
#include <vector>

#include "hamiltonian.hpp"

namespace Neighbours {
    /* each bond is given once, the model symmetrizes the hopping */
    std::vector<BH::Link> chain_links(int m, bool closed = true, double amplitude = -1.0);
    std::vector<BH::Link> square_links(int m, bool closed = true, double amplitude = -1.0);
    std::vector<BH::Link> cube_links(int m, bool closed = true, double amplitude = -1.0);
}
