#include <vector>
#include <string>
#include <stdexcept>
#include <cmath>

#include "neighbours.hpp"


///// IMPLEMENTATION OF THE NEIGHBOURS NAMESPACE FUNCTIONS /////


    /* 1D */

/* generate the links of a 1D chain */
std::vector<BH::Link> Neighbours::chain_links(int m, bool closed, double amplitude) { // closed = true for periodic boundary conditions, closed = false for open boundary conditions
	if (m <= 0) {
		throw std::invalid_argument("The number of sites (m) must be positive.");
	}
	std::vector<BH::Link> links;
	for (int i = 0; i < m - 1; ++i) {
		links.push_back({i, i + 1, amplitude}); // Right neighbour
	}
	if (closed && m > 2) { // Periodic boundary conditions, a ring of 2 sites has a single bond
		links.push_back({m - 1, 0, amplitude});
	}
	return links;
}


    /* 2D */

/* generate the links of a 2D square lattice */
std::vector<BH::Link> Neighbours::square_links(int m, bool closed, double amplitude) {
    const int side = (m > 0) ? static_cast<int>(std::lround(std::sqrt(m))) : 0;
    if (side == 0 || side * side != m) {
        throw std::invalid_argument("The number of sites (m) must be a perfect square, got " + std::to_string(m) + ".");
    }
    const bool wrap = closed && side > 2;
    std::vector<BH::Link> links;
    for (int i = 0; i < side; ++i) {
        for (int j = 0; j < side; ++j) {
            const int index = i * side + j;
            if (j < side - 1) {
                links.push_back({index, index + 1, amplitude}); // Right neighbour
            } else if (wrap) {
                links.push_back({index, index - side + 1, amplitude});
            }
            if (i < side - 1) {
                links.push_back({index, index + side, amplitude}); // Bottom neighbour
            } else if (wrap) {
                links.push_back({index, index - (side - 1) * side, amplitude});
            }
        }
    }
    return links;
}


    /* 3D */

/* generate the links of a 3D cubic lattice */
std::vector<BH::Link> Neighbours::cube_links(int m, bool closed, double amplitude) {
    const int side = (m > 0) ? static_cast<int>(std::lround(std::cbrt(m))) : 0;
    if (side == 0 || side * side * side != m) {
        throw std::invalid_argument("The number of sites (m) must be a perfect cube, got " + std::to_string(m) + ".");
    }
    const bool wrap = closed && side > 2;
    std::vector<BH::Link> links;
    for (int i = 0; i < side; ++i) {
        for (int j = 0; j < side; ++j) {
            for (int k = 0; k < side; ++k) {
                const int index = i * side * side + j * side + k;
                if (k < side - 1) {
                    links.push_back({index, index + 1, amplitude}); // Right neighbour
                } else if (wrap) {
                    links.push_back({index, index - side + 1, amplitude});
                }
                if (j < side - 1) {
                    links.push_back({index, index + side, amplitude}); // Bottom neighbour
                } else if (wrap) {
                    links.push_back({index, index - (side - 1) * side, amplitude});
                }
                if (i < side - 1) {
                    links.push_back({index, index + side * side, amplitude}); // Back neighbour
                } else if (wrap) {
                    links.push_back({index, index - (side - 1) * side * side, amplitude});
                }
            }
        }
    }
    return links;
}
