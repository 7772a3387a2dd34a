#include <string>
#include <iostream>
#include <exception>

#include <getopt.h>

#include "options.hpp"


/////  IMPLEMENTATION OF THE COMMAND LINE OPTIONS  /////


void Options::print_usage() {
    std::cout << "Usage: bose_hubbard [options]\n"
              << "Options:\n"
              << "  -m, --sites       Number of sites (default: 8)\n"
              << "  -n, --bosons      Number of bosons (default: 2)\n"
              << "  -t, --hopping     Amplitude of each link (default: -1)\n"
              << "  -U, --interaction On-site interaction (default: 2)\n"
              << "  -u, --onsite      Onsite energy of every site (default: 0)\n"
              << "  -g, --geometry    Lattice: 'chain' (default), 'square' or 'cube'\n"
              << "  -o, --open        Open boundary conditions (default: periodic)\n"
              << "  -e, --eigen       Number of lowest eigenvalues (default: 5)\n"
              << "  -p, --print       Print the hopping matrix, the basis and the Hamiltonian\n"
              << "  -h, --help        Show this message\n";
}

int Options::parse_arguments(int argc, char* argv[], Parameters& parameters) {

    const char* const short_opts = "m:n:t:U:u:g:oe:ph";
    const option long_opts[] = {
        {"sites", required_argument, nullptr, 'm'},
        {"bosons", required_argument, nullptr, 'n'},
        {"hopping", required_argument, nullptr, 't'},
        {"interaction", required_argument, nullptr, 'U'},
        {"onsite", required_argument, nullptr, 'u'},
        {"geometry", required_argument, nullptr, 'g'},
        {"open", no_argument, nullptr, 'o'},
        {"eigen", required_argument, nullptr, 'e'},
        {"print", no_argument, nullptr, 'p'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, no_argument, nullptr, 0}
    };

    // restart the scan from argv[1]
    optind = 0;
    try {
        while (true) {
            const auto opt = getopt_long(argc, argv, short_opts, long_opts, nullptr);
            if (-1 == opt) break;
            switch (opt) {
                case 'm':
                    parameters.m = std::stoi(optarg);
                    break;
                case 'n':
                    parameters.n = std::stoi(optarg);
                    break;
                case 't':
                    parameters.t = std::stod(optarg);
                    break;
                case 'U':
                    parameters.U = std::stod(optarg);
                    break;
                case 'u':
                    parameters.u = std::stod(optarg);
                    break;
                case 'g':
                    parameters.geometry = optarg;
                    break;
                case 'o':
                    parameters.closed = false;
                    break;
                case 'e':
                    parameters.nb_eigen = std::stoi(optarg);
                    break;
                case 'p':
                    parameters.print = true;
                    break;
                case 'h':
                    print_usage();
                    return 0;
                case '?':
                default:
                    print_usage();
                    return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid option value (" << e.what() << ")." << std::endl;
        return 1;
    }

    if (parameters.geometry != "chain" && parameters.geometry != "square" && parameters.geometry != "cube") {
        std::cerr << "Error: geometry must be 'chain', 'square' or 'cube'." << std::endl;
        return 1;
    }
    if (parameters.nb_eigen < 1) {
        std::cerr << "Error: the number of eigenvalues (-e) must be at least 1." << std::endl;
        return 1;
    }
    return -1;
}
