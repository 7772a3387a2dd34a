#pragma once

#include <string>


namespace Options
{
    /* parameters of a bose_hubbard run, with their defaults */
    struct Parameters {
        int m = 8;
        int n = 2;
        double t = -1.0;
        double U = 2.0;
        double u = 0.0;
        std::string geometry = "chain";
        bool closed = true;
        int nb_eigen = 5;
        bool print = false;
    };

    void print_usage();

    /* read the command line into parameters, returns -1 to go on with the run or the exit code of the program */
    int parse_arguments(int argc, char* argv[], Parameters& parameters);
}
