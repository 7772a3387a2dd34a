#include <chrono>
#include <string>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <iostream>
#include <unistd.h>

#include "resource.hpp"


namespace
{
    std::chrono::steady_clock::time_point start_time;
    bool is_running = false;
}


// MEMORY USAGE :

long Resource::get_memory_usage(bool print) {
    std::ifstream statm_file("/proc/self/statm");
    long size = 0, resident = 0;
    if (!(statm_file >> size >> resident)) {
        std::cerr << "Error reading memory usage from /proc/self/statm." << std::endl;
        return -1;
    }
    const long memory_usage = resident * (sysconf(_SC_PAGESIZE) / 1024); // pages to KB
    if (print) {
        std::cout << "Memory usage: " << memory_usage << " KB";
    }
    return memory_usage;
}

std::size_t Resource::estimateSparseMatrixMemoryUsage(const BH::SparseHamiltonian& matrix) {
    using StorageIndex = BH::SparseHamiltonian::StorageIndex;
    const std::size_t numNonZeros = matrix.nonZeros();
    const std::size_t numRows = matrix.rows();
    return numNonZeros * (sizeof(double) + sizeof(StorageIndex)) + (numRows + 1) * sizeof(StorageIndex);
}

std::size_t Resource::estimateBasisMemoryUsage(int m, int D) {
    return static_cast<std::size_t>(D) * (m * sizeof(int) + sizeof(double) + sizeof(int));
}


// TIMER :

std::string Resource::format_duration(double duration_sec) {
    std::ostringstream out;
    if (duration_sec >= 60.0) {
        const int minutes = static_cast<int>(duration_sec / 60.0);
        out << minutes << "m " << duration_sec - minutes * 60.0 << "s";
    } else {
        out << duration_sec << "s";
    }
    return out.str();
}

void Resource::timer() {
    if (!is_running) {
        start_time = std::chrono::steady_clock::now();
        is_running = true;
        return;
    }
    const double duration_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    is_running = false;
    std::cout << "Duration: " << format_duration(duration_sec);
}
