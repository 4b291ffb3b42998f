#include "partition.hpp"
#include "errors.hpp"

namespace math_utils {
    std::vector<std::uint64_t> partition(std::uint64_t num_workers, std::uint64_t rows) {
        if (num_workers == 0 || num_workers > rows) {
            throw InvalidWorkerCount(num_workers, rows);
        }

        auto base = rows / num_workers;
        auto remainder = rows % num_workers;

        std::vector<std::uint64_t> boundaries;
        boundaries.reserve(num_workers + 1);
        boundaries.push_back(0);
        for (std::uint64_t i = 0; i < num_workers; ++i) {
            boundaries.push_back(boundaries.back() + base + (i < remainder ? 1 : 0));
        }
        return boundaries;
    }
}
