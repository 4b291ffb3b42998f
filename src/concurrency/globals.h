#pragma once

#include <cstdint>
#include <thread>

namespace concurrency {
    // States the number of CPUs the concurrency module assumes when no worker count is configured.
    extern std::uint64_t num_cpus;
}
