#pragma once

#include <cstdint>
#include <vector>

namespace math_utils {
    /***
     * Splits [0, rows) into num_workers contiguous ranges whose sizes differ by at most one.
     * The first rows % num_workers ranges get the extra row.
     * @return num_workers + 1 ascending boundaries, starting at 0 and ending at rows. Worker i owns
     *         [boundaries[i], boundaries[i + 1]).
     * @throws InvalidWorkerCount if num_workers is 0 or larger than rows.
     */
    std::vector<std::uint64_t> partition(std::uint64_t num_workers, std::uint64_t rows);
}
