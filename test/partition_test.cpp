#include <cassert>
#include <cstdint>
#include <vector>
#include "math_utils/partition.hpp"
#include "math_utils/errors.hpp"

void verify_partition(std::uint64_t num_workers, std::uint64_t rows);

void verify_invalid_worker_count(std::uint64_t num_workers, std::uint64_t rows);

int partition_test(int, char *[]) {
    assert((math_utils::partition(3, 10) == std::vector<std::uint64_t>{0, 4, 7, 10}));
    assert((math_utils::partition(1, 5) == std::vector<std::uint64_t>{0, 5}));
    assert((math_utils::partition(3, 3) == std::vector<std::uint64_t>{0, 1, 2, 3}));
    assert((math_utils::partition(2, 3) == std::vector<std::uint64_t>{0, 2, 3}));

    for (std::uint64_t rows = 1; rows <= 64; ++rows) {
        for (std::uint64_t t = 1; t <= rows; ++t) {
            verify_partition(t, rows);
        }
    }

    verify_invalid_worker_count(0, 10);
    verify_invalid_worker_count(11, 10);
    verify_invalid_worker_count(1, 0);
    verify_invalid_worker_count(0, 0);

    // same input, same boundaries.
    assert(math_utils::partition(7, 1000) == math_utils::partition(7, 1000));
    return 0;
}

void verify_partition(std::uint64_t num_workers, std::uint64_t rows) {
    auto b = math_utils::partition(num_workers, rows);
    assert(b.size() == num_workers + 1);
    assert(b.front() == 0);
    assert(b.back() == rows);

    auto base = rows / num_workers;
    auto remainder = rows % num_workers;
    std::uint64_t total = 0;
    for (std::uint64_t i = 0; i < num_workers; ++i) {
        assert(b[i] < b[i + 1]);
        auto size = b[i + 1] - b[i];
        assert(size == (i < remainder ? base + 1 : base));
        total += size;
    }
    assert(total == rows);
}

void verify_invalid_worker_count(std::uint64_t num_workers, std::uint64_t rows) {
    bool thrown = false;
    try {
        math_utils::partition(num_workers, rows);
    } catch (const math_utils::InvalidWorkerCount &e) {
        thrown = true;
        assert(e.requested() == num_workers);
        assert(e.rows() == rows);
    }
    assert(thrown);
}
