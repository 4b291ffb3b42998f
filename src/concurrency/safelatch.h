#pragma once

#include <latch>
#include <atomic>
#include <cstddef>

namespace concurrency {

    /**
     * A std::latch that refuses to count below zero instead of invoking undefined behaviour.
     */
    class safelatch : public std::latch {
        std::atomic<std::ptrdiff_t> safety;
    public:
        /**
         * @throws std::invalid_argument if count is negative or above std::latch::max().
         */
        explicit safelatch(std::ptrdiff_t count) : std::latch(checked_count(count)), safety(count) {};

        bool done_waiting();

        // hides std::latch::count_down.
        void count_down();

    private:
        static std::ptrdiff_t checked_count(std::ptrdiff_t count);
    };

}
