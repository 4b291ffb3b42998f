#include <stdexcept>
#include <string>
#include "safelatch.h"

namespace concurrency {
    std::ptrdiff_t safelatch::checked_count(std::ptrdiff_t count) {
        if (count < 0 || count > std::latch::max()) {
            throw std::invalid_argument("safelatch: count " + std::to_string(count) + " is outside [0, " +
                                        std::to_string(std::latch::max()) + "]");
        }
        return count;
    }

    void safelatch::count_down() {
        auto prev = safety.fetch_sub(1);
        if (prev <= 0) {
            safety.fetch_add(1);
            throw std::logic_error(
                "safelatch::count_down: latch's value is less than 0, this is a bug that can lead to deadlock!");
        }
        std::latch::count_down();
    }

    bool safelatch::done_waiting() {
        return safety.load() == 0;
    }
}
