#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include "matrix.h"
#include "errors.hpp"

namespace math_utils {

    /**
     * Collects the rows each worker computed, indexed by worker, and stitches them into the output matrix.
     * Every slot accepts exactly one report. Slot i must hold (boundaries[i+1] - boundaries[i]) * output_cols
     * values.
     */
    template<typename T>
    class ResultStore {
    public:
        ResultStore(std::vector<std::uint64_t> boundaries, std::uint64_t output_cols) :
                boundaries(std::move(boundaries)), output_cols(output_cols), slots() {
            if (this->boundaries.empty()) {
                throw InternalSynchronizationError("ResultStore: no partition boundaries");
            }
            slots.resize(this->boundaries.size() - 1);
        }

        [[nodiscard]] std::uint64_t num_workers() const { return slots.size(); }

        /**
         * Stores the partial result of a single worker.
         * @throws InternalSynchronizationError on an unknown worker, a second report for the same worker, or a
         *         partial result of the wrong length.
         */
        void put(std::uint64_t worker_index, std::vector<T> &&values) {
            if (worker_index >= slots.size()) {
                throw InternalSynchronizationError(
                        "report from unknown worker " + std::to_string(worker_index) + " (" +
                        std::to_string(slots.size()) + " workers)");
            }
            if (slots[worker_index].has_value()) {
                throw InternalSynchronizationError("worker " + std::to_string(worker_index) + " reported twice");
            }
            auto expected = expected_size(worker_index);
            if (values.size() != expected) {
                throw InternalSynchronizationError(
                        "worker " + std::to_string(worker_index) + " produced " + std::to_string(values.size()) +
                        " values, expected " + std::to_string(expected));
            }
            slots[worker_index] = std::move(values);
        }

        [[nodiscard]] bool complete() const { return first_missing() == slots.size(); }

        /**
         * Concatenates the partial results by ascending worker index. The store is empty afterwards.
         * @throws InternalSynchronizationError if any worker has not reported.
         */
        matrix<T> assemble() {
            if (!complete()) {
                throw InternalSynchronizationError(
                        "worker " + std::to_string(first_missing()) + " never reported");
            }

            std::vector<T> numbers;
            numbers.reserve(boundaries.back() * output_cols);
            for (std::uint64_t i = 0; i < slots.size(); ++i) {
                auto &part = *slots[i];
                numbers.insert(numbers.end(), std::make_move_iterator(part.begin()),
                               std::make_move_iterator(part.end()));
                slots[i].reset();
            }
            return matrix<T>(boundaries.back(), output_cols, std::move(numbers));
        }

    private:
        // index of the first worker without a report, slots.size() when every worker reported.
        [[nodiscard]] std::uint64_t first_missing() const {
            std::uint64_t i = 0;
            while (i < slots.size() && slots[i].has_value()) {
                ++i;
            }
            return i;
        }

        [[nodiscard]] std::uint64_t expected_size(std::uint64_t worker_index) const {
            return (boundaries[worker_index + 1] - boundaries[worker_index]) * output_cols;
        }

        std::vector<std::uint64_t> boundaries;
        std::uint64_t output_cols;
        std::vector<std::optional<std::vector<T>>> slots;
    };
}
