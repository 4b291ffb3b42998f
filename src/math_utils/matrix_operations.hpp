#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "concurrency/concurrency.h"
#include "matrix.h"
#include "numeric.hpp"
#include "errors.hpp"
#include "partition.hpp"
#include "result_store.hpp"


namespace math_utils {

    /**
     * What a single worker hands back to the thread that dispatched it: either the values of its rows, or
     * the reason it could not compute them.
     */
    template<typename T>
    struct WorkerReport {
        std::uint64_t worker_index = 0;
        std::vector<T> values;
        bool failed = false;
        std::string cause;
    };

    /**
     * @throws DimensionMismatch if left.cols() != right.rows().
     */
    template<typename T>
    void verify_correct_dimension(const matrix<T> &left, const matrix<T> &right);

    /**
     * @throws EmptyOperand if the output has cells but the shared dimension is zero.
     */
    template<typename T>
    void verify_not_empty_matrices(const matrix<T> &left, const matrix<T> &right);

    /***
     * The sequential kernel: appends rows [first_row, last_row) of left * right to out, row-major.
     * Every cell is left(i, 0) * right(0, j) + left(i, 1) * right(1, j) + ... summed in ascending k, so the
     * value of a cell never depends on which worker computed it.
     * Assumes left.cols() == right.rows() > 0 and last_row <= left.rows().
     */
    template<multiplicative_accumulator T>
    void multiply_rows(const matrix<T> &left, const matrix<T> &right,
                       std::uint64_t first_row, std::uint64_t last_row,
                       std::vector<T> &out);

    /***
     * performs matrix-multiplication, splitting the output rows between num_workers workers.
     * num_workers == 1 runs on the calling thread, anything more runs on a threadpool created for this call
     * and joined before returning. The result is identical for every valid num_workers.
     * @throws DimensionMismatch, InvalidWorkerCount, EmptyOperand before any work starts.
     * @throws TaskFailure if a worker did not complete, carrying the lowest failing worker index.
     * @throws InternalSynchronizationError if worker reports were lost or malformed.
     */
    template<multiplicative_accumulator T>
    matrix<T> multiply(const std::shared_ptr<const matrix<T>> &left_ptr,
                       const std::shared_ptr<const matrix<T>> &right_ptr,
                       std::uint64_t num_workers);

    /***
     * similar to multiply with shared operands. The operands are borrowed for the duration of the call.
     */
    template<multiplicative_accumulator T>
    matrix<T> multiply(const matrix<T> &left, const matrix<T> &right, std::uint64_t num_workers);

}

#include "matrix_operations.tpp"
