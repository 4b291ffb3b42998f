#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace math_utils {

    /**
     * The left operand's column count differs from the right operand's row count.
     */
    class DimensionMismatch : public std::invalid_argument {
    public:
        DimensionMismatch(std::uint64_t a_columns, std::uint64_t b_rows);

        [[nodiscard]] std::uint64_t a_columns() const noexcept { return a_cols; }

        [[nodiscard]] std::uint64_t b_rows() const noexcept { return b_rws; }

    private:
        std::uint64_t a_cols;
        std::uint64_t b_rws;
    };

    /**
     * Zero workers, or more workers than there are rows to hand out.
     */
    class InvalidWorkerCount : public std::invalid_argument {
    public:
        InvalidWorkerCount(std::uint64_t requested, std::uint64_t rows);

        [[nodiscard]] std::uint64_t requested() const noexcept { return requested_; }

        [[nodiscard]] std::uint64_t rows() const noexcept { return rows_; }

    private:
        std::uint64_t requested_;
        std::uint64_t rows_;
    };

    // the shared dimension is zero, so no product exists to seed a dot product.
    class EmptyOperand : public std::invalid_argument {
    public:
        explicit EmptyOperand(std::uint64_t a_columns);
    };

    /**
     * A worker did not complete normally. No partial matrix is ever returned alongside it.
     */
    class TaskFailure : public std::runtime_error {
    public:
        TaskFailure(std::uint64_t worker_index, const std::string &cause);

        [[nodiscard]] std::uint64_t worker_index() const noexcept { return index; }

        [[nodiscard]] const std::string &cause() const noexcept { return cause_; }

    private:
        std::uint64_t index;
        std::string cause_;
    };

    /**
     * Result collection broke its own invariants (lost, duplicated or malformed worker reports).
     * This is a bug signal, callers should not try to recover from it.
     */
    class InternalSynchronizationError : public std::logic_error {
    public:
        explicit InternalSynchronizationError(const std::string &what);
    };

    class InvalidShape : public std::invalid_argument {
    public:
        InvalidShape(std::uint64_t rows, std::uint64_t cols, std::uint64_t size);
    };
}
