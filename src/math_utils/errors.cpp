#include <limits>
#include <sstream>
#include "errors.hpp"

namespace math_utils {
    namespace {
        std::string dimension_message(std::uint64_t a_columns, std::uint64_t b_rows) {
            std::stringstream o;
            o << "MatrixOperations::multiply: left matrix cols (" << a_columns << ") != right matrix rows ("
              << b_rows << ")";
            return o.str();
        }

        std::string worker_count_message(std::uint64_t requested, std::uint64_t rows) {
            std::stringstream o;
            o << "MatrixOperations::multiply: cannot split " << rows << " rows between " << requested
              << " workers";
            return o.str();
        }

        std::string shape_message(std::uint64_t rows, std::uint64_t cols, std::uint64_t size) {
            std::stringstream o;
            if (cols != 0 && rows > std::numeric_limits<std::uint64_t>::max() / cols) {
                o << "matrix: rows * cols overflows: " << rows << " * " << cols << " (numbers length " << size
                  << ")";
                return o.str();
            }
            o << "matrix: numbers length " << size << " doesn't match rows * cols: "
              << rows << " * " << cols << " = " << rows * cols;
            return o.str();
        }
    }

    DimensionMismatch::DimensionMismatch(std::uint64_t a_columns, std::uint64_t b_rows) :
            std::invalid_argument(dimension_message(a_columns, b_rows)), a_cols(a_columns), b_rws(b_rows) {}

    InvalidWorkerCount::InvalidWorkerCount(std::uint64_t requested, std::uint64_t rows) :
            std::invalid_argument(worker_count_message(requested, rows)), requested_(requested), rows_(rows) {}

    EmptyOperand::EmptyOperand(std::uint64_t a_columns) :
            std::invalid_argument("MatrixOperations::multiply: left matrix has " + std::to_string(a_columns) +
                                  " cols, nothing to accumulate") {}

    TaskFailure::TaskFailure(std::uint64_t worker_index, const std::string &cause) :
            std::runtime_error("MatrixOperations::multiply: worker " + std::to_string(worker_index) +
                               " failed: " + cause),
            index(worker_index), cause_(cause) {}

    InternalSynchronizationError::InternalSynchronizationError(const std::string &what) :
            std::logic_error("MatrixOperations::multiply: internal synchronization error: " + what) {}

    InvalidShape::InvalidShape(std::uint64_t rows, std::uint64_t cols, std::uint64_t size) :
            std::invalid_argument(shape_message(rows, cols, size)) {}
}
