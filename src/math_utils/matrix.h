#pragma once

#include <vector>
#include <cstdint>
#include <limits>
#include <utility>
#include "errors.hpp"


#ifdef PARMUL_DEBUG

#include <sstream>

#endif // PARMUL_DEBUG


namespace math_utils {
    [[nodiscard]] inline bool shape_overflows(std::uint64_t rows, std::uint64_t cols) {
        return cols != 0 && rows > std::numeric_limits<std::uint64_t>::max() / cols;
    }

    /**
     * Dense row-major matrix. The shape is checked once, on construction, and the elements cannot be
     * modified afterwards, so a matrix can be read from any number of threads at once.
     */
    template<typename T>
    class matrix {
    public:
        matrix() : rows_(0), cols_(0), data_() {}

        /**
         * @throws InvalidShape if data.size() != rows * cols, or rows * cols does not fit in 64 bits.
         */
        matrix(std::uint64_t rows, std::uint64_t cols, std::vector<T> data) :
                rows_(rows), cols_(cols), data_(std::move(data)) {
            if (shape_overflows(rows_, cols_) || data_.size() != rows_ * cols_) {
                throw InvalidShape(rows_, cols_, data_.size());
            }
        }

        [[nodiscard]] inline std::uint64_t rows() const { return rows_; }

        [[nodiscard]] inline std::uint64_t cols() const { return cols_; }

        [[nodiscard]] inline const std::vector<T> &data() const { return data_; }

        [[nodiscard]] inline std::uint64_t pos(std::uint64_t row, std::uint64_t col) const { return row * cols_ + col; }

        inline const T &operator()(std::uint64_t row, std::uint64_t col) const {
#ifdef PARMUL_DEBUG
            assert_pos(row, col);
#endif
            return data_[pos(row, col)];
        }

        bool operator==(const matrix &other) const = default;

        inline void assert_pos(std::uint64_t row, std::uint64_t col) const {
#ifdef PARMUL_DEBUG
            if (row >= rows_ || col >= cols_) {
                std::stringstream o;
                o << "matrix::assert_pos: position out of range"
                  << " row: " << row << ", col: " << col << ", rows: " << rows_ << ", cols: " << cols_;
                throw std::out_of_range(o.str());
            }
#else
            (void) row;
            (void) col;
#endif
        };

    private:
        std::uint64_t rows_;
        std::uint64_t cols_;
        std::vector<T> data_;
    };
}
