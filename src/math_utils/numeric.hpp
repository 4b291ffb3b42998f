#pragma once

#include <concepts>

namespace math_utils {
    /**
     * Everything the multiplication kernel asks of an element type: a product of two elements is again an
     * element, and an element can be added into a running sum. No zero value is assumed, the first product
     * seeds every sum.
     */
    template<typename T>
    concept multiplicative_accumulator = std::move_constructible<T> &&
                                         requires(const T &a, const T &b, T &sum) {
                                             { a * b } -> std::same_as<T>;
                                             sum += a * b;
                                         };
}
