/*
 * File: core/concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once
#include <concepts>
#include <cstddef>

namespace ordo::core::concepts {

    template <typename T>
    concept IndexLess = requires(const T & less, std::size_t i, std::size_t j) {
        { less(i, j) } -> std::convertible_to<bool>;
    };

} // namespace ordo::core::concepts
