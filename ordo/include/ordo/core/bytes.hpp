/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

namespace ordo::core {

    using byte = std::byte;
    using byte_view = std::span<const byte>;

    template <typename T>
    const byte* as_bytes_ptr(const T* ptr) noexcept {
        return reinterpret_cast<const byte*>(ptr);
    }

    // Unaligned read of a trivially copyable value.
    template <typename WordT>
    inline WordT load_word(const byte* where) noexcept {
        WordT val;
        std::memcpy(&val, where, sizeof(WordT));
        return val;
    }

} // namespace ordo::core
