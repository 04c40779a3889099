/**
 * @file    Endian.hpp
 * @brief   Little-endian integer access on raw account buffers
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 */

#pragma once

#ifndef ENDIAN_HPP_
#define ENDIAN_HPP_

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace book_watch {

/*
Ledger account layouts store integers least significant byte first.
Callers are responsible for bounds; the account size is checked once up front.
*/
template <typename T>
inline T read_little_endian(const uint8_t* buf, size_t offset) {
    static_assert(std::is_integral<T>::value, "integral type required");
    using U = typename std::make_unsigned<T>::type;
    U converted = 0;
    for (size_t i = sizeof(T); i > 0; --i) {
        if constexpr (sizeof(T) > 1) converted <<= 8;
        converted = converted | static_cast<U>(buf[offset + i - 1]);
    }
    return static_cast<T>(converted);
}

template <typename T>
inline void write_little_endian(uint8_t* buf, size_t offset, T value) {
    static_assert(std::is_integral<T>::value, "integral type required");
    using U = typename std::make_unsigned<T>::type;
    U bits = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[offset + i] = static_cast<uint8_t>(bits & 0xFF);
        if constexpr (sizeof(T) > 1) bits >>= 8;
    }
}

} // namespace book_watch

#endif /* ENDIAN_HPP_ */
