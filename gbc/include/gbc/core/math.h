/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_MATH_H
#define GAMEBOICOLOR_MATH_H

#include <gbc/core/integer.h>
#include <gbc/helper/macros.h>

namespace gbc {

namespace bit {

template<typename T = u32>
[[nodiscard]] FORCEINLINE constexpr T from_bool(const bool b) noexcept { return static_cast<typename T::type>(b); }

template<typename T = u32>
[[nodiscard]] FORCEINLINE constexpr T bit(const u8 b) noexcept { return narrow<T>(1_u32 << b); }

template<typename T>
[[nodiscard]] FORCEINLINE constexpr T extract(const T t, const u8 b) noexcept { return (t >> b) & 0x1_u8; }

template<typename T>
[[nodiscard]] FORCEINLINE constexpr T set(const T t, const u8 b) noexcept { return t | bit<T>(b); }

template<typename T>
[[nodiscard]] FORCEINLINE constexpr T clear(const T t, const u8 b) noexcept { return t & ~bit<T>(b); }

} // namespace bit

namespace mask {

template<typename T>
[[nodiscard]] FORCEINLINE constexpr T clear(const T t, const T m) noexcept { return t & ~m; }

template<typename T>
[[nodiscard]] FORCEINLINE constexpr T clear(const T t, const typename T::type m) noexcept
{
    return mask::clear(t, T{m});
}

} // namespace mask

namespace math {

/** Result of an 8 or 16-bit addition/subtraction along with its carry and half carry outputs. */
template<typename T>
struct arithmetic_result {
    T result;
    bool carry = false;
    bool half_carry = false;
};

/** Adds two bytes and an incoming carry, half carry is the carry out of bit 3. */
[[nodiscard]] FORCEINLINE constexpr arithmetic_result<u8> add_8(const u8 a, const u8 b, const bool carry_in = false) noexcept
{
    const u16 c = bit::from_bool<u16>(carry_in);
    const u16 sum = widen<u16>(a) + widen<u16>(b) + c;
    return arithmetic_result<u8>{
      narrow<u8>(sum),
      sum > 0xFF_u16,
      (a.low_nibble() + b.low_nibble() + narrow<u8>(c)) > 0x0F_u8
    };
}

/** Subtracts b and an incoming borrow from a, half carry is the borrow into bit 4. */
[[nodiscard]] FORCEINLINE constexpr arithmetic_result<u8> sub_8(const u8 a, const u8 b, const bool carry_in = false) noexcept
{
    const u16 c = bit::from_bool<u16>(carry_in);
    const u16 subtrahend = widen<u16>(b) + c;
    return arithmetic_result<u8>{
      narrow<u8>(widen<u16>(a) - subtrahend),
      widen<u16>(a) < subtrahend,
      a.low_nibble() < b.low_nibble() + narrow<u8>(c)
    };
}

/** 16-bit addition, half carry is the carry out of bit 11. */
[[nodiscard]] FORCEINLINE constexpr arithmetic_result<u16> add_16(const u16 a, const u16 b) noexcept
{
    const u32 sum = widen<u32>(a) + widen<u32>(b);
    return arithmetic_result<u16>{
      narrow<u16>(sum),
      sum > 0xFFFF_u32,
      ((a & 0x0FFF_u16) + (b & 0x0FFF_u16)) > 0x0FFF_u16
    };
}

} // namespace math

} // namespace gbc

#endif //GAMEBOICOLOR_MATH_H
