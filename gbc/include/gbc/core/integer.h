/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_INTEGER_H
#define GAMEBOICOLOR_INTEGER_H

// unsigned strong integers for the 8, 16 and 32-bit quantities of the machine.
// a value converts implicitly into a type at least as wide, anything narrower goes through narrow<>.
// literals yield the raw type so they stay usable as case labels and template arguments.

#include <cstdint>
#include <type_traits>

#include <fmt/core.h>

#include <gbc/helper/macros.h>

namespace gbc {

template<typename>
class integer;

namespace detail {

template<typename T> inline constexpr bool is_raw_unsigned_v =
  std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>;

template<typename From, typename To>
inline constexpr bool fits_in_v = is_raw_unsigned_v<From> && is_raw_unsigned_v<To> && sizeof(From) <= sizeof(To);

template<typename From, typename To>
using enable_fits_in = std::enable_if_t<fits_in_v<From, To>>;

template<typename A, typename B>
using enable_unsigned_pair = std::enable_if_t<is_raw_unsigned_v<A> && is_raw_unsigned_v<B>>;

template<typename A, typename B>
using wider_t = std::conditional_t<(sizeof(A) >= sizeof(B)), A, B>;

template<typename A, typename B>
using arithmetic_result_t = std::enable_if_t<is_raw_unsigned_v<A> && is_raw_unsigned_v<B>, wider_t<A, B>>;

template<typename A, typename B>
using bitwise_result_t = std::enable_if_t<fits_in_v<B, A>, A>;

template<typename A, typename B>
using shift_result_t = std::enable_if_t<is_raw_unsigned_v<A> && std::is_integral_v<B>, A>;

template<typename T> struct raw_type { using type = T; };
template<typename T> struct raw_type<integer<T>> { using type = T; };

template<typename T>
using raw_type_t = typename raw_type<T>::type;

template<typename T>
FORCEINLINE constexpr raw_type_t<T> raw(const T t) noexcept
{
    if constexpr(std::is_same_v<T, raw_type_t<T>>) {
        return t;
    } else {
        return t.get();
    }
}

} // namespace detail

template<typename Integer>
class integer {
    static_assert(detail::is_raw_unsigned_v<Integer>, "strong integers are unsigned");

    Integer value_{0};

    template<typename I>
    using enable_for_byte = std::enable_if_t<sizeof(I) == 1>;
    template<typename I>
    using enable_for_word = std::enable_if_t<sizeof(I) == 2>;

public:
    using type = Integer;

    FORCEINLINE constexpr integer() noexcept = default;

    template<typename T, typename = detail::enable_fits_in<T, Integer>>
    FORCEINLINE constexpr integer(const T value) noexcept
      : value_{value} {}

    template<typename T, typename = detail::enable_fits_in<T, Integer>>
    FORCEINLINE constexpr integer(const integer<T> value) noexcept
      : value_{value.get()} {}

    FORCEINLINE explicit constexpr operator Integer() const noexcept { return value_; }
    [[nodiscard]] FORCEINLINE constexpr Integer get() const noexcept { return value_; }

    FORCEINLINE constexpr integer& operator++() noexcept { ++value_; return *this; }
    FORCEINLINE constexpr integer operator++(int) noexcept
    {
        const integer res = *this;
        ++value_;
        return res;
    }

    FORCEINLINE constexpr integer& operator--() noexcept { --value_; return *this; }
    FORCEINLINE constexpr integer operator--(int) noexcept
    {
        const integer res = *this;
        --value_;
        return res;
    }

    FORCEINLINE constexpr integer operator~() const noexcept { return static_cast<Integer>(~value_); }

    // the right hand side must fit into this type
#define MAKE_OP(Op)                                                                                 \
    template<typename T, typename = detail::enable_fits_in<detail::raw_type_t<T>, Integer>>         \
    FORCEINLINE constexpr integer& operator Op(const T other) noexcept                              \
    {                                                                                               \
        value_ Op detail::raw(other);                                                               \
        return *this;                                                                               \
    }

    MAKE_OP(+=)
    MAKE_OP(-=)
    MAKE_OP(|=)
    MAKE_OP(&=)
    MAKE_OP(^=)

#undef MAKE_OP

    template<typename T, typename = std::enable_if_t<std::is_integral_v<detail::raw_type_t<T>>>>
    FORCEINLINE constexpr integer& operator<<=(const T amount) noexcept
    {
        value_ <<= detail::raw(amount);
        return *this;
    }

    template<typename T, typename = std::enable_if_t<std::is_integral_v<detail::raw_type_t<T>>>>
    FORCEINLINE constexpr integer& operator>>=(const T amount) noexcept
    {
        value_ >>= detail::raw(amount);
        return *this;
    }

    [[nodiscard]] FORCEINLINE constexpr bool test_bit(const integer<uint8_t> b) const noexcept
    {
        return ((value_ >> b.get()) & 1U) != 0U;
    }

    // bytes

    template<typename I = Integer, typename = enable_for_byte<I>>
    [[nodiscard]] FORCEINLINE constexpr integer low_nibble() const noexcept { return static_cast<Integer>(value_ & 0x0FU); }

    template<typename I = Integer, typename = enable_for_byte<I>>
    [[nodiscard]] FORCEINLINE constexpr integer swapped_nibbles() const noexcept
    {
        return static_cast<Integer>((value_ << 4U) | (value_ >> 4U));
    }

    /** Treats the byte as a two's complement offset, as relative jumps and sp adjustments do. */
    template<typename I = Integer, typename = enable_for_byte<I>>
    [[nodiscard]] FORCEINLINE constexpr integer<uint16_t> sign_extended() const noexcept
    {
        return static_cast<uint16_t>(static_cast<int16_t>(static_cast<int8_t>(value_)));
    }

    // words

    template<typename I = Integer, typename = enable_for_word<I>>
    [[nodiscard]] FORCEINLINE constexpr integer<uint8_t> high_byte() const noexcept { return static_cast<uint8_t>(value_ >> 8U); }

    template<typename I = Integer, typename = enable_for_word<I>>
    [[nodiscard]] FORCEINLINE constexpr integer<uint8_t> low_byte() const noexcept { return static_cast<uint8_t>(value_); }

    template<typename I = Integer, typename = enable_for_word<I>>
    [[nodiscard]] static FORCEINLINE constexpr integer from_bytes(const integer<uint8_t> high, const integer<uint8_t> low) noexcept
    {
        return static_cast<Integer>((high.get() << 8U) | low.get());
    }
};

using u8 = integer<uint8_t>;
using u16 = integer<uint16_t>;
using u32 = integer<uint32_t>;
using u64 = integer<uint64_t>;
using usize = integer<std::size_t>;

template<typename To, typename From>
[[nodiscard]] FORCEINLINE constexpr To narrow(const From from) noexcept
{
    static_assert(sizeof(typename To::type) <= sizeof(typename From::type), "narrow() shouldn't widen integers");
    return static_cast<typename To::type>(from.get());
}

template<typename To, typename From>
[[nodiscard]] FORCEINLINE constexpr To widen(const From from) noexcept
{
    static_assert(sizeof(typename To::type) >= sizeof(typename From::type), "widen() shouldn't narrow integers");
    return static_cast<typename To::type>(from.get());
}

template<typename Integer, typename Enum>
[[nodiscard]] FORCEINLINE constexpr Integer from_enum(const Enum e) noexcept
{
    static_assert(std::is_enum_v<Enum>);
    return static_cast<typename Integer::type>(static_cast<std::underlying_type_t<Enum>>(e));
}

template<typename Enum, typename Integer>
[[nodiscard]] FORCEINLINE constexpr Enum to_enum(const Integer i) noexcept
{
    static_assert(std::is_enum_v<Enum>);
    return static_cast<Enum>(i.get());
}

// binary ops take a strong integer on at least one side, the result has the wider type.
// bitwise ops keep the left hand type, which must be the wider one.

#define MAKE_OPS(Op, Result)                                                                        \
    template<typename A, typename B>                                                                \
    FORCEINLINE constexpr integer<detail::Result<A, B>> operator Op(const integer<A> a, const integer<B> b) noexcept \
    {                                                                                               \
        return static_cast<detail::Result<A, B>>(a.get() Op b.get());                               \
    }                                                                                               \
    template<typename A, typename B>                                                                \
    FORCEINLINE constexpr integer<detail::Result<A, B>> operator Op(const A a, const integer<B> b) noexcept \
    {                                                                                               \
        return static_cast<detail::Result<A, B>>(a Op b.get());                                     \
    }                                                                                               \
    template<typename A, typename B>                                                                \
    FORCEINLINE constexpr integer<detail::Result<A, B>> operator Op(const integer<A> a, const B b) noexcept \
    {                                                                                               \
        return static_cast<detail::Result<A, B>>(a.get() Op b);                                     \
    }

MAKE_OPS(+, arithmetic_result_t)
MAKE_OPS(-, arithmetic_result_t)
MAKE_OPS(*, arithmetic_result_t)
MAKE_OPS(/, arithmetic_result_t)
MAKE_OPS(%, arithmetic_result_t)
MAKE_OPS(&, bitwise_result_t)
MAKE_OPS(|, bitwise_result_t)
MAKE_OPS(^, bitwise_result_t)
MAKE_OPS(<<, shift_result_t)
MAKE_OPS(>>, shift_result_t)

#undef MAKE_OPS

#define MAKE_OP(Op)                                                                                 \
    template<typename A, typename B, typename = detail::enable_unsigned_pair<A, B>>                 \
    FORCEINLINE constexpr bool operator Op(const integer<A> a, const integer<B> b) noexcept         \
    {                                                                                               \
        return a.get() Op b.get();                                                                  \
    }                                                                                               \
    template<typename A, typename B, typename = detail::enable_unsigned_pair<A, B>>                 \
    FORCEINLINE constexpr bool operator Op(const A a, const integer<B> b) noexcept                  \
    {                                                                                               \
        return a Op b.get();                                                                        \
    }                                                                                               \
    template<typename A, typename B, typename = detail::enable_unsigned_pair<A, B>>                 \
    FORCEINLINE constexpr bool operator Op(const integer<A> a, const B b) noexcept                  \
    {                                                                                               \
        return a.get() Op b;                                                                        \
    }

MAKE_OP(==)
MAKE_OP(!=)
MAKE_OP(<)
MAKE_OP(<=)
MAKE_OP(>)
MAKE_OP(>=)

#undef MAKE_OP

inline namespace integer_literals {

FORCEINLINE constexpr u8::type operator ""_u8(unsigned long long v) noexcept { return static_cast<u8::type>(v); }
FORCEINLINE constexpr u16::type operator ""_u16(unsigned long long v) noexcept { return static_cast<u16::type>(v); }
FORCEINLINE constexpr u32::type operator ""_u32(unsigned long long v) noexcept { return static_cast<u32::type>(v); }
FORCEINLINE constexpr u64::type operator ""_u64(unsigned long long v) noexcept { return v; }
FORCEINLINE constexpr usize::type operator ""_usize(unsigned long long v) noexcept { return static_cast<usize::type>(v); }

FORCEINLINE constexpr usize operator ""_kb(unsigned long long v) noexcept { return static_cast<usize::type>(v * 1024U); }

} // inline namespace integer_literals

} // namespace gbc

template<typename T>
struct fmt::formatter<gbc::integer<T>> : formatter<T> {
    template<typename FormatContext>
    auto format(const gbc::integer<T> i, FormatContext& ctx) const
    {
        return formatter<T>::format(i.get(), ctx);
    }
};

#endif //GAMEBOICOLOR_INTEGER_H
