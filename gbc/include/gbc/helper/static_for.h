/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_STATIC_FOR_H
#define GAMEBOICOLOR_STATIC_FOR_H

#include <type_traits>
#include <utility>

namespace gbc {

namespace detail {

template<typename T, T First, typename F, T... Offsets>
constexpr void static_for_impl(F& f, std::integer_sequence<T, Offsets...>) noexcept
{
    (f(std::integral_constant<T, First + Offsets>{}), ...);
}

} // namespace detail

/** Calls f with every std::integral_constant in [First, Last). */
template<typename T, T First, T Last, typename F>
constexpr void static_for(F&& f) noexcept
{
    static_assert(First <= Last);
    detail::static_for_impl<T, First>(f, std::make_integer_sequence<T, Last - First>{});
}

} // namespace gbc

#endif //GAMEBOICOLOR_STATIC_FOR_H
