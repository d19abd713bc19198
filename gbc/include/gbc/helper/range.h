/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_RANGE_H
#define GAMEBOICOLOR_RANGE_H

#include <gbc/core/integer.h>

namespace gbc {

/** Counts from min up to, but not including, max. Used as `for(const u8 i : range<u8>(5_u8))`. */
template<typename T>
class range {
    T min_;
    T max_;

public:
    class iterator {
        T current_;

    public:
        FORCEINLINE constexpr explicit iterator(const T current) noexcept
          : current_{current} {}

        FORCEINLINE constexpr iterator& operator++() noexcept { ++current_; return *this; }
        FORCEINLINE constexpr T operator*() const noexcept { return current_; }
        FORCEINLINE constexpr bool operator!=(const iterator& other) const noexcept { return current_ != other.current_; }
    };

    FORCEINLINE constexpr explicit range(const T max) noexcept
      : min_{}, max_{max} {}

    FORCEINLINE constexpr range(const T min, const T max) noexcept
      : min_{min}, max_{max} { ASSERT(min <= max); }

    [[nodiscard]] FORCEINLINE constexpr iterator begin() const noexcept { return iterator{min_}; }
    [[nodiscard]] FORCEINLINE constexpr iterator end() const noexcept { return iterator{max_}; }
};

} // namespace gbc

#endif //GAMEBOICOLOR_RANGE_H
