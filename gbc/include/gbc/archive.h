/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_ARCHIVE_H
#define GAMEBOICOLOR_ARCHIVE_H

#include <algorithm>
#include <iterator>
#include <string_view>
#include <type_traits>

#include <gbc/core/container.h>

namespace gbc {

/**
 * Little endian byte archive used for save states.
 * Reading past the end or encountering unknown content marks the archive as corrupted,
 * after which every read yields zeroes and the caller is expected to discard the result.
 */
class archive {
    vector<u8> data_;
    mutable usize read_pos_;
    mutable bool corrupted_ = false;

public:
    archive() = default;
    explicit archive(vector<u8> data)
      : data_{std::move(data)} {}

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] const vector<u8>& data() const noexcept { return data_; }
    [[nodiscard]] bool corrupted() const noexcept { return corrupted_; }
    [[nodiscard]] bool fully_consumed() const noexcept { return read_pos_ == data_.size(); }
    void mark_corrupted() const noexcept { corrupted_ = true; }

    void seek_to_start() noexcept
    {
        read_pos_ = 0_usize;
        corrupted_ = false;
    }

    void clear() noexcept
    {
        data_.clear();
        seek_to_start();
    }

    template<typename T, usize::type N>
    void serialize(const array<T, N>& data) noexcept
    {
        static_assert(!std::is_pointer_v<T>, "array of pointers are not supported");

        for(const T& e : data) {
            serialize(e);
        }
    }

    template<typename T>
    void serialize(const vector<T>& data) noexcept
    {
        static_assert(!std::is_pointer_v<T>, "vector of pointers are not supported");

        serialize(data.size());
        for(const T& e : data) {
            serialize(e);
        }
    }

    template<typename T>
    void serialize(const integer<T> data) noexcept
    {
        if constexpr(std::is_same_v<integer<T>, u8>) {
            data_.push_back(data);
        } else {
            write_bytes(make_byte_view(data));
        }
    }

    void serialize(const std::string_view& data) noexcept
    {
        const usize size = data.size();
        serialize(size);
        write_bytes(make_byte_view(data.data(), size));
    }

    template<typename T>
    void serialize(const T& t) noexcept
    {
        if constexpr(std::is_enum_v<T>) {
            using underlying_int = integer<std::underlying_type_t<T>>;
            serialize(from_enum<underlying_int>(t));
        } else if constexpr(std::is_floating_point_v<T>) {
            write_bytes(make_byte_view(t));
        } else if constexpr(std::is_same_v<T, bool>) {
            serialize(u8{static_cast<u8::type>(t)});
        } else {
            t.serialize(*this);
        }
    }

    /*****************************/

    template<typename T>
    T deserialize() const noexcept
    {
        T t;
        deserialize(t);
        return t;
    }

    template<typename T, usize::type N>
    void deserialize(array<T, N>& data) const noexcept
    {
        static_assert(!std::is_pointer_v<T>, "array of pointers are not supported");

        for(T& e : data) {
            deserialize(e);
        }
    }

    template<typename T>
    void deserialize(vector<T>& data) const noexcept
    {
        static_assert(!std::is_pointer_v<T>, "vector of pointers are not supported");

        const auto size = deserialize<usize>();
        if(size > data_.size() - read_pos_) {
            mark_corrupted();
            return;
        }

        data.resize(size);
        for(T& e : data) {
            deserialize(e);
        }
    }

    template<typename T>
    void deserialize(integer<T>& data) const noexcept
    {
        if constexpr(std::is_same_v<integer<T>, u8>) {
            if(UNLIKELY(corrupted_ || read_pos_ >= data_.size())) {
                mark_corrupted();
                data = 0_u8;
                return;
            }
            data = data_[read_pos_++];
        } else {
            read_bytes(data);
        }
    }

    void deserialize(std::string_view& data) const noexcept
    {
        const auto size = deserialize<usize>();
        if(corrupted_ || size > data_.size() - read_pos_) {
            mark_corrupted();
            data = std::string_view{};
            return;
        }

        const u8* begin = data_.ptr(read_pos_);
        data = std::string_view{reinterpret_cast<const char*>(begin), size.get()};
        read_pos_ += size;
    }

    template<typename T>
    void deserialize(T& t) const noexcept
    {
        if constexpr(std::is_enum_v<T>) {
            using underlying_int = integer<std::underlying_type_t<T>>;
            t = to_enum<T>(deserialize<underlying_int>());
        } else if constexpr(std::is_floating_point_v<T>) {
            read_bytes(t);
        } else if constexpr(std::is_same_v<T, bool>) {
            t = static_cast<bool>(deserialize<u8>().get());
        } else {
            t.deserialize(*this);
        }
    }

private:
    FORCEINLINE void write_bytes(const view<u8> v) noexcept
    {
        std::copy(v.begin(), v.end(), std::back_inserter(data_));
    }

    template<typename T>
    FORCEINLINE void read_bytes(T& e) const noexcept
    {
        if(UNLIKELY(corrupted_ || data_.size() - read_pos_ < sizeof(T) || read_pos_ > data_.size())) {
            mark_corrupted();
            e = T{};
            return;
        }

        const u8* begin = data_.ptr(read_pos_);
        std::copy(begin, begin + sizeof(T), reinterpret_cast<u8*>(std::addressof(e))); // NOLINT
        read_pos_ += sizeof(T);
    }

    template<typename T>
    FORCEINLINE static view<u8> make_byte_view(const T* p, usize size) noexcept
    {
        constexpr usize elem_bytes = sizeof(T);
        return view<u8>{reinterpret_cast<const u8*>(p), size * elem_bytes}; // NOLINT
    }

    template<typename T>
    FORCEINLINE static view<u8> make_byte_view(const T& v) noexcept
    {
        constexpr usize elem_bytes = sizeof(T);
        return view<u8>{reinterpret_cast<const u8*>(&v), elem_bytes}; // NOLINT
    }
};

} // namespace gbc

#endif  // GAMEBOICOLOR_ARCHIVE_H
