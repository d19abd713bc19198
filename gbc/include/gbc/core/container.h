/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_CONTAINER_H
#define GAMEBOICOLOR_CONTAINER_H

#include <cstring>  // std::memcpy
#include <initializer_list>
#include <utility>
#include <vector>

#include <gbc/core/integer.h>

namespace gbc {

/** Fixed size storage indexed by usize. */
template<typename T, usize::type N>
struct array {
    using value_type = T;

    T _data[N]; // NOLINT

    [[nodiscard]] constexpr T& operator[](const usize idx) noexcept { return _data[idx.get()]; }
    [[nodiscard]] constexpr const T& operator[](const usize idx) const noexcept { return _data[idx.get()]; }
    [[nodiscard]] T* data() noexcept { return _data; }
    [[nodiscard]] const T* data() const noexcept { return _data; }

    [[nodiscard]] constexpr usize size() const noexcept { return N; }

    constexpr T* begin() noexcept { return _data; }
    constexpr T* end() noexcept { return _data + N; }
    constexpr const T* begin() const noexcept { return _data; }
    constexpr const T* end() const noexcept { return _data + N; }
};

/** Growable storage indexed by usize, used for images, memories and archives. */
template<typename T>
class vector {
    std::vector<T> data_;

public:
    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    vector() = default;
    explicit vector(const usize size)
      : data_(size.get()) {}
    vector(const usize size, const T& value)
      : data_(size.get(), value) {}
    vector(std::initializer_list<T> init)
      : data_(init) {}
    template<typename It>
    vector(It first, It last)
      : data_(first, last) {}

    [[nodiscard]] T& operator[](const usize idx) noexcept { return data_[idx.get()]; }
    [[nodiscard]] const T& operator[](const usize idx) const noexcept { return data_[idx.get()]; }
    [[nodiscard]] const T* ptr(const usize idx) const noexcept { return data_.data() + idx.get(); }
    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }
    [[nodiscard]] const T& front() const noexcept { ASSERT(!empty()); return data_.front(); }

    template<typename... Args>
    T& emplace_back(Args&&... args) { return data_.emplace_back(std::forward<Args>(args)...); }
    void push_back(const T& t) { data_.push_back(t); }
    void pop_back() noexcept { data_.pop_back(); }
    iterator erase(const_iterator first, const_iterator last) { return data_.erase(first, last); }
    void clear() noexcept { data_.clear(); }
    void resize(const usize new_size) { data_.resize(new_size.get()); }
    void reserve(const usize capacity) { data_.reserve(capacity.get()); }

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] usize size() const noexcept { return data_.size(); }

    iterator begin() noexcept { return data_.begin(); }
    iterator end() noexcept { return data_.end(); }
    const_iterator begin() const noexcept { return data_.begin(); }
    const_iterator end() const noexcept { return data_.end(); }

    bool operator==(const vector& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const vector& other) const noexcept { return !(*this == other); }
};

/** Read-only window over contiguous memory, it does not own what it points to. */
template<typename T>
class view {
    const T* data_ = nullptr;
    usize size_;

public:
    constexpr view() noexcept = default;
    constexpr view(const T* data, const usize size) noexcept
      : data_{data}, size_{size} {}

    view(const vector<T>& vec) noexcept // NOLINT
      : data_{vec.data()}, size_{vec.size()} {}

    [[nodiscard]] constexpr const T* data() const noexcept { return data_; }
    [[nodiscard]] constexpr usize size() const noexcept { return size_; }

    constexpr const T* begin() const noexcept { return data_; }
    constexpr const T* end() const noexcept { return data_ + size_.get(); } // NOLINT
};

// unaligned read of a trivially copyable value at a byte offset
template<typename T, typename Container>
[[nodiscard]] T read_unaligned(const Container& container, const usize offset) noexcept
{
    T value;
    std::memcpy(&value, container.ptr(offset), sizeof(T));
    return value;
}

} // namespace gbc

#endif //GAMEBOICOLOR_CONTAINER_H
