/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_DELEGATE_H
#define GAMEBOICOLOR_DELEGATE_H

#include <functional>   // std::invoke
#include <type_traits>
#include <utility>

#include <gbc/helper/macros.h>

namespace gbc {

/** Tag type to select the function a delegate binds to at compile time. */
template<auto>
struct connect_arg_t {
    explicit constexpr connect_arg_t() noexcept = default;
};

template<auto Func>
inline constexpr connect_arg_t<Func> connect_arg{};

template<typename>
class delegate;

/**
 * Non-owning, copyable callable bound to a free function or to a member function and an instance.
 * Two delegates compare equal if they call the same function on the same instance.
 *
 * @tparam Ret Return type of the bound function
 * @tparam Args Argument types of the bound function
 */
template<typename Ret, typename... Args>
class delegate<Ret(Args...)> {
    using function_type = Ret(void*, Args...);

    function_type* function_ = nullptr;
    void* instance_ = nullptr;

public:
    constexpr delegate() noexcept = default;

    template<auto Candidate>
    delegate(connect_arg_t<Candidate>) noexcept // NOLINT
    {
        connect<Candidate>();
    }

    template<auto Candidate, typename Type>
    delegate(connect_arg_t<Candidate>, Type* instance) noexcept
    {
        connect<Candidate>(instance);
    }

    template<auto Candidate>
    void connect() noexcept
    {
        instance_ = nullptr;
        function_ = [](void*, Args... args) -> Ret {
            return static_cast<Ret>(std::invoke(Candidate, std::forward<Args>(args)...));
        };
    }

    template<auto Candidate, typename Type>
    void connect(Type* instance) noexcept
    {
        static_assert(std::is_member_function_pointer_v<decltype(Candidate)>);
        instance_ = const_cast<std::remove_const_t<Type>*>(instance); // NOLINT
        function_ = [](void* payload, Args... args) -> Ret {
            Type* bound_instance = static_cast<Type*>(payload);
            return static_cast<Ret>(std::invoke(Candidate, bound_instance, std::forward<Args>(args)...));
        };
    }

    void reset() noexcept
    {
        function_ = nullptr;
        instance_ = nullptr;
    }

    [[nodiscard]] bool is_valid() const noexcept { return function_ != nullptr; }
    explicit operator bool() const noexcept { return is_valid(); }

    Ret operator()(Args... args) const
    {
        ASSERT(is_valid());
        return function_(instance_, std::forward<Args>(args)...);
    }

    bool operator==(const delegate& other) const noexcept
    {
        return function_ == other.function_ && instance_ == other.instance_;
    }

    bool operator!=(const delegate& other) const noexcept { return !(*this == other); }
};

} // namespace gbc

#endif //GAMEBOICOLOR_DELEGATE_H
