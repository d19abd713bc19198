#ifndef GAMEBOICOLOR_FUNCTION_PTR_H
#define GAMEBOICOLOR_FUNCTION_PTR_H

#include <functional>
#include <utility>

namespace gbc {

/**
 * Thin constexpr friendly wrapper over a member function pointer,
 * used to build opcode dispatch tables at compile time.
 * Unlike gbc::delegate it does not carry an instance, the instance is the first call argument.
 */
template<typename, typename>
struct function_ptr;

template<typename Class, typename Ret, typename... Args>
struct function_ptr<Class, Ret(Args...)> {
    using type = Ret (Class::*)(Args...);

    type ptr = nullptr;

    template<typename... T>
    constexpr Ret operator()(Class* instance, T&&... args) const { return std::invoke(ptr, instance, std::forward<T>(args)...); }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return ptr != nullptr; }
    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

template<typename Class, typename Ret, typename... Args>
function_ptr(Ret(Class::*)(Args...)) noexcept -> function_ptr<Class, Ret(Args...)>;

} // namespace gbc

#endif //GAMEBOICOLOR_FUNCTION_PTR_H
