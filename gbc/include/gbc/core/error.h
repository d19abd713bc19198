/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_ERROR_H
#define GAMEBOICOLOR_ERROR_H

#include <string>
#include <system_error>

namespace gbc {

enum class error {
    // load time
    malformed_header = 1,
    unsupported_controller,
    truncated_rom,
    invalid_boot_rom,
    invalid_save_data,

    // execution
    undefined_opcode,

    // save states
    corrupted_state,
};

[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(const error e) noexcept
{
    return std::error_code{static_cast<int>(e), error_category()};
}

} // namespace gbc

namespace std {

template<>
struct is_error_code_enum<gbc::error> : true_type {};

} // namespace std

#endif //GAMEBOICOLOR_ERROR_H
