/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/core/error.h>

namespace gbc {

namespace {

class category_impl final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept final { return "gbc"; }

    [[nodiscard]] std::string message(const int value) const final
    {
        switch(static_cast<error>(value)) {
            case error::malformed_header: return "malformed cartridge header";
            case error::unsupported_controller: return "unsupported cartridge controller";
            case error::truncated_rom: return "cartridge image is smaller than its header declares";
            case error::invalid_boot_rom: return "boot rom size does not match the hardware model";
            case error::invalid_save_data: return "save data size does not match the cartridge ram";
            case error::undefined_opcode: return "undefined opcode executed";
            case error::corrupted_state: return "save state is corrupted";
            default: return "unknown error";
        }
    }
};

} // namespace

const std::error_category& error_category() noexcept
{
    static category_impl category;
    return category;
}

} // namespace gbc
