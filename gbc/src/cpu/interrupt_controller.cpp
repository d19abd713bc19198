/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/cpu/interrupt_controller.h>

#include <gbc/helper/range.h>

namespace gbc::cpu {

std::optional<interrupt_source> interrupt_controller::highest_priority_pending() const noexcept
{
    const u8 requests = pending();
    if(requests == 0_u8) {
        return std::nullopt;
    }

    for(const u8 bit_idx : range<u8>(5_u8)) {
        if(requests.test_bit(bit_idx)) {
            return to_enum<interrupt_source>(bit::bit<u8>(bit_idx));
        }
    }

    UNREACHABLE();
}

u16 interrupt_controller::vector_for(const interrupt_source source) noexcept
{
    switch(source) {
        case interrupt_source::vblank:   return 0x0040_u16;
        case interrupt_source::lcd_stat: return 0x0048_u16;
        case interrupt_source::timer:    return 0x0050_u16;
        case interrupt_source::serial:   return 0x0058_u16;
        case interrupt_source::joypad:   return 0x0060_u16;
        default:
            UNREACHABLE();
    }
}

void irq_controller_handle::request_interrupt(const interrupt_source irq) noexcept
{
    ASSERT(controller_ != nullptr);
    controller_->request(irq);
}

} // namespace gbc::cpu
