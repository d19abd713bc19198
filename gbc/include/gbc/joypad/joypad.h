/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_JOYPAD_H
#define GAMEBOICOLOR_JOYPAD_H

#include <atomic>

#include <gbc/core/math.h>
#include <gbc/cpu/interrupt_controller.h>

namespace gbc::joypad {

enum class key : u8::type {
    right = 0_u8,
    left = 1_u8,
    up = 2_u8,
    down = 3_u8,
    a = 4_u8,
    b = 5_u8,
    select = 6_u8,
    start = 7_u8,
};

/**
 * P1/JOYP (FF00). Key state may be set from any thread, the register observes
 * the latest state on the next read.
 */
class joypad {
    static constexpr u8 select_directions_bit = 4_u8;
    static constexpr u8 select_buttons_bit = 5_u8;

    cpu::irq_controller_handle irq_;

    std::atomic<u8::type> pressed_{0_u8};
    u8 select_ = 0x30_u8;
    u8 last_lines_ = 0x0F_u8;

public:
    static inline constexpr auto addr_joyp = 0xFF00_u16;

    void set_irq_controller_handle(const cpu::irq_controller_handle irq) noexcept { irq_ = irq; }

    void set_button_state(const key k, const bool pressed) noexcept
    {
        const u8 key_bit = bit::bit<u8>(from_enum<u8>(k));
        if(pressed) {
            pressed_.fetch_or(key_bit.get());
        } else {
            pressed_.fetch_and((~key_bit).get());
        }
    }

    [[nodiscard]] u8 read() const noexcept { return 0xC0_u8 | select_ | input_lines(); }
    void write(const u8 data) noexcept { select_ = data & 0x30_u8; }

    /** Requests the joypad interrupt on a high to low transition of any line, returns whether one happened. */
    bool poll() noexcept
    {
        const u8 lines = input_lines();
        const bool falling_edge = (last_lines_ & ~lines & 0x0F_u8) != 0_u8;
        last_lines_ = lines;

        if(falling_edge) {
            irq_.request_interrupt(cpu::interrupt_source::joypad);
        }
        return falling_edge;
    }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(select_);
        archive.serialize(last_lines_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(select_);
        archive.deserialize(last_lines_);
    }

private:
    // active low
    [[nodiscard]] u8 input_lines() const noexcept
    {
        const u8 pressed = pressed_.load();
        u8 lines = 0x0F_u8;
        if(!select_.test_bit(select_directions_bit)) {
            lines &= ~(pressed & 0x0F_u8);
        }
        if(!select_.test_bit(select_buttons_bit)) {
            lines &= ~(pressed >> 4_u8);
        }
        return lines;
    }
};

} // namespace gbc::joypad

#endif //GAMEBOICOLOR_JOYPAD_H
