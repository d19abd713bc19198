/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_INTERRUPT_CONTROLLER_H
#define GAMEBOICOLOR_INTERRUPT_CONTROLLER_H

#include <optional>

#include <gbc/core/fwd.h>
#include <gbc/core/math.h>

namespace gbc::cpu {

// bit position is the priority, vblank is serviced first
enum class interrupt_source : u8::type {
    vblank = 1 << 0,
    lcd_stat = 1 << 1,
    timer = 1 << 2,
    serial = 1 << 3,
    joypad = 1 << 4,
};

/**
 * IE (FFFF) and IF (FF0F) pair. Only the lower five bits of IF are backed by flip-flops,
 * IE keeps all eight bits it was written with.
 */
class interrupt_controller {
    static constexpr u8 source_mask = 0x1F_u8;

    u8 ie_;
    u8 if_;

public:
    static inline constexpr auto addr_if = 0xFF0F_u16;
    static inline constexpr auto addr_ie = 0xFFFF_u16;

    void request(const interrupt_source source) noexcept { if_ |= from_enum<u8>(source); }
    void acknowledge(const interrupt_source source) noexcept { if_ = mask::clear(if_, from_enum<u8>(source)); }

    [[nodiscard]] bool any_pending() const noexcept { return pending() != 0_u8; }
    [[nodiscard]] std::optional<interrupt_source> highest_priority_pending() const noexcept;
    [[nodiscard]] static u16 vector_for(interrupt_source source) noexcept;

    [[nodiscard]] u8 read_if() const noexcept { return if_ | 0xE0_u8; }
    void write_if(const u8 data) noexcept { if_ = data & source_mask; }
    [[nodiscard]] u8 read_ie() const noexcept { return ie_; }
    void write_ie(const u8 data) noexcept { ie_ = data; }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(ie_);
        archive.serialize(if_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(ie_);
        archive.deserialize(if_);
    }

private:
    [[nodiscard]] u8 pending() const noexcept { return ie_ & if_ & source_mask; }
};

/** Lets peripherals raise interrupts without seeing the rest of the cpu. */
class irq_controller_handle {
    interrupt_controller* controller_ = nullptr;

public:
    irq_controller_handle() = default;
    explicit irq_controller_handle(interrupt_controller* controller) noexcept : controller_{controller} {}

    void request_interrupt(interrupt_source irq) noexcept;
};

} // namespace gbc::cpu

#endif //GAMEBOICOLOR_INTERRUPT_CONTROLLER_H
