/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_SERIAL_PORT_H
#define GAMEBOICOLOR_SERIAL_PORT_H

#include <gbc/core/event/event.h>
#include <gbc/core/math.h>
#include <gbc/core/scheduler.h>
#include <gbc/cpu/interrupt_controller.h>

namespace gbc::serial {

/**
 * SB/SC (FF01/FF02) without a link partner. An internally clocked transfer shifts in 1s,
 * so SB reads FF once it completes. Externally clocked transfers never complete.
 */
class port {
    scheduler* scheduler_;
    cpu::irq_controller_handle irq_;

    u8 sb_;
    u8 sc_;
    bool cgb_mode_ = false;
    bool transferring_ = false;
    scheduler::hw_event::handle transfer_handle_;

public:
    static inline constexpr auto addr_sb = 0xFF01_u16;
    static inline constexpr auto addr_sc = 0xFF02_u16;

    static constexpr u32 transfer_cycles = 4096_u32;
    static constexpr u32 fast_transfer_cycles = 128_u32;

    /** Fires with the outgoing byte when a transfer starts. */
    event<u8> event_on_transfer;

    explicit port(scheduler* s) noexcept;

    void set_irq_controller_handle(const cpu::irq_controller_handle irq) noexcept { irq_ = irq; }
    void set_cgb_mode(const bool cgb_mode) noexcept { cgb_mode_ = cgb_mode; }

    [[nodiscard]] u8 read_sb() const noexcept { return sb_; }
    [[nodiscard]] u8 read_sc() const noexcept { return sc_ | (cgb_mode_ ? 0x7C_u8 : 0x7E_u8); }
    void write_sb(const u8 data) noexcept { sb_ = data; }
    void write_sc(u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(sb_);
        archive.serialize(sc_);
        archive.serialize(transferring_);
        archive.serialize(transfer_handle_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(sb_);
        archive.deserialize(sc_);
        archive.deserialize(transferring_);
        archive.deserialize(transfer_handle_);
    }

private:
    void on_transfer_complete(u32 late_cycles) noexcept;
};

} // namespace gbc::serial

#endif //GAMEBOICOLOR_SERIAL_PORT_H
