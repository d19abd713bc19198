/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_TIMER_H
#define GAMEBOICOLOR_TIMER_H

#include <gbc/core/fwd.h>
#include <gbc/core/math.h>
#include <gbc/cpu/interrupt_controller.h>

namespace gbc::timer {

/**
 * DIV/TIMA/TMA/TAC block.
 *
 * DIV is the upper byte of a 16-bit counter advancing every cycle. TIMA increments on the
 * falling edge of (TAC enable AND the counter bit selected by TAC), so writes to DIV or TAC
 * can produce an extra increment. After an overflow TIMA reads 0 for one machine cycle,
 * then it is reloaded from TMA and the timer interrupt is requested.
 */
class timer {
    enum class reload_state : u8::type {
        running,
        overflowed,  // TIMA is 0, reload happens on the next machine cycle
        reloaded     // TMA was copied into TIMA during this machine cycle
    };

    cpu::irq_controller_handle irq_;

    u16 div_;
    u8 tima_;
    u8 tma_;
    u8 tac_;
    reload_state state_{reload_state::running};

public:
    static inline constexpr auto addr_div = 0xFF04_u16;
    static inline constexpr auto addr_tima = 0xFF05_u16;
    static inline constexpr auto addr_tma = 0xFF06_u16;
    static inline constexpr auto addr_tac = 0xFF07_u16;

    void set_irq_controller_handle(const cpu::irq_controller_handle irq) noexcept { irq_ = irq; }

    void tick(u32 cycles) noexcept;

    [[nodiscard]] u8 read_div() const noexcept { return narrow<u8>(div_ >> 8_u16); }
    [[nodiscard]] u8 read_tima() const noexcept { return tima_; }
    [[nodiscard]] u8 read_tma() const noexcept { return tma_; }
    [[nodiscard]] u8 read_tac() const noexcept { return tac_ | 0xF8_u8; }

    void write_div() noexcept;
    void write_tima(u8 data) noexcept;
    void write_tma(u8 data) noexcept;
    void write_tac(u8 data) noexcept;

    // used to set up the post-boot state
    void set_internal_counter(const u16 counter) noexcept { div_ = counter; }
    [[nodiscard]] u16 internal_counter() const noexcept { return div_; }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(div_);
        archive.serialize(tima_);
        archive.serialize(tma_);
        archive.serialize(tac_);
        archive.serialize(state_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(div_);
        archive.deserialize(tima_);
        archive.deserialize(tma_);
        archive.deserialize(tac_);
        archive.deserialize(state_);
        if(from_enum<u8>(state_) > from_enum<u8>(reload_state::reloaded)) {
            archive.mark_corrupted();
        }
    }

private:
    [[nodiscard]] static bool signal(u16 counter, u8 tac) noexcept;
    [[nodiscard]] bool signal() const noexcept { return signal(div_, tac_); }

    void tick_machine_cycle() noexcept;
    void increment_tima() noexcept;
};

} // namespace gbc::timer

#endif //GAMEBOICOLOR_TIMER_H
