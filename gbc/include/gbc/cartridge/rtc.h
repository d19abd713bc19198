/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_RTC_H
#define GAMEBOICOLOR_RTC_H

#include <gbc/core/container.h>
#include <gbc/core/math.h>

namespace gbc::cartridge {

/**
 * Real time clock of the variant-3 controller, clocked by emulated cycles.
 * Reads go through the latched copy, writes go to the running registers.
 */
class rtc {
public:
    enum class reg : u8::type {
        seconds = 0x08,
        minutes = 0x09,
        hours = 0x0A,
        days_lower = 0x0B,
        days_upper = 0x0C,  // bit 0 day bit 8, bit 6 halt, bit 7 day carry
    };

    static constexpr u32 cycles_per_second = 4'194'304_u32;

private:
    static constexpr u8 halt_bit = 6_u8;
    static constexpr u8 carry_bit = 7_u8;

    array<u8, 5> regs_{};
    array<u8, 5> latched_regs_{};
    u32 subsecond_cycles_;

public:
    void tick(u32 cycles) noexcept;
    void latch() noexcept { latched_regs_ = regs_; }

    [[nodiscard]] u8 read(reg r) const noexcept;
    void write(reg r, u8 data) noexcept;

    [[nodiscard]] bool halted() const noexcept { return regs_[index_of(reg::days_upper)].test_bit(halt_bit); }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(regs_);
        archive.serialize(latched_regs_);
        archive.serialize(subsecond_cycles_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(regs_);
        archive.deserialize(latched_regs_);
        archive.deserialize(subsecond_cycles_);
    }

private:
    [[nodiscard]] static usize index_of(const reg r) noexcept { return from_enum<usize>(r) - from_enum<usize>(reg::seconds); }
    [[nodiscard]] u8& at(const reg r) noexcept { return regs_[index_of(r)]; }

    void advance_one_second() noexcept;
};

} // namespace gbc::cartridge

#endif //GAMEBOICOLOR_RTC_H
