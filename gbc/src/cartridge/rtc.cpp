/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/cartridge/rtc.h>

namespace gbc::cartridge {

namespace {

// writable bits of each register, in register order
constexpr array<u8, 5> register_masks{0x3F_u8, 0x3F_u8, 0x1F_u8, 0xFF_u8, 0xC1_u8};

} // namespace

void rtc::tick(const u32 cycles) noexcept
{
    if(halted()) {
        return;
    }

    subsecond_cycles_ += cycles;
    while(subsecond_cycles_ >= cycles_per_second) {
        subsecond_cycles_ -= cycles_per_second;
        advance_one_second();
    }
}

u8 rtc::read(const reg r) const noexcept
{
    return latched_regs_[index_of(r)];
}

void rtc::write(const reg r, const u8 data) noexcept
{
    if(r == reg::seconds) {
        subsecond_cycles_ = 0_u32;
    }

    const usize idx = index_of(r);
    regs_[idx] = data & register_masks[idx];
}

void rtc::advance_one_second() noexcept
{
    // out of range values count up to the register limit and wrap without a carry
    u8& seconds = at(reg::seconds);
    seconds = (seconds + 1_u8) & 0x3F_u8;
    if(seconds != 60_u8) {
        return;
    }
    seconds = 0_u8;

    u8& minutes = at(reg::minutes);
    minutes = (minutes + 1_u8) & 0x3F_u8;
    if(minutes != 60_u8) {
        return;
    }
    minutes = 0_u8;

    u8& hours = at(reg::hours);
    hours = (hours + 1_u8) & 0x1F_u8;
    if(hours != 24_u8) {
        return;
    }
    hours = 0_u8;

    u8& days_lower = at(reg::days_lower);
    u8& days_upper = at(reg::days_upper);
    ++days_lower;
    if(days_lower != 0_u8) {
        return;
    }

    if(days_upper.test_bit(0_u8)) {
        days_upper = bit::set(bit::clear(days_upper, 0_u8), carry_bit);
    } else {
        days_upper = bit::set(days_upper, 0_u8);
    }
}

} // namespace gbc::cartridge
