/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/timer/timer.h>

#include <gbc/core/container.h>

namespace gbc::timer {

namespace {

// counter bit watched for each TAC clock select, 4096 Hz, 262144 Hz, 65536 Hz, 16384 Hz
constexpr array<u8, 4> tima_counter_bits{9_u8, 3_u8, 5_u8, 7_u8};

} // namespace

void timer::tick(const u32 cycles) noexcept
{
    ASSERT((cycles & 0b11_u32) == 0_u32);
    for(u32 elapsed = 0_u32; elapsed < cycles; elapsed += 4_u32) {
        tick_machine_cycle();
    }
}

void timer::write_div() noexcept
{
    const bool old_signal = signal();
    div_ = 0_u16;
    if(old_signal) {
        increment_tima();
    }
}

void timer::write_tima(const u8 data) noexcept
{
    switch(state_) {
        case reload_state::overflowed:
            // cancels the pending reload and interrupt
            tima_ = data;
            state_ = reload_state::running;
            break;
        case reload_state::reloaded:
            break;
        case reload_state::running:
            tima_ = data;
            break;
    }
}

void timer::write_tma(const u8 data) noexcept
{
    tma_ = data;
    if(state_ == reload_state::reloaded) {
        tima_ = data;
    }
}

void timer::write_tac(const u8 data) noexcept
{
    const bool old_signal = signal();
    tac_ = data & 0b111_u8;
    if(old_signal && !signal()) {
        increment_tima();
    }
}

bool timer::signal(const u16 counter, const u8 tac) noexcept
{
    const bool enabled = tac.test_bit(2_u8);
    return enabled && counter.test_bit(tima_counter_bits[tac & 0b11_u8]);
}

void timer::tick_machine_cycle() noexcept
{
    switch(state_) {
        case reload_state::overflowed:
            tima_ = tma_;
            irq_.request_interrupt(cpu::interrupt_source::timer);
            state_ = reload_state::reloaded;
            break;
        case reload_state::reloaded:
            state_ = reload_state::running;
            break;
        case reload_state::running:
            break;
    }

    const bool old_signal = signal();
    div_ += 4_u16;
    if(old_signal && !signal()) {
        increment_tima();
    }
}

void timer::increment_tima() noexcept
{
    ++tima_;
    if(tima_ == 0_u8) {
        state_ = reload_state::overflowed;
        LOG_TRACE(timer, "TIMA overflow, reloading with {:02X}", tma_);
    }
}

} // namespace gbc::timer
