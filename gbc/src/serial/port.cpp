/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/serial/port.h>

namespace gbc::serial {

namespace {

constexpr u8 start_bit = 7_u8;
constexpr u8 speed_bit = 1_u8;
constexpr u8 clock_bit = 0_u8;

} // namespace

port::port(scheduler* s) noexcept
  : scheduler_{s}
{
    scheduler_->register_hw_event(MAKE_HW_EVENT(port::on_transfer_complete), "serial::transfer");
}

void port::write_sc(const u8 data) noexcept
{
    sc_ = data & (cgb_mode_ ? 0x83_u8 : 0x81_u8);

    if(!sc_.test_bit(start_bit)) {
        if(transferring_) {
            scheduler_->remove_event(transfer_handle_);
            transferring_ = false;
        }
        return;
    }

    if(!sc_.test_bit(clock_bit) || transferring_) {
        return;
    }

    event_on_transfer(sb_);

    const u32 delay = cgb_mode_ && sc_.test_bit(speed_bit) ? fast_transfer_cycles : transfer_cycles;
    transfer_handle_ = scheduler_->add_hw_event(delay, MAKE_HW_EVENT(port::on_transfer_complete));
    transferring_ = true;
    LOG_TRACE(serial, "transfer started: {:02X}", sb_);
}

void port::on_transfer_complete(u32 /*late_cycles*/) noexcept
{
    transferring_ = false;
    sb_ = 0xFF_u8;
    sc_ = bit::clear(sc_, start_bit);
    irq_.request_interrupt(cpu::interrupt_source::serial);
}

} // namespace gbc::serial
