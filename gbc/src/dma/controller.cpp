/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/dma/controller.h>

#include <gbc/helper/range.h>

namespace gbc::dma {

namespace {

constexpr u32 machine_cycle = 4_u32;
constexpr u16 addr_oam = 0xFE00_u16;
constexpr u16 addr_vram = 0x8000_u16;

} // namespace

u32 controller::settle(const u32 cycles) noexcept
{
    run_oam_transfer(cycles);

    // the start delay begins after the instruction that wrote FF46
    if(oam_.start_requested) {
        start_oam_transfer();
    }

    u32 stall = vram_.pending_stall;
    vram_.pending_stall = 0_u32;

    if(vram_.general_requested) {
        vram_.general_requested = false;
        do {
            stall += block_stall();
        } while(copy_vram_block());
    }

    return stall;
}

void controller::on_hblank() noexcept
{
    if(!vram_.hblank_active) {
        return;
    }

    vram_.pending_stall += block_stall();
    if(!copy_vram_block()) {
        vram_.hblank_active = false;
    }
}

bool controller::blocks(const u16 addr) const noexcept
{
    if(oam_.state != oam_state::running) {
        return false;
    }

    const bus addr_bus = bus_of(addr);
    return addr_bus != bus::none && addr_bus == bus_of(oam_.source);
}

void controller::write_oam_dma(const u8 data) noexcept
{
    oam_.page = data;
    oam_.start_requested = true;
}

u8 controller::read_hdma5() const noexcept
{
    if(vram_.hblank_active) {
        return vram_.length;
    }
    return vram_.length | 0x80_u8;
}

void controller::write_hdma(const u16 addr, const u8 data) noexcept
{
    switch(addr.get()) {
        case addr_hdma1:
            vram_.source = u16::from_bytes(data, vram_.source.low_byte());
            break;
        case addr_hdma2:
            vram_.source = u16::from_bytes(vram_.source.high_byte(), data & 0xF0_u8);
            break;
        case addr_hdma3:
            vram_.destination = u16::from_bytes(data & 0x1F_u8, vram_.destination.low_byte());
            break;
        case addr_hdma4:
            vram_.destination = u16::from_bytes(vram_.destination.high_byte(), data & 0xF0_u8);
            break;
        case addr_hdma5:
            if(vram_.hblank_active && !data.test_bit(7_u8)) {
                vram_.hblank_active = false;
                LOG_TRACE(dma, "hblank transfer cancelled, {} blocks left", vram_.length + 1_u8);
                break;
            }

            vram_.length = data & 0x7F_u8;
            if(data.test_bit(7_u8)) {
                vram_.hblank_active = true;
                LOG_TRACE(dma, "hblank transfer: {:04X} -> {:04X}, {} blocks",
                  vram_.source, addr_vram | vram_.destination, vram_.length + 1_u8);
            } else {
                vram_.general_requested = true;
                LOG_TRACE(dma, "general transfer: {:04X} -> {:04X}, {} blocks",
                  vram_.source, addr_vram | vram_.destination, vram_.length + 1_u8);
            }
            break;
        default:
            UNREACHABLE();
    }
}

controller::bus controller::bus_of(const u16 addr) noexcept
{
    if(addr >= 0xFE00_u16) {
        return bus::none;
    }
    if(addr >= 0x8000_u16 && addr < 0xA000_u16) {
        return bus::vram;
    }
    return bus::external;
}

void controller::run_oam_transfer(const u32 cycles) noexcept
{
    if(oam_.state == oam_state::idle) {
        return;
    }

    oam_.cycles += cycles;
    if(oam_.state == oam_state::starting) {
        if(oam_.cycles < machine_cycle) {
            return;
        }
        oam_.cycles -= machine_cycle;
        oam_.state = oam_state::running;
    }

    while(oam_.cycles >= machine_cycle && oam_.index < oam_transfer_length) {
        const u8 data = bus_->read_8(oam_.source + widen<u16>(oam_.index), cpu::mem_access::dma);
        bus_->write_8(addr_oam + widen<u16>(oam_.index), data, cpu::mem_access::dma);
        ++oam_.index;
        oam_.cycles -= machine_cycle;
    }

    if(oam_.index == oam_transfer_length) {
        oam_.state = oam_state::idle;
        oam_.cycles = 0_u32;
    }
}

void controller::start_oam_transfer() noexcept
{
    oam_.start_requested = false;

    // pages above DF read from the work ram echo
    u8 page = oam_.page;
    if(page >= 0xE0_u8) {
        page -= 0x20_u8;
    }

    // a restart keeps the bus locked, only the source changes
    oam_.state = oam_.state == oam_state::running ? oam_state::running : oam_state::starting;
    oam_.source = u16::from_bytes(page, 0x00_u8);
    oam_.index = 0_u8;
    oam_.cycles = 0_u32;
}

bool controller::copy_vram_block() noexcept
{
    for(const u16 i : range<u16>(vram_block_size)) {
        const u8 data = bus_->read_8(vram_.source + i, cpu::mem_access::dma);
        bus_->write_8(addr_vram | ((vram_.destination + i) & 0x1FFF_u16), data, cpu::mem_access::dma);
    }

    vram_.source += vram_block_size;
    vram_.destination = (vram_.destination + vram_block_size) & 0x1FF0_u16;

    if(vram_.length == 0_u8) {
        vram_.length = 0x7F_u8;
        return false;
    }

    --vram_.length;
    return true;
}

} // namespace gbc::dma
