/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/core.h>

#include <algorithm>

namespace gbc {

namespace {

constexpr u16 addr_vram = 0x8000_u16;
constexpr u16 addr_cart_ram = 0xA000_u16;
constexpr u16 addr_wram = 0xC000_u16;
constexpr u16 addr_oam = 0xFE00_u16;
constexpr u16 addr_unusable = 0xFEA0_u16;
constexpr u16 addr_io = 0xFF00_u16;
constexpr u16 addr_hram = 0xFF80_u16;

} // namespace

u8 core::read_8(const u16 addr, const cpu::mem_access access) noexcept
{
    const bool cpu_access = access == cpu::mem_access::cpu;
    if(cpu_access && UNLIKELY(dma_.blocks(addr))) {
        return 0xFF_u8;
    }

    if(addr < addr_vram) {
        if(boot_rom_mapped_ && in_boot_rom(addr)) {
            return boot_rom_[widen<usize>(addr)];
        }
        return cartridge_.read_rom(addr);
    }

    if(addr < addr_cart_ram) {
        if(cpu_access && !ppu_.vram_accessible()) {
            return 0xFF_u8;
        }
        return ppu_.read_vram(addr);
    }

    if(addr < addr_wram) {
        return cartridge_.read_ram(addr);
    }

    if(addr < addr_oam) {
        return wram_[wram_offset(addr)];
    }

    if(addr < addr_unusable) {
        if(cpu_access && (dma_.oam_transfer_running() || !ppu_.oam_accessible())) {
            return 0xFF_u8;
        }
        return ppu_.read_oam(addr);
    }

    if(addr < addr_io) {
        LOG_TRACE(core, "read from the unusable area: {:04X}", addr);
        return 0xFF_u8;
    }

    if(addr < addr_hram || addr == cpu::interrupt_controller::addr_ie) {
        return read_io(addr);
    }

    return hram_[widen<usize>(addr - addr_hram)];
}

void core::write_8(const u16 addr, const u8 data, const cpu::mem_access access) noexcept
{
    const bool cpu_access = access == cpu::mem_access::cpu;
    if(cpu_access && UNLIKELY(dma_.blocks(addr))) {
        return;
    }

    if(addr < addr_vram) {
        cartridge_.write_rom(addr, data);
    } else if(addr < addr_cart_ram) {
        if(!cpu_access || ppu_.vram_accessible()) {
            ppu_.write_vram(addr, data);
        }
    } else if(addr < addr_wram) {
        cartridge_.write_ram(addr, data);
    } else if(addr < addr_oam) {
        wram_[wram_offset(addr)] = data;
    } else if(addr < addr_unusable) {
        if(!cpu_access || (!dma_.oam_transfer_running() && ppu_.oam_accessible())) {
            ppu_.write_oam(addr, data);
        }
    } else if(addr < addr_io) {
        LOG_TRACE(core, "write to the unusable area: {:04X} <- {:02X}", addr, data);
    } else if(addr < addr_hram || addr == cpu::interrupt_controller::addr_ie) {
        write_io(addr, data);
    } else {
        hram_[widen<usize>(addr - addr_hram)] = data;
    }
}

u8 core::read_io(const u16 addr) const noexcept
{
    const auto cgb_only = [&](const u8 value) { return cgb_mode_ ? value : 0xFF_u8; };

    switch(addr.get()) {
        case joypad::joypad::addr_joyp: return joypad_.read();

        case serial::port::addr_sb: return serial_.read_sb();
        case serial::port::addr_sc: return serial_.read_sc();

        case timer::timer::addr_div:  return timer_.read_div();
        case timer::timer::addr_tima: return timer_.read_tima();
        case timer::timer::addr_tma:  return timer_.read_tma();
        case timer::timer::addr_tac:  return timer_.read_tac();

        case cpu::interrupt_controller::addr_if: return cpu_.interrupts_.read_if();
        case cpu::interrupt_controller::addr_ie: return cpu_.interrupts_.read_ie();

        case ppu::engine::addr_lcdc: return ppu_.lcdc_.read();
        case ppu::engine::addr_stat: return ppu_.read_stat();
        case ppu::engine::addr_scy:  return ppu_.scy_;
        case ppu::engine::addr_scx:  return ppu_.scx_;
        case ppu::engine::addr_ly:   return ppu_.ly_;
        case ppu::engine::addr_lyc:  return ppu_.lyc_;
        case ppu::engine::addr_bgp:  return ppu_.bgp_;
        case ppu::engine::addr_obp0: return ppu_.obp0_;
        case ppu::engine::addr_obp1: return ppu_.obp1_;
        case ppu::engine::addr_wy:   return ppu_.wy_;
        case ppu::engine::addr_wx:   return ppu_.wx_;
        case ppu::engine::addr_vbk:  return cgb_only(0xFE_u8 | ppu_.vram_bank_);

        case ppu::engine::addr_bcps: return cgb_only(ppu_.bg_palettes_.read_index());
        case ppu::engine::addr_ocps: return cgb_only(ppu_.obj_palettes_.read_index());
        case ppu::engine::addr_bcpd:
            return cgb_only(ppu_.vram_accessible() ? ppu_.bg_palettes_.read_data() : 0xFF_u8);
        case ppu::engine::addr_ocpd:
            return cgb_only(ppu_.vram_accessible() ? ppu_.obj_palettes_.read_data() : 0xFF_u8);

        case dma::controller::addr_oam_dma: return dma_.read_oam_dma();
        case dma::controller::addr_hdma5:   return cgb_only(dma_.read_hdma5());

        case cpu::sm83::addr_key1: return cpu_.read_key1();
        case addr_svbk:            return cgb_only(0xF8_u8 | wram_bank_);

        default:
            // sound, the write-only registers and the unmapped ones
            LOG_TRACE(core, "unhandled io read: {:04X}", addr);
            return 0xFF_u8;
    }
}

void core::write_io(const u16 addr, const u8 data) noexcept
{
    switch(addr.get()) {
        case joypad::joypad::addr_joyp:
            joypad_.write(data);
            break;

        case serial::port::addr_sb:
            serial_.write_sb(data);
            break;
        case serial::port::addr_sc:
            serial_.write_sc(data);
            break;

        case timer::timer::addr_div:
            timer_.write_div();
            break;
        case timer::timer::addr_tima:
            timer_.write_tima(data);
            break;
        case timer::timer::addr_tma:
            timer_.write_tma(data);
            break;
        case timer::timer::addr_tac:
            timer_.write_tac(data);
            break;

        case cpu::interrupt_controller::addr_if:
            cpu_.interrupts_.write_if(data);
            break;
        case cpu::interrupt_controller::addr_ie:
            cpu_.interrupts_.write_ie(data);
            break;

        case ppu::engine::addr_lcdc:
            ppu_.write_lcdc(data);
            break;
        case ppu::engine::addr_stat:
            ppu_.write_stat(data);
            break;
        case ppu::engine::addr_scy:
            ppu_.scy_ = data;
            break;
        case ppu::engine::addr_scx:
            ppu_.scx_ = data;
            break;
        case ppu::engine::addr_ly:
            break;
        case ppu::engine::addr_lyc:
            ppu_.write_lyc(data);
            break;
        case ppu::engine::addr_bgp:
            ppu_.bgp_ = data;
            break;
        case ppu::engine::addr_obp0:
            ppu_.obp0_ = data;
            break;
        case ppu::engine::addr_obp1:
            ppu_.obp1_ = data;
            break;
        case ppu::engine::addr_wy:
            ppu_.wy_ = data;
            break;
        case ppu::engine::addr_wx:
            ppu_.wx_ = data;
            break;
        case ppu::engine::addr_vbk:
            if(cgb_mode_) {
                ppu_.vram_bank_ = data & 0x01_u8;
            }
            break;

        case ppu::engine::addr_bcps:
            if(cgb_mode_) {
                ppu_.bg_palettes_.write_index(data);
            }
            break;
        case ppu::engine::addr_bcpd:
            if(cgb_mode_) {
                ppu_.bg_palettes_.write_data(data, ppu_.vram_accessible());
            }
            break;
        case ppu::engine::addr_ocps:
            if(cgb_mode_) {
                ppu_.obj_palettes_.write_index(data);
            }
            break;
        case ppu::engine::addr_ocpd:
            if(cgb_mode_) {
                ppu_.obj_palettes_.write_data(data, ppu_.vram_accessible());
            }
            break;

        case dma::controller::addr_oam_dma:
            dma_.write_oam_dma(data);
            break;
        case dma::controller::addr_hdma1:
        case dma::controller::addr_hdma2:
        case dma::controller::addr_hdma3:
        case dma::controller::addr_hdma4:
        case dma::controller::addr_hdma5:
            if(cgb_mode_) {
                dma_.write_hdma(addr, data);
            }
            break;

        case cpu::sm83::addr_key1:
            cpu_.write_key1(data);
            break;
        case addr_boot_rom_disable:
            if(boot_rom_mapped_ && data != 0_u8) {
                boot_rom_mapped_ = false;
                LOG_DEBUG(core, "boot rom unmapped");
            }
            break;
        case addr_svbk:
            if(cgb_mode_) {
                wram_bank_ = std::max(data & 0x07_u8, u8{1_u8});
            }
            break;

        default:
            LOG_TRACE(core, "unhandled io write: {:04X} <- {:02X}", addr, data);
            break;
    }
}

} // namespace gbc
