/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/cartridge/mbc.h>

namespace gbc::cartridge {

namespace {

[[nodiscard]] FORCEINLINE bool is_ram_enable_pattern(const u8 data) noexcept { return data.low_nibble() == 0x0A_u8; }

} // namespace

std::optional<usize> no_mbc::map_ram(const u16 addr) const noexcept
{
    if(layout.ram_size == 0_usize) {
        return std::nullopt;
    }
    return layout.ram_offset(0_usize, addr);
}

usize mbc1::map_rom(const u16 addr) const noexcept
{
    if(addr < 0x4000_u16) {
        const usize bank = advanced_banking ? widen<usize>(bank2 << 5_u8) : 0_usize;
        return layout.rom_offset(bank, addr);
    }

    return layout.rom_offset(widen<usize>((bank2 << 5_u8) | bank1), addr);
}

std::optional<usize> mbc1::map_ram(const u16 addr) const noexcept
{
    if(!ram_enabled || layout.ram_size == 0_usize) {
        return std::nullopt;
    }

    const usize bank = advanced_banking ? widen<usize>(bank2) : 0_usize;
    return layout.ram_offset(bank, addr);
}

void mbc1::on_write(const u16 addr, const u8 data) noexcept
{
    switch((addr >> 13_u16).get()) {
        case 0: // 0000-1FFF
            ram_enabled = is_ram_enable_pattern(data);
            break;
        case 1: // 2000-3FFF
            bank1 = data & 0x1F_u8;
            if(bank1 == 0_u8) {
                bank1 = 1_u8;
            }
            break;
        case 2: // 4000-5FFF
            bank2 = data & 0x03_u8;
            break;
        case 3: // 6000-7FFF
            advanced_banking = data.test_bit(0_u8);
            break;
        default:
            UNREACHABLE();
    }
}

usize mbc2::map_rom(const u16 addr) const noexcept
{
    return layout.rom_offset(addr < 0x4000_u16 ? 0_usize : widen<usize>(rom_bank), addr);
}

std::optional<usize> mbc2::map_ram(const u16 addr) const noexcept
{
    if(!ram_enabled) {
        return std::nullopt;
    }

    // 512 half-bytes mirrored over the whole window
    return widen<usize>(addr & 0x01FF_u16);
}

void mbc2::on_write(const u16 addr, const u8 data) noexcept
{
    if(addr >= 0x4000_u16) {
        return;
    }

    // address bit 8 selects between the two registers
    if(addr.test_bit(8_u8)) {
        rom_bank = data & 0x0F_u8;
        if(rom_bank == 0_u8) {
            rom_bank = 1_u8;
        }
    } else {
        ram_enabled = is_ram_enable_pattern(data);
    }
}

usize mbc3::map_rom(const u16 addr) const noexcept
{
    return layout.rom_offset(addr < 0x4000_u16 ? 0_usize : widen<usize>(rom_bank), addr);
}

std::optional<usize> mbc3::map_ram(const u16 addr) const noexcept
{
    if(!ram_enabled || layout.ram_size == 0_usize || ram_select > 0x03_u8) {
        return std::nullopt;
    }
    return layout.ram_offset(widen<usize>(ram_select), addr);
}

void mbc3::on_write(const u16 addr, const u8 data) noexcept
{
    switch((addr >> 13_u16).get()) {
        case 0:
            ram_enabled = is_ram_enable_pattern(data);
            break;
        case 1:
            rom_bank = data & 0x7F_u8;
            if(rom_bank == 0_u8) {
                rom_bank = 1_u8;
            }
            break;
        case 2:
            ram_select = data;
            break;
        case 3:
            if(has_rtc && latch_data == 0x00_u8 && data == 0x01_u8) {
                clock.latch();
            }
            latch_data = data;
            break;
        default:
            UNREACHABLE();
    }
}

std::optional<rtc::reg> mbc3::selected_rtc_register() const noexcept
{
    if(!has_rtc || !ram_enabled || ram_select < 0x08_u8 || ram_select > 0x0C_u8) {
        return std::nullopt;
    }
    return to_enum<rtc::reg>(ram_select);
}

usize mbc5::map_rom(const u16 addr) const noexcept
{
    // bank 0 is selectable in the switchable window
    return layout.rom_offset(addr < 0x4000_u16 ? 0_usize : widen<usize>(rom_bank), addr);
}

std::optional<usize> mbc5::map_ram(const u16 addr) const noexcept
{
    if(!ram_enabled || layout.ram_size == 0_usize) {
        return std::nullopt;
    }
    return layout.ram_offset(widen<usize>(ram_bank), addr);
}

void mbc5::on_write(const u16 addr, const u8 data) noexcept
{
    switch((addr >> 12_u16).get()) {
        case 0x0: case 0x1:
            ram_enabled = data == 0x0A_u8;
            break;
        case 0x2:
            rom_bank = (rom_bank & 0x100_u16) | data;
            break;
        case 0x3:
            rom_bank = (widen<u16>(data & 0x01_u8) << 8_u16) | (rom_bank & 0xFF_u16);
            break;
        case 0x4: case 0x5:
            ram_bank = data & 0x0F_u8;
            break;
        default:
            // 6000-7FFF is unused
            break;
    }
}

} // namespace gbc::cartridge
