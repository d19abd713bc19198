/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_MBC_H
#define GAMEBOICOLOR_MBC_H

#include <optional>
#include <variant>

#include <gbc/cartridge/rtc.h>
#include <gbc/core/math.h>

namespace gbc::cartridge {

static constexpr usize rom_bank_size = 16_kb;
static constexpr usize ram_bank_size = 8_kb;

/** Physical storage the bank registers are reduced against. */
struct bank_layout {
    usize rom_banks;
    usize ram_size;

    [[nodiscard]] usize ram_banks() const noexcept { return (ram_size + ram_bank_size - 1_usize) / ram_bank_size; }

    [[nodiscard]] usize rom_offset(const usize bank, const u16 addr) const noexcept
    {
        return (bank % rom_banks) * rom_bank_size + (addr & 0x3FFF_u16);
    }

    [[nodiscard]] usize ram_offset(const usize bank, const u16 addr) const noexcept
    {
        return ((bank % ram_banks()) * ram_bank_size + (addr & 0x1FFF_u16)) % ram_size;
    }
};

/*
 * Every controller maps the two ROM windows (0000-3FFF, 4000-7FFF) and the external RAM
 * window (A000-BFFF) to physical offsets. on_write receives writes to 0000-7FFF.
 * map_ram returns nullopt when the access doesn't reach RAM.
 */

struct no_mbc {
    bank_layout layout;

    [[nodiscard]] usize map_rom(const u16 addr) const noexcept { return layout.rom_offset(addr < 0x4000_u16 ? 0_usize : 1_usize, addr); }
    [[nodiscard]] std::optional<usize> map_ram(u16 addr) const noexcept;
    void on_write(u16 /*addr*/, u8 /*data*/) noexcept {}

    template<typename Ar> void serialize(Ar& /*archive*/) const noexcept {}
    template<typename Ar> void deserialize(const Ar& /*archive*/) noexcept {}
};

struct mbc1 {
    bank_layout layout;

    u8 bank1 = 1_u8;  // 5 bits
    u8 bank2;         // 2 bits
    bool advanced_banking = false;
    bool ram_enabled = false;

    [[nodiscard]] usize map_rom(u16 addr) const noexcept;
    [[nodiscard]] std::optional<usize> map_ram(u16 addr) const noexcept;
    void on_write(u16 addr, u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(bank1);
        archive.serialize(bank2);
        archive.serialize(advanced_banking);
        archive.serialize(ram_enabled);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(bank1);
        archive.deserialize(bank2);
        archive.deserialize(advanced_banking);
        archive.deserialize(ram_enabled);
    }
};

struct mbc2 {
    static constexpr usize builtin_ram_size = 512_usize;

    bank_layout layout;

    u8 rom_bank = 1_u8;  // 4 bits
    bool ram_enabled = false;

    [[nodiscard]] usize map_rom(u16 addr) const noexcept;
    [[nodiscard]] std::optional<usize> map_ram(u16 addr) const noexcept;
    void on_write(u16 addr, u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(rom_bank);
        archive.serialize(ram_enabled);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(rom_bank);
        archive.deserialize(ram_enabled);
    }
};

struct mbc3 {
    bank_layout layout;
    bool has_rtc = false;

    u8 rom_bank = 1_u8;  // 7 bits
    u8 ram_select;       // 0-3 ram bank, 08-0C rtc register
    u8 latch_data = 0xFF_u8;
    bool ram_enabled = false;
    rtc clock;

    [[nodiscard]] usize map_rom(u16 addr) const noexcept;
    [[nodiscard]] std::optional<usize> map_ram(u16 addr) const noexcept;
    void on_write(u16 addr, u8 data) noexcept;

    [[nodiscard]] std::optional<rtc::reg> selected_rtc_register() const noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(rom_bank);
        archive.serialize(ram_select);
        archive.serialize(latch_data);
        archive.serialize(ram_enabled);
        archive.serialize(clock);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(rom_bank);
        archive.deserialize(ram_select);
        archive.deserialize(latch_data);
        archive.deserialize(ram_enabled);
        archive.deserialize(clock);
    }
};

struct mbc5 {
    bank_layout layout;

    u16 rom_bank = 1_u16;  // 9 bits
    u8 ram_bank;           // 4 bits
    bool ram_enabled = false;

    [[nodiscard]] usize map_rom(u16 addr) const noexcept;
    [[nodiscard]] std::optional<usize> map_ram(u16 addr) const noexcept;
    void on_write(u16 addr, u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(rom_bank);
        archive.serialize(ram_bank);
        archive.serialize(ram_enabled);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(rom_bank);
        archive.deserialize(ram_bank);
        archive.deserialize(ram_enabled);
    }
};

using mbc = std::variant<no_mbc, mbc1, mbc2, mbc3, mbc5>;

} // namespace gbc::cartridge

#endif //GAMEBOICOLOR_MBC_H
