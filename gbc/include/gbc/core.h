/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_CORE_H
#define GAMEBOICOLOR_CORE_H

#include <memory>
#include <optional>
#include <system_error>

#include <gbc/archive.h>
#include <gbc/cartridge/cartridge.h>
#include <gbc/core/error.h>
#include <gbc/core/scheduler.h>
#include <gbc/cpu/sm83.h>
#include <gbc/dma/controller.h>
#include <gbc/joypad/joypad.h>
#include <gbc/ppu/ppu.h>
#include <gbc/serial/port.h>
#include <gbc/timer/timer.h>

namespace gbc {

enum class model : u8::type { dmg, cgb, automatic };

/**
 * Owns every component of the machine and the address space between them.
 *
 * The machine advances one cpu step at a time. After each step the timer, the display and the
 * cartridge clock are ticked by the cycles the step took, then pending DMA transfers are settled.
 */
class core : public cpu::bus_interface {
public:
    struct config {
        model hardware = model::automatic;
        std::optional<vector<u8>> boot_rom;
    };

    static constexpr usize dmg_boot_rom_size = 256_usize;
    static constexpr usize cgb_boot_rom_size = 2304_usize;

    static inline constexpr auto addr_boot_rom_disable = 0xFF50_u16;
    static inline constexpr auto addr_svbk = 0xFF70_u16;

    static constexpr u32 state_version = 1_u32;

private:
    scheduler scheduler_;
    cartridge::cartridge cartridge_;
    cpu::sm83 cpu_;
    timer::timer timer_;
    dma::controller dma_;
    ppu::engine ppu_;
    joypad::joypad joypad_;
    serial::port serial_;

    vector<u8> boot_rom_;
    bool boot_rom_mapped_;
    bool cgb_mode_;

    vector<u8> wram_;
    u8 wram_bank_ = 1_u8;
    array<u8, 0x7F> hram_;

    // only make() can name the key
    struct construct_key { explicit construct_key() = default; };

public:
    core(construct_key, cartridge::cartridge cart, vector<u8> boot_rom, bool cgb_mode);

    /**
     * Loads a cartridge image and builds a machine for it. On failure returns nullptr and sets err
     * to the cartridge load error or invalid_boot_rom.
     */
    [[nodiscard]] static std::unique_ptr<core> make(vector<u8> rom, config cfg, std::error_code& err);

    core(const core&) = delete;
    core(core&&) = delete;
    core& operator=(const core&) = delete;
    core& operator=(core&&) = delete;
    ~core() override = default;

    /** Executes one cpu step and returns the cycles it took, DMA stalls included. */
    u32 run_one_step(std::error_code& err) noexcept;

    /** Runs until the display completes a frame, or for one frame's worth of cycles if it is off. */
    void run_frame(std::error_code& err) noexcept;

    void set_button_state(const joypad::key key, const bool pressed) noexcept { joypad_.set_button_state(key, pressed); }

    [[nodiscard]] event<const ppu::frame_buffer&>& on_frame_event() noexcept { return ppu_.event_on_frame; }
    [[nodiscard]] event<u8>& on_serial_transfer_event() noexcept { return serial_.event_on_transfer; }
    [[nodiscard]] const ppu::frame_buffer& frame() const noexcept { return ppu_.frame(); }
    [[nodiscard]] u64 frame_count() const noexcept { return ppu_.frame_count(); }

    [[nodiscard]] bool cgb_mode() const noexcept { return cgb_mode_; }
    [[nodiscard]] const cartridge::header& cartridge_header() const noexcept { return cartridge_.get_header(); }
    [[nodiscard]] cpu::register_file& registers() noexcept { return cpu_.registers(); }
    [[nodiscard]] const cpu::sm83& processor() const noexcept { return cpu_; }
    [[nodiscard]] u64 cycles() const noexcept { return scheduler_.now(); }

    [[nodiscard]] vector<u8> export_battery_ram() const { return cartridge_.export_battery_ram(); }
    void import_battery_ram(const vector<u8>& data, std::error_code& err) { cartridge_.import_battery_ram(data, err); }

    /** Gzip compressed snapshot of the whole machine, nullopt if compression fails. */
    [[nodiscard]] std::optional<vector<u8>> save_state() const;

    /** Restores a snapshot. A corrupted or foreign snapshot leaves the machine untouched and sets err. */
    void load_state(const vector<u8>& data, std::error_code& err);

    u8 read_8(u16 addr, cpu::mem_access access) noexcept final;
    void write_8(u16 addr, u8 data, cpu::mem_access access) noexcept final;

private:
    void tick_components(u32 cycles) noexcept;
    void on_speed_switch() noexcept;
    void skip_boot_rom() noexcept;

    [[nodiscard]] bool in_boot_rom(u16 addr) const noexcept;
    [[nodiscard]] usize wram_offset(u16 addr) const noexcept;

    // core_bus.cpp
    [[nodiscard]] u8 read_io(u16 addr) const noexcept;
    void write_io(u16 addr, u8 data) noexcept;

    void serialize(archive& archive) const noexcept;
    void deserialize(const archive& archive) noexcept;
};

} // namespace gbc

#endif //GAMEBOICOLOR_CORE_H
