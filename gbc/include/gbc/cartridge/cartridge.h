/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_CARTRIDGE_H
#define GAMEBOICOLOR_CARTRIDGE_H

#include <optional>
#include <string>
#include <system_error>

#include <gbc/cartridge/mbc.h>
#include <gbc/core/container.h>
#include <gbc/core/fwd.h>

namespace gbc::cartridge {

struct header {
    static constexpr usize size = 0x0150_usize;

    std::string title;
    u8 cgb_flag;
    u8 cartridge_type;
    u8 rom_size_code;
    u8 ram_size_code;
    u8 header_checksum;

    usize rom_size;
    usize ram_size;
    bool has_battery = false;
    bool has_rtc = false;

    [[nodiscard]] bool supports_cgb() const noexcept { return cgb_flag.test_bit(7_u8); }
    [[nodiscard]] bool requires_cgb() const noexcept { return cgb_flag == 0xC0_u8; }
};

class cartridge {
    header header_;
    vector<u8> rom_;
    vector<u8> ram_;
    mbc mbc_;

    cartridge(header h, vector<u8> rom, mbc m) noexcept;

public:
    /**
     * Validates the header of a cartridge image and selects its controller.
     * On failure returns nullopt and sets err to one of
     * malformed_header, unsupported_controller, truncated_rom.
     */
    [[nodiscard]] static std::optional<cartridge> load(vector<u8> image, std::error_code& err);

    [[nodiscard]] u8 read_rom(u16 addr) const noexcept;
    [[nodiscard]] u8 read_ram(u16 addr) const noexcept;
    void write_rom(u16 addr, u8 data) noexcept;  // bank register writes
    void write_ram(u16 addr, u8 data) noexcept;

    void tick(u32 cycles) noexcept;

    [[nodiscard]] const header& get_header() const noexcept { return header_; }
    [[nodiscard]] const mbc& controller() const noexcept { return mbc_; }

    [[nodiscard]] vector<u8> export_battery_ram() const;
    void import_battery_ram(const vector<u8>& data, std::error_code& err);

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(ram_);
        std::visit([&](const auto& m) { m.serialize(archive); }, mbc_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        vector<u8> ram;
        archive.deserialize(ram);
        if(ram.size() != ram_.size()) {
            archive.mark_corrupted();
            return;
        }

        ram_ = std::move(ram);
        std::visit([&](auto& m) { m.deserialize(archive); }, mbc_);
    }
};

} // namespace gbc::cartridge

#endif //GAMEBOICOLOR_CARTRIDGE_H
