/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/cartridge/cartridge.h>

#include <gbc/core/error.h>

namespace gbc::cartridge {

namespace {

constexpr auto addr_title = 0x0134_usize;
constexpr auto title_max_length = 16_usize;
constexpr auto addr_cgb_flag = 0x0143_usize;
constexpr auto addr_cartridge_type = 0x0147_usize;
constexpr auto addr_rom_size = 0x0148_usize;
constexpr auto addr_ram_size = 0x0149_usize;
constexpr auto addr_header_checksum = 0x014D_usize;

std::string make_title(const vector<u8>& image) noexcept
{
    std::string title;
    for(usize i = 0_usize; i < title_max_length; ++i) {
        const u8 c = image[addr_title + i];
        // the last bytes are reused as the manufacturer code and cgb flag on newer carts
        if(c == 0_u8 || c >= 0x80_u8) {
            break;
        }
        title.push_back(static_cast<char>(c.get()));
    }
    return title;
}

std::optional<usize> ram_size_from_code(const u8 code) noexcept
{
    switch(code.get()) {
        case 0x00: return 0_usize;
        case 0x01: return 2_kb;
        case 0x02: return 8_kb;
        case 0x03: return 32_kb;
        case 0x04: return 128_kb;
        case 0x05: return 64_kb;
        default:   return std::nullopt;
    }
}

u8 calculate_header_checksum(const vector<u8>& image) noexcept
{
    u8 checksum;
    for(usize addr = addr_title; addr < addr_header_checksum; ++addr) {
        checksum = checksum - image[addr] - 1_u8;
    }
    return checksum;
}

std::optional<mbc> make_mbc(const header& h, const bank_layout layout) noexcept
{
    switch(h.cartridge_type.get()) {
        case 0x00: case 0x08: case 0x09:
            return no_mbc{layout};
        case 0x01: case 0x02: case 0x03:
            return mbc1{layout};
        case 0x05: case 0x06:
            return mbc2{bank_layout{layout.rom_banks, mbc2::builtin_ram_size}};
        case 0x0F: case 0x10: case 0x11: case 0x12: case 0x13: {
            mbc3 m{layout};
            m.has_rtc = h.has_rtc;
            return m;
        }
        case 0x19: case 0x1A: case 0x1B: case 0x1C: case 0x1D: case 0x1E:
            return mbc5{layout};
        default:
            return std::nullopt;
    }
}

bool has_battery(const u8 type) noexcept
{
    switch(type.get()) {
        case 0x03: case 0x06: case 0x09: case 0x0F:
        case 0x10: case 0x13: case 0x1B: case 0x1E:
            return true;
        default:
            return false;
    }
}

} // namespace

cartridge::cartridge(header h, vector<u8> rom, mbc m) noexcept
  : header_{std::move(h)},
    rom_{std::move(rom)},
    mbc_{m}
{
    const usize ram_size = std::visit([](const auto& controller) { return controller.layout.ram_size; }, mbc_);
    ram_ = vector<u8>(ram_size, 0xFF_u8);
}

std::optional<cartridge> cartridge::load(vector<u8> image, std::error_code& err)
{
    if(image.size() < header::size) {
        LOG_ERROR(cartridge, "image is too small to contain a header: {} bytes", image.size());
        err = error::malformed_header;
        return std::nullopt;
    }

    header h;
    h.title = make_title(image);
    h.cgb_flag = image[addr_cgb_flag];
    h.cartridge_type = image[addr_cartridge_type];
    h.rom_size_code = image[addr_rom_size];
    h.ram_size_code = image[addr_ram_size];
    h.header_checksum = image[addr_header_checksum];
    h.has_battery = has_battery(h.cartridge_type);
    h.has_rtc = h.cartridge_type == 0x0F_u8 || h.cartridge_type == 0x10_u8;

    if(h.rom_size_code > 0x08_u8) {
        LOG_ERROR(cartridge, "invalid rom size code: {:02X}", h.rom_size_code);
        err = error::malformed_header;
        return std::nullopt;
    }
    h.rom_size = 32_kb << h.rom_size_code;

    const std::optional<usize> ram_size = ram_size_from_code(h.ram_size_code);
    if(!ram_size.has_value()) {
        LOG_ERROR(cartridge, "invalid ram size code: {:02X}", h.ram_size_code);
        err = error::malformed_header;
        return std::nullopt;
    }
    h.ram_size = *ram_size;

    if(image.size() < h.rom_size) {
        LOG_ERROR(cartridge, "image is smaller than declared: {} < {}", image.size(), h.rom_size);
        err = error::truncated_rom;
        return std::nullopt;
    }

    std::optional<mbc> controller = make_mbc(h, bank_layout{h.rom_size / rom_bank_size, h.ram_size});
    if(!controller.has_value()) {
        LOG_ERROR(cartridge, "unsupported cartridge type: {:02X}", h.cartridge_type);
        err = error::unsupported_controller;
        return std::nullopt;
    }

    LOG_TRACE(cartridge, "------ cartridge ------");
    LOG_TRACE(cartridge, "title: {}", h.title);
    LOG_TRACE(cartridge, "type: {:02X}", h.cartridge_type);
    LOG_TRACE(cartridge, "cgb flag: {:02X}", h.cgb_flag);
    LOG_TRACE(cartridge, "rom: {} KB", h.rom_size / 1_kb);
    LOG_TRACE(cartridge, "ram: {} KB", h.ram_size / 1_kb);
    LOG_TRACE(cartridge, "battery: {}, rtc: {}", h.has_battery, h.has_rtc);

    const u8 calculated_checksum = calculate_header_checksum(image);
    if(calculated_checksum != h.header_checksum) {
        LOG_WARN(cartridge, "header checksum: {:02X} - mismatch, found: {:02X}", calculated_checksum, h.header_checksum);
    } else {
        LOG_TRACE(cartridge, "header checksum: {:02X}", calculated_checksum);
    }
    LOG_TRACE(cartridge, "-----------------------");

    if(image.size() > h.rom_size) {
        LOG_WARN(cartridge, "image is larger than declared, ignoring {} bytes", image.size() - h.rom_size);
        image.resize(h.rom_size);
    }

    err.clear();
    return cartridge{std::move(h), std::move(image), *controller};
}

u8 cartridge::read_rom(const u16 addr) const noexcept
{
    return rom_[std::visit([addr](const auto& m) { return m.map_rom(addr); }, mbc_)];
}

u8 cartridge::read_ram(const u16 addr) const noexcept
{
    if(const auto* controller = std::get_if<mbc3>(&mbc_)) {
        if(const std::optional<rtc::reg> reg = controller->selected_rtc_register(); reg.has_value()) {
            return controller->clock.read(*reg);
        }
    }

    const std::optional<usize> offset = std::visit([addr](const auto& m) { return m.map_ram(addr); }, mbc_);
    if(!offset.has_value()) {
        return 0xFF_u8;
    }

    if(std::holds_alternative<mbc2>(mbc_)) {
        return ram_[*offset] | 0xF0_u8;
    }
    return ram_[*offset];
}

void cartridge::write_rom(const u16 addr, const u8 data) noexcept
{
    std::visit([addr, data](auto& m) { m.on_write(addr, data); }, mbc_);
}

void cartridge::write_ram(const u16 addr, const u8 data) noexcept
{
    if(auto* controller = std::get_if<mbc3>(&mbc_)) {
        if(const std::optional<rtc::reg> reg = controller->selected_rtc_register(); reg.has_value()) {
            controller->clock.write(*reg, data);
            return;
        }
    }

    const std::optional<usize> offset = std::visit([addr](const auto& m) { return m.map_ram(addr); }, mbc_);
    if(!offset.has_value()) {
        return;
    }

    if(std::holds_alternative<mbc2>(mbc_)) {
        ram_[*offset] = data & 0x0F_u8;
    } else {
        ram_[*offset] = data;
    }
}

void cartridge::tick(const u32 cycles) noexcept
{
    if(auto* controller = std::get_if<mbc3>(&mbc_); controller && controller->has_rtc) {
        controller->clock.tick(cycles);
    }
}

vector<u8> cartridge::export_battery_ram() const
{
    if(!header_.has_battery) {
        return {};
    }
    return ram_;
}

void cartridge::import_battery_ram(const vector<u8>& data, std::error_code& err)
{
    if(!header_.has_battery || data.size() != ram_.size()) {
        LOG_WARN(cartridge, "battery ram size mismatch: expected {}, got {}", ram_.size(), data.size());
        err = error::invalid_save_data;
        return;
    }

    ram_ = data;
    err.clear();
}

} // namespace gbc::cartridge
