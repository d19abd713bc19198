/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <test_prelude.h>

#include <gbc/cartridge/cartridge.h>
#include <gbc/core/error.h>

using namespace gbc;

namespace {

// writes the bank number to the first byte of every rom bank
test::rom_builder& mark_banks(test::rom_builder& builder, const usize banks)
{
    for(usize bank = 1_usize; bank < banks; ++bank) {
        builder.byte(bank * cartridge::rom_bank_size, narrow<u8>(bank));
    }
    return builder;
}

cartridge::cartridge load(vector<u8> image)
{
    std::error_code err;
    std::optional<cartridge::cartridge> cart = cartridge::cartridge::load(std::move(image), err);
    REQUIRE_FALSE(err);
    REQUIRE(cart.has_value());
    return std::move(*cart);
}

std::error_code load_error(vector<u8> image)
{
    std::error_code err;
    const std::optional<cartridge::cartridge> cart = cartridge::cartridge::load(std::move(image), err);
    CHECK_FALSE(cart.has_value());
    return err;
}

} // namespace

TEST_CASE("cartridge header")
{
    const cartridge::cartridge cart = load(test::rom_builder{0x03_u8, 0x01_u8, 0x02_u8}
      .title("POCKET")
      .cgb_flag(0x80_u8)
      .build());

    const cartridge::header& h = cart.get_header();
    CHECK(h.title == "POCKET");
    CHECK(h.cartridge_type == 0x03_u8);
    CHECK(h.rom_size == 64_kb);
    CHECK(h.ram_size == 8_kb);
    CHECK(h.has_battery);
    CHECK_FALSE(h.has_rtc);
    CHECK(h.supports_cgb());
    CHECK_FALSE(h.requires_cgb());
    CHECK(std::holds_alternative<cartridge::mbc1>(cart.controller()));
}

TEST_CASE("cartridge load errors")
{
    CHECK(load_error(vector<u8>(0x0100_usize)) == error::malformed_header);
    CHECK(load_error(test::rom_builder{}.byte(0x0148_usize, 0x09_u8).build()) == error::malformed_header);
    CHECK(load_error(test::rom_builder{0x00_u8, 0x00_u8, 0x06_u8}.build()) == error::malformed_header);
    CHECK(load_error(test::rom_builder{0x00_u8, 0x01_u8}.truncate(32_kb).build()) == error::truncated_rom);
    CHECK(load_error(test::rom_builder{0x20_u8}.build()) == error::unsupported_controller);
}

TEST_CASE("cartridge title stops at the cgb flag")
{
    const cartridge::cartridge cart = load(test::rom_builder{}
      .title("ABCDEFGHIJKLMNOP")
      .cgb_flag(0xC0_u8)
      .build());
    CHECK(cart.get_header().title == "ABCDEFGHIJKLMNO");
    CHECK(cart.get_header().requires_cgb());
}

TEST_CASE("rom only")
{
    cartridge::cartridge cart = load(test::rom_builder{}.byte(0x4000_usize, 0x77_u8).build());

    CHECK(cart.read_rom(0x4000_u16) == 0x77_u8);
    cart.write_rom(0x2000_u16, 0x02_u8);
    CHECK(cart.read_rom(0x4000_u16) == 0x77_u8);

    CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);
    cart.write_ram(0xA000_u16, 0x12_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);
}

TEST_CASE("mbc1")
{
    test::rom_builder builder{0x03_u8, 0x01_u8, 0x03_u8};
    cartridge::cartridge cart = load(mark_banks(builder, 4_usize).build());

    SUBCASE("bank 0 in the switchable window selects bank 1") {
        cart.write_rom(0x2000_u16, 0x00_u8);
        CHECK(cart.read_rom(0x4000_u16) == 0x01_u8);
    }

    SUBCASE("bank numbers wrap to the rom size") {
        cart.write_rom(0x2000_u16, 0x06_u8);
        CHECK(cart.read_rom(0x4000_u16) == 0x02_u8);
        cart.write_rom(0x2000_u16, 0x03_u8);
        CHECK(cart.read_rom(0x4000_u16) == 0x03_u8);
    }

    SUBCASE("ram is disabled until enabled") {
        cart.write_ram(0xA000_u16, 0x42_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);

        cart.write_rom(0x0000_u16, 0x0A_u8);
        cart.write_ram(0xA000_u16, 0x42_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0x42_u8);

        cart.write_rom(0x0000_u16, 0x00_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);
    }

    SUBCASE("ram banking in advanced mode") {
        cart.write_rom(0x0000_u16, 0x0A_u8);
        cart.write_ram(0xA000_u16, 0x11_u8);

        cart.write_rom(0x6000_u16, 0x01_u8);
        cart.write_rom(0x4000_u16, 0x02_u8);
        cart.write_ram(0xA000_u16, 0x22_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0x22_u8);

        cart.write_rom(0x4000_u16, 0x00_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0x11_u8);
    }
}

TEST_CASE("mbc2")
{
    test::rom_builder builder{0x06_u8, 0x02_u8};
    cartridge::cartridge cart = load(mark_banks(builder, 8_usize).build());
    CHECK(cart.export_battery_ram().size() == 512_usize);

    // address bit 8 picks the register, 0x0A selects bank 10 and wraps to 2
    cart.write_rom(0x0100_u16, 0x0A_u8);
    CHECK(cart.read_rom(0x4000_u16) == 0x02_u8);
    cart.write_ram(0xA000_u16, 0x01_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);

    cart.write_rom(0x0000_u16, 0x0A_u8);
    cart.write_rom(0x2100_u16, 0x05_u8);
    CHECK(cart.read_rom(0x4000_u16) == 0x05_u8);

    cart.write_ram(0xA000_u16, 0xAB_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0xFB_u8);
    CHECK(cart.read_ram(0xA200_u16) == 0xFB_u8);
    CHECK(cart.read_ram(0xBE00_u16) == 0xFB_u8);
}

TEST_CASE("mbc3 clock registers")
{
    cartridge::cartridge cart = load(test::rom_builder{0x10_u8, 0x00_u8, 0x03_u8}.build());
    REQUIRE(cart.get_header().has_rtc);

    cart.write_rom(0x0000_u16, 0x0A_u8);
    cart.write_rom(0x4000_u16, 0x08_u8);
    cart.write_ram(0xA000_u16, 0x05_u8);

    // reads see the latched copy
    CHECK(cart.read_ram(0xA000_u16) == 0x00_u8);
    cart.write_rom(0x6000_u16, 0x00_u8);
    cart.write_rom(0x6000_u16, 0x01_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0x05_u8);

    cart.tick(cartridge::rtc::cycles_per_second);
    CHECK(cart.read_ram(0xA000_u16) == 0x05_u8);
    cart.write_rom(0x6000_u16, 0x00_u8);
    cart.write_rom(0x6000_u16, 0x01_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0x06_u8);

    // back to ram bank 1
    cart.write_rom(0x4000_u16, 0x01_u8);
    cart.write_ram(0xA000_u16, 0x99_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0x99_u8);
    cart.write_rom(0x4000_u16, 0x00_u8);
    CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);
}

TEST_CASE("mbc5")
{
    test::rom_builder builder{0x1B_u8, 0x02_u8, 0x03_u8};
    cartridge::cartridge cart = load(mark_banks(builder, 8_usize).build());

    SUBCASE("bank 0 is selectable") {
        cart.write_rom(0x2000_u16, 0x00_u8);
        CHECK(cart.read_rom(0x4000_u16) == cart.read_rom(0x0000_u16));
    }

    SUBCASE("ninth bank bit") {
        cart.write_rom(0x3000_u16, 0x01_u8);
        cart.write_rom(0x2000_u16, 0x02_u8);
        // 0x102 wraps to the 8 banks of the image
        CHECK(cart.read_rom(0x4000_u16) == 0x02_u8);
        CHECK(std::get<cartridge::mbc5>(cart.controller()).rom_bank == 0x0102_u16);
    }

    SUBCASE("ram enable needs the exact pattern") {
        cart.write_rom(0x0000_u16, 0x1A_u8);
        cart.write_ram(0xA000_u16, 0x33_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0xFF_u8);

        cart.write_rom(0x0000_u16, 0x0A_u8);
        cart.write_rom(0x4000_u16, 0x03_u8);
        cart.write_ram(0xA000_u16, 0x33_u8);
        CHECK(cart.read_ram(0xA000_u16) == 0x33_u8);
    }
}

TEST_CASE("battery ram")
{
    cartridge::cartridge cart = load(test::rom_builder{0x1B_u8, 0x00_u8, 0x02_u8}.build());

    cart.write_rom(0x0000_u16, 0x0A_u8);
    cart.write_ram(0xA010_u16, 0x5A_u8);

    vector<u8> saved = cart.export_battery_ram();
    REQUIRE(saved.size() == 8_kb);
    CHECK(saved[0x10_usize] == 0x5A_u8);

    cartridge::cartridge other = load(test::rom_builder{0x1B_u8, 0x00_u8, 0x02_u8}.build());
    std::error_code err;
    other.import_battery_ram(saved, err);
    CHECK_FALSE(err);
    other.write_rom(0x0000_u16, 0x0A_u8);
    CHECK(other.read_ram(0xA010_u16) == 0x5A_u8);

    saved.resize(4_kb);
    other.import_battery_ram(saved, err);
    CHECK(err == error::invalid_save_data);
    CHECK(other.read_ram(0xA010_u16) == 0x5A_u8);

    const cartridge::cartridge no_battery = load(test::rom_builder{0x1A_u8, 0x00_u8, 0x02_u8}.build());
    CHECK(no_battery.export_battery_ram().empty());
}
