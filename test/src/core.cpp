/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <type_traits>

#include <test_prelude.h>

#include <gbc/core/error.h>
#include <gbc/helper/gzip.h>
#include <gbc/helper/range.h>

using namespace gbc;
using namespace gbc::test;

namespace {

std::unique_ptr<core> make_booted(vector<u8> rom, const model hardware = model::automatic)
{
    std::unique_ptr<core> c = make_core(std::move(rom), hardware);
    run_until_pc(*c, rom_builder::program_start);
    return c;
}

std::unique_ptr<core> make_cgb()
{
    return make_booted(rom_builder{}.cgb_flag(0x80_u8).build());
}

struct serial_listener {
    vector<u8> sent;
    void on_transfer(const u8 data) { sent.push_back(data); }
};

void write_tile(core& c, const u16 tile, const u8 lsb, const u8 msb)
{
    const u16 base = 0x8000_u16 + tile * 16_u16;
    for(const u16 row : range<u16>(8_u16)) {
        write_cpu(c, base + row * 2_u16, lsb);
        write_cpu(c, base + row * 2_u16 + 1_u16, msb);
    }
}

void write_obj(core& c, const u8 idx, const u8 y, const u8 x, const u8 tile, const u8 attributes = 0x00_u8)
{
    const u16 base = 0xFE00_u16 + widen<u16>(idx) * 4_u16;
    write_cpu(c, base, y);
    write_cpu(c, base + 1_u16, x);
    write_cpu(c, base + 2_u16, tile);
    write_cpu(c, base + 3_u16, attributes);
}

/** Spins in a jr loop with the display off, tile 1 is color 3, tile 2 color 1 and tile 3 color 2. */
std::unique_ptr<core> make_display_core(const u8 cgb_flag = 0x00_u8)
{
    std::unique_ptr<core> c = make_booted(rom_builder{}.cgb_flag(cgb_flag).program({0x18_u8, 0xFE_u8}).build());
    write_cpu(*c, 0xFF40_u16, 0x00_u8);
    write_tile(*c, 1_u16, 0xFF_u8, 0xFF_u8);
    write_tile(*c, 2_u16, 0xFF_u8, 0x00_u8);
    write_tile(*c, 3_u16, 0x00_u8, 0xFF_u8);
    write_cpu(*c, 0xFF47_u16, 0xE4_u8);
    write_cpu(*c, 0xFF48_u16, 0xE4_u8);
    write_cpu(*c, 0xFF49_u16, 0x54_u8);  // colors 1-3 use the second shade
    return c;
}

void render_frame(core& c, const u8 lcdc)
{
    write_cpu(c, 0xFF40_u16, lcdc);
    std::error_code err;
    c.run_frame(err);
    REQUIRE_FALSE(err);
}

void run_until_ly(core& c, const u8 ly)
{
    std::error_code err;
    for(usize i = 0_usize; i < 100'000_usize && read_cpu(c, 0xFF44_u16) != ly; ++i) {
        c.run_one_step(err);
        REQUIRE_FALSE(err);
    }
    REQUIRE(read_cpu(c, 0xFF44_u16) == ly);
}

ppu::color pixel(const core& c, const usize x, const usize y)
{
    return c.frame()[y * ppu::screen_width + x];
}

} // namespace

TEST_CASE("machine construction")
{
    std::error_code err;

    SUBCASE("cartridge errors are forwarded") {
        const std::unique_ptr<core> c = core::make(vector<u8>(0x80_usize), core::config{}, err);
        CHECK(c == nullptr);
        CHECK(err == error::malformed_header);
    }

    SUBCASE("boot rom size must match the model") {
        core::config cfg;
        cfg.boot_rom = vector<u8>(core::cgb_boot_rom_size);
        const std::unique_ptr<core> c = core::make(rom_builder{}.build(), cfg, err);
        CHECK(c == nullptr);
        CHECK(err == error::invalid_boot_rom);
    }

    SUBCASE("model selection") {
        CHECK_FALSE(make_core(rom_builder{}.build())->cgb_mode());
        CHECK(make_core(rom_builder{}.cgb_flag(0x80_u8).build())->cgb_mode());
        CHECK_FALSE(make_core(rom_builder{}.build(), model::cgb)->cgb_mode());
        CHECK_FALSE(make_core(rom_builder{}.cgb_flag(0xC0_u8).build(), model::dmg)->cgb_mode());
    }

    SUBCASE("machines only come from make") {
        static_assert(!std::is_constructible_v<core, cartridge::cartridge, vector<u8>, bool>);
        static_assert(!std::is_default_constructible_v<core>);

        const std::unique_ptr<core> c = core::make(rom_builder{}.build(), core::config{}, err);
        REQUIRE(c != nullptr);
        CHECK_FALSE(err);
    }
}

TEST_CASE("boot rom overlay")
{
    vector<u8> boot_rom(core::dmg_boot_rom_size);
    const std::initializer_list<u8> unmap{0x3E_u8, 0x01_u8, 0xE0_u8, 0x50_u8};  // ld a,1; ldh (50),a
    std::copy(unmap.begin(), unmap.end(), boot_rom.begin() + 0xFC_usize);

    std::error_code err;
    const std::unique_ptr<core> c = core::make(rom_builder{}.byte(0x0000_usize, 0xAA_u8).build(),
      core::config{model::dmg, std::move(boot_rom)}, err);
    REQUIRE_FALSE(err);

    CHECK(c->registers().pc == 0x0000_u16);
    CHECK(read_cpu(*c, 0x0000_u16) == 0x00_u8);
    CHECK(read_cpu(*c, 0x0100_u16) == 0x00_u8);
    CHECK(read_cpu(*c, 0x0101_u16) == 0xC3_u8);

    run_until_pc(*c, rom_builder::program_start);
    CHECK(read_cpu(*c, 0x0000_u16) == 0xAA_u8);

    // can't be mapped back
    write_cpu(*c, core::addr_boot_rom_disable, 0x00_u8);
    CHECK(read_cpu(*c, 0x0000_u16) == 0xAA_u8);
}

TEST_CASE("state after the boot rom")
{
    SUBCASE("dmg") {
        const std::unique_ptr<core> c = make_core(rom_builder{}.build());
        const cpu::register_file& r = c->registers();
        CHECK(r.af() == 0x01B0_u16);
        CHECK(r.bc() == 0x0013_u16);
        CHECK(r.de() == 0x00D8_u16);
        CHECK(r.hl() == 0x014D_u16);
        CHECK(r.sp == 0xFFFE_u16);
        CHECK(r.pc == 0x0100_u16);

        CHECK(read_cpu(*c, 0xFF00_u16) == 0xCF_u8);
        CHECK(read_cpu(*c, 0xFF04_u16) == 0xAB_u8);
        CHECK(read_cpu(*c, 0xFF0F_u16) == 0xE1_u8);
        CHECK(read_cpu(*c, 0xFF40_u16) == 0x91_u8);
        CHECK(read_cpu(*c, 0xFF47_u16) == 0xFC_u8);
        CHECK(read_cpu(*c, 0xFF48_u16) == 0xFF_u8);
        CHECK(read_cpu(*c, 0xFF4D_u16) == 0xFF_u8);
        CHECK(read_cpu(*c, 0xFF4F_u16) == 0xFF_u8);
        CHECK(read_cpu(*c, core::addr_svbk) == 0xFF_u8);
    }

    SUBCASE("cgb") {
        const std::unique_ptr<core> c = make_core(rom_builder{}.cgb_flag(0x80_u8).build());
        const cpu::register_file& r = c->registers();
        CHECK(r.af() == 0x1180_u16);
        CHECK(r.de() == 0xFF56_u16);
        CHECK(r.hl() == 0x000D_u16);

        CHECK(read_cpu(*c, 0xFF04_u16) == 0x1E_u8);
        CHECK(read_cpu(*c, 0xFF4D_u16) == 0x7E_u8);
        CHECK(read_cpu(*c, 0xFF4F_u16) == 0xFE_u8);
        CHECK(read_cpu(*c, core::addr_svbk) == 0xF9_u8);
    }
}

TEST_CASE("memory map")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());

    write_cpu(*c, 0xC123_u16, 0x5A_u8);
    CHECK(read_cpu(*c, 0xE123_u16) == 0x5A_u8);
    write_cpu(*c, 0xF000_u16, 0xA5_u8);
    CHECK(read_cpu(*c, 0xD000_u16) == 0xA5_u8);

    write_cpu(*c, 0xFF90_u16, 0x11_u8);
    CHECK(read_cpu(*c, 0xFF90_u16) == 0x11_u8);

    write_cpu(*c, 0xFEB0_u16, 0x11_u8);
    CHECK(read_cpu(*c, 0xFEB0_u16) == 0xFF_u8);

    // sound isn't emulated
    CHECK(read_cpu(*c, 0xFF26_u16) == 0xFF_u8);

    write_cpu(*c, 0xFFFF_u16, 0x1F_u8);
    CHECK(read_cpu(*c, 0xFFFF_u16) == 0x1F_u8);
}

TEST_CASE("divider reset")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());

    write_cpu(*c, 0xFF04_u16, 0x42_u8);
    CHECK(read_cpu(*c, 0xFF04_u16) == 0x00_u8);

    run_steps(*c, 63_usize);
    CHECK(read_cpu(*c, 0xFF04_u16) == 0x00_u8);
    run_steps(*c, 1_usize);
    CHECK(read_cpu(*c, 0xFF04_u16) == 0x01_u8);
}

TEST_CASE("divider reset from a program")
{
    // ldh (04),a; nop...
    const std::unique_ptr<core> c = make_booted(rom_builder{}.program({0xE0_u8, 0x04_u8}).build());
    run_steps(*c, 1_usize);
    CHECK(read_cpu(*c, 0xFF04_u16) == 0x00_u8);
}

TEST_CASE("oam dma")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());

    // display off keeps vram and oam open
    write_cpu(*c, 0xFF40_u16, 0x00_u8);
    for(const u16 i : range<u16>(0xA0_u16)) {
        write_cpu(*c, 0x8000_u16 + i, narrow<u8>(i) ^ 0x5A_u8);
    }

    write_cpu(*c, 0xFF46_u16, 0x80_u8);
    CHECK(read_cpu(*c, 0xFF46_u16) == 0x80_u8);

    run_steps(*c, 2_usize);
    CHECK(read_cpu(*c, 0x8000_u16) == 0xFF_u8);
    CHECK(read_cpu(*c, 0xFE00_u16) == 0xFF_u8);
    write_cpu(*c, 0xC000_u16, 0x33_u8);
    CHECK(read_cpu(*c, 0xC000_u16) == 0x33_u8);
    CHECK(read_cpu(*c, 0xFF80_u16) == 0x00_u8);

    run_steps(*c, 160_usize);
    CHECK(read_cpu(*c, 0x8000_u16) == 0x5A_u8);
    for(const u16 i : range<u16>(0xA0_u16)) {
        CHECK(read_cpu(*c, 0xFE00_u16 + i) == (narrow<u8>(i) ^ 0x5A_u8));
    }
}

TEST_CASE("serial transfer without a partner")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());
    serial_listener listener;
    c->on_serial_transfer_event().add_delegate({connect_arg<&serial_listener::on_transfer>, &listener});

    write_cpu(*c, 0xFF0F_u16, 0x00_u8);
    write_cpu(*c, 0xFF01_u16, 0x41_u8);
    write_cpu(*c, 0xFF02_u16, 0x81_u8);
    REQUIRE(listener.sent.size() == 1_usize);
    CHECK(listener.sent[0_usize] == 0x41_u8);
    CHECK(read_cpu(*c, 0xFF02_u16) == 0xFF_u8);

    run_steps(*c, 1023_usize);
    CHECK(read_cpu(*c, 0xFF01_u16) == 0x41_u8);

    run_steps(*c, 1_usize);
    CHECK(read_cpu(*c, 0xFF01_u16) == 0xFF_u8);
    CHECK(read_cpu(*c, 0xFF02_u16) == 0x7F_u8);
    CHECK((read_cpu(*c, 0xFF0F_u16) & 0x08_u8) != 0_u8);

    // external clock never completes
    write_cpu(*c, 0xFF02_u16, 0x80_u8);
    run_steps(*c, 2048_usize);
    CHECK(read_cpu(*c, 0xFF02_u16) == 0xFE_u8);
    CHECK(listener.sent.size() == 1_usize);
}

TEST_CASE("joypad")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());
    write_cpu(*c, 0xFF0F_u16, 0x00_u8);

    write_cpu(*c, 0xFF00_u16, 0x20_u8);
    CHECK(read_cpu(*c, 0xFF00_u16) == 0xEF_u8);

    c->set_button_state(joypad::key::right, true);
    c->set_button_state(joypad::key::start, true);
    CHECK(read_cpu(*c, 0xFF00_u16) == 0xEE_u8);

    run_steps(*c, 1_usize);
    CHECK((read_cpu(*c, 0xFF0F_u16) & 0x10_u8) != 0_u8);

    write_cpu(*c, 0xFF00_u16, 0x10_u8);
    CHECK(read_cpu(*c, 0xFF00_u16) == 0xD7_u8);

    c->set_button_state(joypad::key::right, false);
    c->set_button_state(joypad::key::start, false);
    CHECK(read_cpu(*c, 0xFF00_u16) == 0xDF_u8);
}

TEST_CASE("stop is left on a key press")
{
    // stop; nop
    const std::unique_ptr<core> c = make_booted(rom_builder{}.program({0x10_u8, 0x00_u8}).build());
    run_steps(*c, 1_usize);
    REQUIRE(c->processor().state() == cpu::sm83::execution_state::stopped);

    run_steps(*c, 100_usize);
    CHECK(c->registers().pc == 0x0152_u16);

    write_cpu(*c, 0xFF00_u16, 0x10_u8);
    c->set_button_state(joypad::key::a, true);
    run_steps(*c, 2_usize);
    CHECK(c->processor().state() == cpu::sm83::execution_state::running);
    CHECK(c->registers().pc == 0x0153_u16);
}

TEST_CASE("background rendering")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());

    write_cpu(*c, 0xFF40_u16, 0x00_u8);
    for(const u16 i : range<u16>(16_u16)) {
        write_cpu(*c, 0x8000_u16 + i, 0xFF_u8);
    }
    write_cpu(*c, 0xFF47_u16, 0xE4_u8);
    write_cpu(*c, 0xFF40_u16, 0x91_u8);

    std::error_code err;
    c->run_frame(err);
    REQUIRE_FALSE(err);
    CHECK(c->frame_count() == 1_u64);
    CHECK(c->frame()[0_usize] == ppu::dmg_shades[3_usize]);
    CHECK(c->frame()[c->frame().size() - 1_usize] == ppu::dmg_shades[3_usize]);

    write_cpu(*c, 0xFF47_u16, 0x1B_u8);
    c->run_frame(err);
    CHECK(c->frame()[0_usize] == ppu::dmg_shades[0_usize]);
}

TEST_CASE("object rendering")
{
    const std::unique_ptr<core> c = make_display_core();
    const ppu::color lightest = ppu::dmg_shades[0_usize];
    const ppu::color light = ppu::dmg_shades[1_usize];
    const ppu::color dark = ppu::dmg_shades[2_usize];
    const ppu::color darkest = ppu::dmg_shades[3_usize];

    SUBCASE("at most ten objects per line") {
        for(const u8 i : range<u8>(11_u8)) {
            write_obj(*c, i, 16_u8, 8_u8 + i * 10_u8, 1_u8);
        }
        render_frame(*c, 0x93_u8);

        for(const usize i : range<usize>(10_usize)) {
            CHECK(pixel(*c, i * 10_usize, 0_usize) == darkest);
        }
        CHECK(pixel(*c, 100_usize, 0_usize) == lightest);
        CHECK(pixel(*c, 0_usize, 8_usize) == lightest);
    }

    SUBCASE("leftmost object wins on overlap") {
        write_obj(*c, 0_u8, 16_u8, 20_u8, 1_u8, 0x10_u8);
        write_obj(*c, 1_u8, 16_u8, 16_u8, 1_u8);
        render_frame(*c, 0x93_u8);

        CHECK(pixel(*c, 8_usize, 0_usize) == darkest);
        CHECK(pixel(*c, 12_usize, 0_usize) == darkest);
        CHECK(pixel(*c, 16_usize, 0_usize) == light);
    }

    SUBCASE("behind background only over opaque pixels") {
        write_cpu(*c, 0x9800_u16, 0x02_u8);
        write_obj(*c, 0_u8, 16_u8, 12_u8, 1_u8, 0x80_u8);
        render_frame(*c, 0x93_u8);

        CHECK(pixel(*c, 4_usize, 0_usize) == light);
        CHECK(pixel(*c, 8_usize, 0_usize) == darkest);
    }

    SUBCASE("8x16 objects ignore the low tile bit") {
        write_obj(*c, 0_u8, 16_u8, 8_u8, 3_u8);
        render_frame(*c, 0x97_u8);

        CHECK(pixel(*c, 0_usize, 0_usize) == light);
        CHECK(pixel(*c, 0_usize, 7_usize) == light);
        CHECK(pixel(*c, 0_usize, 8_usize) == dark);
        CHECK(pixel(*c, 0_usize, 15_usize) == dark);
        CHECK(pixel(*c, 0_usize, 16_usize) == lightest);
    }
}

TEST_CASE("object priority on the color model follows oam order")
{
    const std::unique_ptr<core> c = make_display_core(0x80_u8);

    const u16 red = 0x001F_u16;
    const u16 blue = 0x7C00_u16;
    write_cpu(*c, 0xFF6A_u16, 0x80_u8);
    for(const u16 palette_color : {red, blue}) {
        for(const u8 i : range<u8>(4_u8)) {
            static_cast<void>(i);
            write_cpu(*c, 0xFF6B_u16, palette_color.low_byte());
            write_cpu(*c, 0xFF6B_u16, palette_color.high_byte());
        }
    }

    write_obj(*c, 0_u8, 16_u8, 20_u8, 1_u8, 0x01_u8);
    write_obj(*c, 1_u8, 16_u8, 16_u8, 1_u8);
    render_frame(*c, 0x93_u8);

    CHECK(pixel(*c, 8_usize, 0_usize) == ppu::color::from_rgb555(red));
    CHECK(pixel(*c, 12_usize, 0_usize) == ppu::color::from_rgb555(blue));
    CHECK(pixel(*c, 16_usize, 0_usize) == ppu::color::from_rgb555(blue));
}

TEST_CASE("window rendering")
{
    const std::unique_ptr<core> c = make_display_core();
    for(const u16 i : range<u16>(32_u16)) {
        write_cpu(*c, 0x9C00_u16 + i, 0x01_u8);
        write_cpu(*c, 0x9C20_u16 + i, 0x02_u8);
    }
    write_cpu(*c, 0xFF4A_u16, 16_u8);
    write_cpu(*c, 0xFF4B_u16, 47_u8);
    render_frame(*c, 0xF1_u8);

    const ppu::color lightest = ppu::dmg_shades[0_usize];
    const ppu::color light = ppu::dmg_shades[1_usize];
    const ppu::color darkest = ppu::dmg_shades[3_usize];

    SUBCASE("placed at wx - 7 from line wy") {
        CHECK(pixel(*c, 40_usize, 15_usize) == lightest);
        CHECK(pixel(*c, 39_usize, 16_usize) == lightest);
        CHECK(pixel(*c, 40_usize, 16_usize) == darkest);
        CHECK(pixel(*c, 159_usize, 16_usize) == darkest);
        CHECK(pixel(*c, 40_usize, 24_usize) == light);
    }

    SUBCASE("line counter pauses while the window is hidden") {
        run_until_ly(*c, 20_u8);
        write_cpu(*c, 0xFF40_u16, 0xD1_u8);
        run_until_ly(*c, 30_u8);
        render_frame(*c, 0xF1_u8);

        CHECK(pixel(*c, 40_usize, 19_usize) == darkest);
        CHECK(pixel(*c, 40_usize, 25_usize) == lightest);
        CHECK(pixel(*c, 40_usize, 30_usize) == darkest);
        CHECK(pixel(*c, 40_usize, 33_usize) == darkest);
        CHECK(pixel(*c, 40_usize, 34_usize) == light);
    }
}

TEST_CASE("frames are paced while the display is off")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.build());
    write_cpu(*c, 0xFF40_u16, 0x00_u8);

    const u64 start = c->cycles();
    std::error_code err;
    c->run_frame(err);
    REQUIRE_FALSE(err);
    CHECK(c->frame_count() == 0_u64);
    CHECK(c->cycles() - start >= widen<u64>(ppu::engine::dots_per_frame));
    CHECK(c->cycles() - start < widen<u64>(ppu::engine::dots_per_frame) + 32_u64);
}

TEST_CASE("undefined opcodes stop the machine")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{}.program({0x00_u8, 0xD3_u8}).build());

    std::error_code err;
    c->run_one_step(err);
    CHECK_FALSE(err);
    c->run_one_step(err);
    CHECK(err == error::undefined_opcode);
    CHECK(c->processor().fault_opcode() == 0xD3_u8);
    CHECK(c->processor().fault_address() == 0x0151_u16);

    err.clear();
    CHECK(c->run_one_step(err) == 0_u32);
    CHECK(err == error::undefined_opcode);
}

TEST_CASE("color model registers")
{
    const std::unique_ptr<core> c = make_cgb();
    write_cpu(*c, 0xFF40_u16, 0x00_u8);

    SUBCASE("vram banks") {
        write_cpu(*c, 0xFF4F_u16, 0x01_u8);
        CHECK(read_cpu(*c, 0xFF4F_u16) == 0xFF_u8);
        write_cpu(*c, 0x8000_u16, 0x12_u8);

        write_cpu(*c, 0xFF4F_u16, 0x00_u8);
        CHECK(read_cpu(*c, 0x8000_u16) == 0x00_u8);
        write_cpu(*c, 0xFF4F_u16, 0x01_u8);
        CHECK(read_cpu(*c, 0x8000_u16) == 0x12_u8);
    }

    SUBCASE("work ram banks") {
        write_cpu(*c, core::addr_svbk, 0x02_u8);
        write_cpu(*c, 0xD000_u16, 0x22_u8);
        write_cpu(*c, 0xC000_u16, 0x33_u8);

        // bank 0 selects bank 1
        write_cpu(*c, core::addr_svbk, 0x00_u8);
        CHECK(read_cpu(*c, core::addr_svbk) == 0xF9_u8);
        CHECK(read_cpu(*c, 0xD000_u16) == 0x00_u8);
        CHECK(read_cpu(*c, 0xC000_u16) == 0x33_u8);

        write_cpu(*c, core::addr_svbk, 0x0A_u8);
        CHECK(read_cpu(*c, 0xD000_u16) == 0x22_u8);
        CHECK(read_cpu(*c, 0xF000_u16) == 0x22_u8);
    }

    SUBCASE("palette ram") {
        write_cpu(*c, 0xFF68_u16, 0x80_u8);
        write_cpu(*c, 0xFF69_u16, 0x1F_u8);
        write_cpu(*c, 0xFF69_u16, 0x00_u8);
        CHECK(read_cpu(*c, 0xFF68_u16) == 0xC2_u8);

        write_cpu(*c, 0xFF68_u16, 0x00_u8);
        CHECK(read_cpu(*c, 0xFF69_u16) == 0x1F_u8);

        // background palettes start out white
        write_cpu(*c, 0xFF68_u16, 0x3F_u8);
        CHECK(read_cpu(*c, 0xFF69_u16) == 0xFF_u8);

        write_cpu(*c, 0xFF6A_u16, 0x81_u8);
        CHECK(read_cpu(*c, 0xFF6A_u16) == 0xC1_u8);
    }

    SUBCASE("general purpose vram dma") {
        for(const u16 i : range<u16>(32_u16)) {
            write_cpu(*c, 0xC000_u16 + i, narrow<u8>(i) + 1_u8);
        }

        write_cpu(*c, 0xFF51_u16, 0xC0_u8);
        write_cpu(*c, 0xFF52_u16, 0x00_u8);
        write_cpu(*c, 0xFF53_u16, 0x00_u8);
        write_cpu(*c, 0xFF54_u16, 0x10_u8);
        write_cpu(*c, 0xFF55_u16, 0x01_u8);

        std::error_code err;
        CHECK(c->run_one_step(err) == 4_u32 + 64_u32);
        for(const u16 i : range<u16>(32_u16)) {
            CHECK(read_cpu(*c, 0x8010_u16 + i) == narrow<u8>(i) + 1_u8);
        }
        CHECK(read_cpu(*c, 0xFF55_u16) == 0xFF_u8);
    }

    SUBCASE("hblank vram dma") {
        for(const u16 i : range<u16>(32_u16)) {
            write_cpu(*c, 0xC000_u16 + i, 0x77_u8);
        }
        write_cpu(*c, 0xFF51_u16, 0xC0_u8);
        write_cpu(*c, 0xFF52_u16, 0x00_u8);
        write_cpu(*c, 0xFF53_u16, 0x00_u8);
        write_cpu(*c, 0xFF54_u16, 0x00_u8);
        write_cpu(*c, 0xFF55_u16, 0x81_u8);
        CHECK(read_cpu(*c, 0xFF55_u16) == 0x01_u8);

        write_cpu(*c, 0xFF40_u16, 0x91_u8);
        run_steps(*c, widen<usize>(ppu::engine::dots_per_line / 4_u32));
        CHECK(read_cpu(*c, 0xFF55_u16) == 0x00_u8);

        run_steps(*c, widen<usize>(ppu::engine::dots_per_line / 4_u32));
        CHECK(read_cpu(*c, 0xFF55_u16) == 0xFF_u8);
        write_cpu(*c, 0xFF40_u16, 0x00_u8);
        CHECK(read_cpu(*c, 0x8000_u16) == 0x77_u8);
        CHECK(read_cpu(*c, 0x801F_u16) == 0x77_u8);
    }
}

TEST_CASE("double speed switch")
{
    // ld a,1; ldh (4D),a; stop; nop
    const std::unique_ptr<core> c = make_booted(rom_builder{}
      .cgb_flag(0x80_u8)
      .program({0x3E_u8, 0x01_u8, 0xE0_u8, 0x4D_u8, 0x10_u8, 0x00_u8})
      .build());

    run_steps(*c, 2_usize);
    CHECK(read_cpu(*c, 0xFF4D_u16) == 0x7F_u8);

    run_steps(*c, 1_usize);
    CHECK(c->processor().double_speed());
    CHECK(c->processor().state() == cpu::sm83::execution_state::running);
    CHECK(read_cpu(*c, 0xFF4D_u16) == 0xFE_u8);
    CHECK(read_cpu(*c, 0xFF04_u16) == 0x00_u8);

    // the display sees half of the cpu cycles
    write_cpu(*c, 0xFF40_u16, 0x00_u8);
    write_cpu(*c, 0xFF40_u16, 0x91_u8);
    run_steps(*c, widen<usize>(ppu::engine::dots_per_line / 4_u32));
    CHECK(read_cpu(*c, 0xFF44_u16) == 0x00_u8);
    run_steps(*c, widen<usize>(ppu::engine::dots_per_line / 4_u32));
    CHECK(read_cpu(*c, 0xFF44_u16) == 0x01_u8);
}

TEST_CASE("save states")
{
    const std::unique_ptr<core> c = make_booted(rom_builder{0x1B_u8, 0x00_u8, 0x02_u8}.build());
    write_cpu(*c, 0xC000_u16, 0x12_u8);
    write_cpu(*c, 0x0000_u16, 0x0A_u8);
    write_cpu(*c, 0xA000_u16, 0x34_u8);
    run_steps(*c, 10_usize);

    const std::optional<vector<u8>> state = c->save_state();
    REQUIRE(state.has_value());
    const u16 pc = c->registers().pc;
    const u64 cycles = c->cycles();

    write_cpu(*c, 0xC000_u16, 0x56_u8);
    write_cpu(*c, 0xA000_u16, 0x78_u8);
    run_steps(*c, 10_usize);

    SUBCASE("restores the machine") {
        std::error_code err;
        c->load_state(*state, err);
        REQUIRE_FALSE(err);
        CHECK(c->registers().pc == pc);
        CHECK(c->cycles() == cycles);
        CHECK(read_cpu(*c, 0xC000_u16) == 0x12_u8);
        CHECK(read_cpu(*c, 0xA000_u16) == 0x34_u8);
    }

    SUBCASE("garbage is rejected") {
        const u16 current_pc = c->registers().pc;

        std::error_code err;
        c->load_state(vector<u8>{0x01_u8, 0x02_u8, 0x03_u8}, err);
        CHECK(err == error::corrupted_state);
        CHECK(c->registers().pc == current_pc);
        CHECK(read_cpu(*c, 0xC000_u16) == 0x56_u8);
    }

    SUBCASE("states of other cartridges are rejected") {
        std::error_code err;
        const std::unique_ptr<core> other = make_booted(rom_builder{0x1B_u8, 0x00_u8, 0x02_u8}.title("OTHER").build());
        const std::optional<vector<u8>> other_state = other->save_state();
        REQUIRE(other_state.has_value());

        c->load_state(*other_state, err);
        CHECK(err == error::corrupted_state);
        CHECK(read_cpu(*c, 0xC000_u16) == 0x56_u8);
    }
}

TEST_CASE("save states are checked against the machine")
{
    const vector<u8> rom = rom_builder{}.byte(0x0000_usize, 0xAA_u8).build();

    SUBCASE("boot rom mapping needs a boot rom") {
        std::error_code err;
        const std::unique_ptr<core> with_boot_rom = core::make(rom,
          core::config{model::dmg, vector<u8>(core::dmg_boot_rom_size)}, err);
        REQUIRE_FALSE(err);
        const std::optional<vector<u8>> state = with_boot_rom->save_state();
        REQUIRE(state.has_value());

        const std::unique_ptr<core> without_boot_rom = make_booted(rom, model::dmg);
        const u16 pc = without_boot_rom->registers().pc;

        without_boot_rom->load_state(*state, err);
        CHECK(err == error::corrupted_state);
        CHECK(without_boot_rom->registers().pc == pc);
        CHECK(read_cpu(*without_boot_rom, 0x0000_u16) == 0xAA_u8);
    }

    SUBCASE("work ram bank out of range") {
        const std::unique_ptr<core> c = make_booted(rom, model::dmg);
        const std::optional<vector<u8>> state = c->save_state();
        REQUIRE(state.has_value());

        std::optional<vector<u8>> raw = gzip::decompress(*state);
        REQUIRE(raw.has_value());
        // the bank select is followed by the 127 bytes of high ram
        u8& wram_bank = (*raw)[raw->size() - 128_usize];
        REQUIRE(wram_bank == 0x01_u8);
        wram_bank = 0x09_u8;
        const std::optional<vector<u8>> tampered = gzip::compress(*raw);
        REQUIRE(tampered.has_value());

        std::error_code err;
        c->load_state(*tampered, err);
        CHECK(err == error::corrupted_state);

        write_cpu(*c, 0xD000_u16, 0x5A_u8);
        CHECK(read_cpu(*c, 0xD000_u16) == 0x5A_u8);
    }
}
