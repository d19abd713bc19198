/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <test_prelude.h>

using namespace gbc;

namespace {

enum class sample : u8::type { first = 1, second = 7 };

} // namespace

// commented lines must not compile

TEST_CASE("strong integers")
{
    SUBCASE("zero initialized") {
        u8 b;
        u16 w;
        CHECK(b == 0_u8);
        CHECK(w == 0_u16);
    }

    SUBCASE("byte arithmetic wraps") {
        u8 b = 0xFF_u8;
        ++b;
        CHECK(b == 0x00_u8);
        --b;
        CHECK(b == 0xFF_u8);

        const u8 x = 0x80_u8;
        const u8 y = 0x90_u8;
        CHECK(x + y == 0x10_u8);
        CHECK(x - y == 0xF0_u8);
    }

    SUBCASE("conversions") {
        const u16 w = 0xBEEF_u16;
        CHECK(narrow<u8>(w) == 0xEF_u8);
        CHECK(widen<u32>(narrow<u8>(w)) == 0xEF_u32);

        // u8 b = w;
        // u16 s = 1;
        const u32 d = w;
        CHECK(d == 0xBEEF_u32);
    }

    SUBCASE("sign extended offsets") {
        const u16 pc = 0x0200_u16;
        CHECK(pc + u8{0xFE_u8}.sign_extended() == 0x01FE_u16);
        CHECK(pc + u8{0x7F_u8}.sign_extended() == 0x027F_u16);
        CHECK(u8{0x80_u8}.sign_extended() == 0xFF80_u16);
    }

    SUBCASE("nibbles") {
        const u8 b = 0xA5_u8;
        CHECK(b.low_nibble() == 0x05_u8);
        CHECK(b.swapped_nibbles() == 0x5A_u8);
    }

    SUBCASE("single bits") {
        const u16 w = 0x8001_u16;
        CHECK(w.test_bit(0_u8));
        CHECK(w.test_bit(15_u8));
        CHECK_FALSE(w.test_bit(7_u8));
    }

    SUBCASE("bytes of a word") {
        const u16 w = u16::from_bytes(0x12_u8, 0x34_u8);
        CHECK(w == 0x1234_u16);
        CHECK(w.high_byte() == 0x12_u8);
        CHECK(w.low_byte() == 0x34_u8);
    }

    SUBCASE("bitwise") {
        u8 b = 0xF0_u8;
        CHECK(~b == 0x0F_u8);

        b |= 0x0C_u8;
        CHECK(b == 0xFC_u8);
        b &= 0x3C_u8;
        CHECK(b == 0x3C_u8);
        b ^= 0xFF_u8;
        CHECK(b == 0xC3_u8);
        b >>= 4_u8;
        CHECK(b == 0x0C_u8);

        u16 w = 0x00FF_u16;
        w <<= 4_u8;
        CHECK(w == 0x0FF0_u16);
        // b |= 0x0100_u16;
    }

    SUBCASE("enums") {
        CHECK(from_enum<u8>(sample::second) == 7_u8);
        CHECK(to_enum<sample>(u8{1_u8}) == sample::first);
    }

    SUBCASE("sizes") {
        CHECK(1_kb == 1024_usize);
        CHECK((32_kb << 2_usize) == 128_kb);
    }

    SUBCASE("comparison") {
        const u16 w = 0x0010_u16;
        CHECK(w == 0x10_u8);
        CHECK(w > 0x0F_u8);
        CHECK(w < 0x0011_u32);
    }
}
