/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <test_prelude.h>

#include <gbc/timer/timer.h>

using namespace gbc;

namespace {

constexpr u8 timer_irq = 0x04_u8;

struct timer_fixture {
    cpu::interrupt_controller interrupts;
    timer::timer t;

    timer_fixture()
    {
        interrupts.write_ie(0xFF_u8);
        t.set_irq_controller_handle(cpu::irq_controller_handle{&interrupts});
    }

    [[nodiscard]] bool irq_requested() const noexcept { return (interrupts.read_if() & timer_irq) != 0_u8; }
};

} // namespace

TEST_CASE_FIXTURE(timer_fixture, "div counts every 256 cycles")
{
    t.tick(252_u32);
    CHECK(t.read_div() == 0_u8);
    t.tick(4_u32);
    CHECK(t.read_div() == 1_u8);

    t.tick(256_u32 * 10_u32);
    CHECK(t.read_div() == 11_u8);

    t.write_div();
    CHECK(t.read_div() == 0_u8);
    CHECK(t.internal_counter() == 0_u16);
}

TEST_CASE_FIXTURE(timer_fixture, "tima counts on the selected rate")
{
    SUBCASE("16 cycles") {
        t.write_tac(0x05_u8);
        t.tick(12_u32);
        CHECK(t.read_tima() == 0_u8);
        t.tick(4_u32);
        CHECK(t.read_tima() == 1_u8);
        t.tick(16_u32);
        CHECK(t.read_tima() == 2_u8);
    }

    SUBCASE("1024 cycles") {
        t.write_tac(0x04_u8);
        t.tick(1020_u32);
        CHECK(t.read_tima() == 0_u8);
        t.tick(4_u32);
        CHECK(t.read_tima() == 1_u8);
    }

    SUBCASE("disabled") {
        t.write_tac(0x01_u8);
        t.tick(4096_u32);
        CHECK(t.read_tima() == 0_u8);
        CHECK(t.read_tac() == 0xF9_u8);
    }
}

TEST_CASE_FIXTURE(timer_fixture, "tima overflow reloads one machine cycle later")
{
    t.write_tma(0x42_u8);
    t.write_tima(0xFF_u8);
    t.write_tac(0x05_u8);

    t.tick(16_u32);
    CHECK(t.read_tima() == 0_u8);
    CHECK_FALSE(irq_requested());

    t.tick(4_u32);
    CHECK(t.read_tima() == 0x42_u8);
    CHECK(irq_requested());

    interrupts.acknowledge(cpu::interrupt_source::timer);
    t.tick(12_u32);
    CHECK(t.read_tima() == 0x43_u8);
    CHECK_FALSE(irq_requested());
}

TEST_CASE_FIXTURE(timer_fixture, "writing tima during the reload delay cancels the reload")
{
    t.write_tma(0x42_u8);
    t.write_tima(0xFF_u8);
    t.write_tac(0x05_u8);

    t.tick(16_u32);
    t.write_tima(0x10_u8);
    t.tick(4_u32);
    CHECK(t.read_tima() == 0x10_u8);
    CHECK_FALSE(irq_requested());
}

TEST_CASE_FIXTURE(timer_fixture, "div reset on a high signal increments tima")
{
    t.write_tac(0x05_u8);
    t.tick(8_u32);  // bit 3 of the counter is set
    CHECK(t.read_tima() == 0_u8);

    t.write_div();
    CHECK(t.read_tima() == 1_u8);
}
