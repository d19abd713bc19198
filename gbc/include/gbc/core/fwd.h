/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_FWD_H
#define GAMEBOICOLOR_FWD_H

#include <gbc/core/integer.h>

namespace gbc {

class core;
class scheduler;

namespace cartridge {

class cartridge;
class rtc;

} // namespace cartridge

namespace cpu {

static constexpr u32 clock_speed = 1_u32 << 22_u32; // 4.19 MHz

struct bus_interface;
class sm83;
class interrupt_controller;
enum class interrupt_source : u8::type;
enum class mem_access : u8::type;

} // namespace cpu

namespace timer {

class timer;

} // namespace timer

namespace dma {

class controller;

} // namespace dma

namespace ppu {

class engine;

} // namespace ppu

namespace joypad {

class joypad;

} // namespace joypad

namespace serial {

class port;

} // namespace serial

} // namespace gbc

#endif //GAMEBOICOLOR_FWD_H
