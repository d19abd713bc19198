/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_BUS_INTERFACE_H
#define GAMEBOICOLOR_BUS_INTERFACE_H

#include <gbc/core/integer.h>

namespace gbc::cpu {

enum class mem_access : u8::type {
    cpu,
    dma  // not subject to dma bus conflicts or ppu locks
};

struct bus_interface {
    virtual ~bus_interface() = default;

    virtual u8 read_8(u16 addr, mem_access access) noexcept = 0;
    virtual void write_8(u16 addr, u8 data, mem_access access) noexcept = 0;
};

} // namespace gbc::cpu

#endif //GAMEBOICOLOR_BUS_INTERFACE_H
