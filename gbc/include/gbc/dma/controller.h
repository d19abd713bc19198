/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_DMA_CONTROLLER_H
#define GAMEBOICOLOR_DMA_CONTROLLER_H

#include <gbc/core/fwd.h>
#include <gbc/core/math.h>
#include <gbc/cpu/bus_interface.h>

namespace gbc::dma {

/**
 * OAM DMA (FF46) and the color model's VRAM DMA (FF51-FF55).
 *
 * Transfers are carried out between cpu steps through settle(). OAM DMA moves one byte per
 * machine cycle after a one machine cycle start delay, and while it runs the cpu can't use the
 * bus the source sits on. General purpose VRAM DMA copies everything at once and stalls the cpu,
 * horizontal-blank VRAM DMA copies one 16 byte block per hblank.
 */
class controller {
    friend core;

public:
    static constexpr u8 oam_transfer_length = 160_u8;
    static constexpr u16 vram_block_size = 16_u16;

    static inline constexpr auto addr_oam_dma = 0xFF46_u16;
    static inline constexpr auto addr_hdma1 = 0xFF51_u16;
    static inline constexpr auto addr_hdma2 = 0xFF52_u16;
    static inline constexpr auto addr_hdma3 = 0xFF53_u16;
    static inline constexpr auto addr_hdma4 = 0xFF54_u16;
    static inline constexpr auto addr_hdma5 = 0xFF55_u16;

private:
    enum class bus : u8::type { none, external, vram };

    enum class oam_state : u8::type { idle, starting, running };

    struct oam_transfer {
        oam_state state{oam_state::idle};
        bool start_requested = false;
        u8 page;
        u16 source;
        u8 index;
        u32 cycles;
    };

    struct vram_transfer {
        u16 source;
        u16 destination;  // offset into vram, 0000-1FF0
        u8 length = 0x7F_u8;  // remaining blocks - 1
        bool hblank_active = false;
        bool general_requested = false;
        u32 pending_stall;
    };

    cpu::bus_interface* bus_;

    oam_transfer oam_;
    vram_transfer vram_;
    bool double_speed_ = false;

public:
    explicit controller(cpu::bus_interface* bus) noexcept
      : bus_{bus} {}

    /** Runs pending transfers for the given cpu cycles, returns the cycles the cpu is stalled for. */
    [[nodiscard]] u32 settle(u32 cycles) noexcept;

    void on_hblank() noexcept;
    void set_double_speed(const bool double_speed) noexcept { double_speed_ = double_speed; }

    [[nodiscard]] bool oam_transfer_running() const noexcept { return oam_.state == oam_state::running; }

    /** True if a cpu access to addr collides with a running OAM transfer. */
    [[nodiscard]] bool blocks(u16 addr) const noexcept;

    [[nodiscard]] u8 read_oam_dma() const noexcept { return oam_.page; }
    void write_oam_dma(u8 data) noexcept;

    [[nodiscard]] u8 read_hdma5() const noexcept;
    void write_hdma(u16 addr, u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(oam_.state);
        archive.serialize(oam_.start_requested);
        archive.serialize(oam_.page);
        archive.serialize(oam_.source);
        archive.serialize(oam_.index);
        archive.serialize(oam_.cycles);
        archive.serialize(vram_.source);
        archive.serialize(vram_.destination);
        archive.serialize(vram_.length);
        archive.serialize(vram_.hblank_active);
        archive.serialize(vram_.general_requested);
        archive.serialize(vram_.pending_stall);
        archive.serialize(double_speed_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(oam_.state);
        archive.deserialize(oam_.start_requested);
        archive.deserialize(oam_.page);
        archive.deserialize(oam_.source);
        archive.deserialize(oam_.index);
        archive.deserialize(oam_.cycles);
        archive.deserialize(vram_.source);
        archive.deserialize(vram_.destination);
        archive.deserialize(vram_.length);
        archive.deserialize(vram_.hblank_active);
        archive.deserialize(vram_.general_requested);
        archive.deserialize(vram_.pending_stall);
        archive.deserialize(double_speed_);
        if(from_enum<u8>(oam_.state) > from_enum<u8>(oam_state::running) || oam_.index > oam_transfer_length
          || vram_.destination > 0x1FF0_u16 || (vram_.destination & 0x000F_u16) != 0_u16) {
            archive.mark_corrupted();
        }
    }

private:
    [[nodiscard]] static bus bus_of(u16 addr) noexcept;

    void run_oam_transfer(u32 cycles) noexcept;
    void start_oam_transfer() noexcept;

    /** Copies one block, returns false once the transfer is finished. */
    bool copy_vram_block() noexcept;
    [[nodiscard]] u32 block_stall() const noexcept { return 32_u32 << bit::from_bool<u32>(double_speed_); }
};

} // namespace gbc::dma

#endif //GAMEBOICOLOR_DMA_CONTROLLER_H
