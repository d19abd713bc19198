/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_PPU_TYPES_H
#define GAMEBOICOLOR_PPU_TYPES_H

#include <algorithm>

#include <gbc/core/container.h>
#include <gbc/core/math.h>

namespace gbc::ppu {

struct color {
    u8 r;
    u8 g;
    u8 b;

    /** Expands a 15 bit color, each 5 bit channel is scaled as (c << 3) | (c >> 2). */
    [[nodiscard]] static constexpr color from_rgb555(const u16 val) noexcept
    {
        const auto expand = [](const u16 c) { return narrow<u8>((c << 3_u16) | (c >> 2_u16)); };
        return color{
          expand(val & 0x1F_u16),
          expand((val >> 5_u16) & 0x1F_u16),
          expand((val >> 10_u16) & 0x1F_u16)
        };
    }

    [[nodiscard]] static constexpr color from_rgb888(const u32 val) noexcept
    {
        return color{narrow<u8>(val >> 16_u32), narrow<u8>(val >> 8_u32), narrow<u8>(val)};
    }

    [[nodiscard]] static constexpr color white() noexcept { return color{0xFF_u8, 0xFF_u8, 0xFF_u8}; }

    constexpr bool operator==(const color& other) const noexcept { return r == other.r && g == other.g && b == other.b; }
    constexpr bool operator!=(const color& other) const noexcept { return !(*this == other); }
};

// original model shades, lightest first
inline constexpr array<color, 4> dmg_shades{
  color::from_rgb888(0xE0F8D0_u32),
  color::from_rgb888(0x88C070_u32),
  color::from_rgb888(0x346856_u32),
  color::from_rgb888(0x081820_u32),
};

enum class mode : u8::type {
    hblank = 0,
    vblank = 1,
    oam_scan = 2,
    pixel_transfer = 3
};

struct lcdc {
    bool enabled = false;
    bool window_map_high = false;
    bool window_enabled = false;
    bool tile_data_unsigned = false;
    bool bg_map_high = false;
    bool large_obj = false;
    bool obj_enabled = false;
    bool bg_enabled = false;  // master priority on the color model

    [[nodiscard]] u8 read() const noexcept
    {
        return bit::from_bool<u8>(enabled) << 7_u8
          | bit::from_bool<u8>(window_map_high) << 6_u8
          | bit::from_bool<u8>(window_enabled) << 5_u8
          | bit::from_bool<u8>(tile_data_unsigned) << 4_u8
          | bit::from_bool<u8>(bg_map_high) << 3_u8
          | bit::from_bool<u8>(large_obj) << 2_u8
          | bit::from_bool<u8>(obj_enabled) << 1_u8
          | bit::from_bool<u8>(bg_enabled);
    }

    void write(const u8 data) noexcept
    {
        enabled = data.test_bit(7_u8);
        window_map_high = data.test_bit(6_u8);
        window_enabled = data.test_bit(5_u8);
        tile_data_unsigned = data.test_bit(4_u8);
        bg_map_high = data.test_bit(3_u8);
        large_obj = data.test_bit(2_u8);
        obj_enabled = data.test_bit(1_u8);
        bg_enabled = data.test_bit(0_u8);
    }

    template<typename Ar> void serialize(Ar& archive) const noexcept { archive.serialize(read()); }
    template<typename Ar> void deserialize(const Ar& archive) noexcept { write(archive.template deserialize<u8>()); }
};

struct stat {
    bool lyc_irq_enabled = false;
    bool oam_irq_enabled = false;
    bool vblank_irq_enabled = false;
    bool hblank_irq_enabled = false;

    [[nodiscard]] u8 read_irq_bits() const noexcept
    {
        return bit::from_bool<u8>(lyc_irq_enabled) << 6_u8
          | bit::from_bool<u8>(oam_irq_enabled) << 5_u8
          | bit::from_bool<u8>(vblank_irq_enabled) << 4_u8
          | bit::from_bool<u8>(hblank_irq_enabled) << 3_u8;
    }

    void write(const u8 data) noexcept
    {
        lyc_irq_enabled = data.test_bit(6_u8);
        oam_irq_enabled = data.test_bit(5_u8);
        vblank_irq_enabled = data.test_bit(4_u8);
        hblank_irq_enabled = data.test_bit(3_u8);
    }

    template<typename Ar> void serialize(Ar& archive) const noexcept { archive.serialize(read_irq_bits()); }
    template<typename Ar> void deserialize(const Ar& archive) noexcept { write(archive.template deserialize<u8>()); }
};

/** One OAM entry as the scanline renderer sees it. */
struct obj {
    u8 y;
    u8 x;
    u8 tile;
    u8 attributes;
    u8 oam_index;

    [[nodiscard]] bool behind_bg() const noexcept { return attributes.test_bit(7_u8); }
    [[nodiscard]] bool y_flip() const noexcept { return attributes.test_bit(6_u8); }
    [[nodiscard]] bool x_flip() const noexcept { return attributes.test_bit(5_u8); }
    [[nodiscard]] bool dmg_palette() const noexcept { return attributes.test_bit(4_u8); }
    [[nodiscard]] bool vram_bank() const noexcept { return attributes.test_bit(3_u8); }
    [[nodiscard]] u8 cgb_palette() const noexcept { return attributes & 0x07_u8; }
};

/** Color model tile map attributes, stored in vram bank 1 at the tile map address. */
struct bg_attributes {
    u8 data;

    [[nodiscard]] bool priority() const noexcept { return data.test_bit(7_u8); }
    [[nodiscard]] bool y_flip() const noexcept { return data.test_bit(6_u8); }
    [[nodiscard]] bool x_flip() const noexcept { return data.test_bit(5_u8); }
    [[nodiscard]] bool vram_bank() const noexcept { return data.test_bit(3_u8); }
    [[nodiscard]] u8 palette() const noexcept { return data & 0x07_u8; }
};

/**
 * 8 palettes of 4 little endian RGB555 colors, accessed through an index register
 * (bit 7 auto increment after data writes) and a data register.
 */
class palette_ram {
    array<u8, 64> data_{};
    u8 index_;
    bool auto_increment_ = false;

public:
    [[nodiscard]] u8 read_index() const noexcept { return index_ | bit::from_bool<u8>(auto_increment_) << 7_u8 | 0x40_u8; }
    void write_index(const u8 data) noexcept
    {
        index_ = data & 0x3F_u8;
        auto_increment_ = data.test_bit(7_u8);
    }

    [[nodiscard]] u8 read_data() const noexcept { return data_[index_]; }

    // the index advances even if the write itself is blocked
    void write_data(const u8 data, const bool accessible) noexcept
    {
        if(accessible) {
            data_[index_] = data;
        }
        if(auto_increment_) {
            index_ = (index_ + 1_u8) & 0x3F_u8;
        }
    }

    [[nodiscard]] color color_at(const u8 palette, const u8 color_idx) const noexcept
    {
        const usize offset = widen<usize>(palette * 8_u8 + color_idx * 2_u8);
        return color::from_rgb555(u16::from_bytes(data_[offset + 1_usize], data_[offset]));
    }

    void fill(const u8 value) noexcept { std::fill(data_.begin(), data_.end(), value); }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(data_);
        archive.serialize(index_);
        archive.serialize(auto_increment_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(data_);
        archive.deserialize(index_);
        archive.deserialize(auto_increment_);
        if(index_ > 0x3F_u8) {
            archive.mark_corrupted();
        }
    }
};

} // namespace gbc::ppu

#endif //GAMEBOICOLOR_PPU_TYPES_H
