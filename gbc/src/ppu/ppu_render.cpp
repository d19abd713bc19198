/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <algorithm>

#include <gbc/helper/range.h>
#include <gbc/ppu/ppu.h>

namespace gbc::ppu {

namespace {

constexpr u8 oam_entry_count = 40_u8;
constexpr u8 obj_y_offset = 16_u8;
constexpr u8 obj_x_offset = 8_u8;
constexpr u8 window_x_offset = 7_u8;

constexpr usize bytes_per_tile = 16_usize;
constexpr usize low_map_offset = 0x1800_usize;
constexpr usize high_map_offset = 0x1C00_usize;
constexpr usize signed_tile_base = 0x1000_usize;
constexpr usize vram_bank_size = 8_kb;

} // namespace

void engine::scan_oam() noexcept
{
    line_obj_count_ = 0_usize;
    if(!lcdc_.obj_enabled) {
        return;
    }

    const u16 height = lcdc_.large_obj ? 16_u16 : 8_u16;
    const u16 line = widen<u16>(ly_) + widen<u16>(obj_y_offset);
    for(const u8 idx : range<u8>(oam_entry_count)) {
        const usize base = widen<usize>(idx) * 4_usize;
        const u16 y = widen<u16>(oam_[base]);
        if(line < y || line >= y + height) {
            continue;
        }

        line_objs_[line_obj_count_] = obj{oam_[base], oam_[base + 1_usize], oam_[base + 2_usize], oam_[base + 3_usize], idx};
        if(++line_obj_count_ == max_objs_per_line) {
            break;
        }
    }

    // the original model prioritizes the leftmost object, the color model keeps the oam order
    if(!cgb_mode_) {
        std::stable_sort(line_objs_.begin(), line_objs_.begin() + line_obj_count_.get(), [](const obj& l, const obj& r) {
            return l.x < r.x;
        });
    }
}

void engine::render_scanline() noexcept
{
    array<color, screen_width> line;
    array<u8, screen_width> bg_indices{};
    array<bool, screen_width> bg_priorities{};

    const bool bg_drawn = cgb_mode_ || lcdc_.bg_enabled;
    const bool window_visible = window_visible_on_line();

    for(const u8 x : range<u8>(narrow<u8>(u32(screen_width)))) {
        if(!bg_drawn) {
            line[x] = dmg_shades[0_usize];
            continue;
        }

        const bool in_window = window_visible && widen<u16>(x) + widen<u16>(window_x_offset) >= widen<u16>(wx_);

        u8 px;
        u8 py;
        usize map_offset;
        if(in_window) {
            px = x + window_x_offset - wx_;
            py = window_line_;
            map_offset = lcdc_.window_map_high ? high_map_offset : low_map_offset;
        } else {
            px = x + scx_;
            py = ly_ + scy_;
            map_offset = lcdc_.bg_map_high ? high_map_offset : low_map_offset;
        }

        const usize map_addr = map_offset + widen<usize>(py >> 3_u8) * 32_usize + widen<usize>(px >> 3_u8);
        const u8 tile = vram_[map_addr];
        const bg_attributes attributes{cgb_mode_ ? vram_[map_addr + vram_bank_size] : u8{}};

        // tiles 128-255 are shared between both addressing modes
        usize tile_addr = widen<usize>(tile) * bytes_per_tile;
        if(!lcdc_.tile_data_unsigned && tile < 0x80_u8) {
            tile_addr += signed_tile_base;
        }
        if(attributes.vram_bank()) {
            tile_addr += vram_bank_size;
        }

        const u8 tile_x = attributes.x_flip() ? 7_u8 - (px & 0x07_u8) : px & 0x07_u8;
        const u8 tile_y = attributes.y_flip() ? 7_u8 - (py & 0x07_u8) : py & 0x07_u8;
        const u8 color_idx = tile_color_index(tile_addr, tile_x, tile_y);

        bg_indices[x] = color_idx;
        bg_priorities[x] = attributes.priority();
        line[x] = cgb_mode_ ? bg_palettes_.color_at(attributes.palette(), color_idx) : dmg_color(bgp_, color_idx);
    }

    if(window_visible) {
        ++window_line_;
    }

    if(lcdc_.obj_enabled) {
        array<u8, screen_width> obj_indices{};
        array<color, screen_width> obj_colors;
        array<bool, screen_width> obj_behind_bg{};

        const u8 height = lcdc_.large_obj ? 16_u8 : 8_u8;

        // draw from the lowest priority up so higher priority objects overwrite
        for(usize i = line_obj_count_; i > 0_usize; --i) {
            const obj& o = line_objs_[i - 1_usize];

            u8 row = ly_ + obj_y_offset - o.y;
            if(o.y_flip()) {
                row = height - 1_u8 - row;
            }

            const u8 tile = lcdc_.large_obj ? o.tile & 0xFE_u8 : o.tile;
            usize tile_addr = widen<usize>(tile) * bytes_per_tile;
            if(cgb_mode_ && o.vram_bank()) {
                tile_addr += vram_bank_size;
            }

            for(const u8 col : range<u8>(8_u8)) {
                const u16 screen_x = widen<u16>(o.x) + widen<u16>(col);
                if(screen_x < widen<u16>(obj_x_offset) || screen_x >= screen_width + obj_x_offset) {
                    continue;
                }

                const u8 color_idx = tile_color_index(tile_addr, o.x_flip() ? 7_u8 - col : col, row);
                if(color_idx == 0_u8) {
                    continue;
                }

                const usize x = widen<usize>(screen_x - widen<u16>(obj_x_offset));
                obj_indices[x] = color_idx;
                obj_behind_bg[x] = o.behind_bg();
                obj_colors[x] = cgb_mode_
                  ? obj_palettes_.color_at(o.cgb_palette(), color_idx)
                  : dmg_color(o.dmg_palette() ? obp1_ : obp0_, color_idx);
            }
        }

        for(const usize x : range<usize>(screen_width)) {
            if(obj_indices[x] == 0_u8) {
                continue;
            }

            const bool bg_opaque = bg_indices[x] != 0_u8;
            const bool bg_wins = cgb_mode_
              ? lcdc_.bg_enabled && bg_opaque && (bg_priorities[x] || obj_behind_bg[x])
              : bg_opaque && obj_behind_bg[x];
            if(!bg_wins) {
                line[x] = obj_colors[x];
            }
        }
    }

    const usize line_offset = widen<usize>(ly_) * screen_width;
    std::copy(line.begin(), line.end(), frame_buffer_.begin() + line_offset.get());
}

u8 engine::tile_color_index(const usize tile_addr, const u8 x, const u8 y) const noexcept
{
    const usize row_addr = tile_addr + widen<usize>(y) * 2_usize;
    const u8 lsb = vram_[row_addr];
    const u8 msb = vram_[row_addr + 1_usize];
    const u8 bit_idx = 7_u8 - x;
    return bit::extract(msb, bit_idx) << 1_u8 | bit::extract(lsb, bit_idx);
}

color engine::dmg_color(const u8 palette, const u8 color_idx) const noexcept
{
    return dmg_shades[widen<usize>((palette >> (color_idx * 2_u8)) & 0x03_u8)];
}

} // namespace gbc::ppu
