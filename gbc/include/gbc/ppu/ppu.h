/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_PPU_H
#define GAMEBOICOLOR_PPU_H

#include <gbc/core/container.h>
#include <gbc/core/event/event.h>
#include <gbc/core/fwd.h>
#include <gbc/cpu/interrupt_controller.h>
#include <gbc/ppu/types.h>

namespace gbc::ppu {

constexpr u32::type screen_width = 160_u32;
constexpr u32::type screen_height = 144_u32;

constexpr u32::type tile_dot_count = 8_u32;

using frame_buffer = array<color, screen_width * screen_height>;

/**
 * Scanline based display controller.
 *
 * Every line takes 456 dots. Lines 0-143 go through OAM scan (80 dots), pixel transfer
 * (172 dots plus the line's fine scroll, window and object penalties) and hblank. Lines 144-153
 * are vblank. The line is resolved into the frame buffer at the end of pixel transfer.
 */
class engine {
    friend core;

    static constexpr usize max_objs_per_line = 10_usize;

    cpu::irq_controller_handle irq_;

    vector<u8> vram_;
    vector<u8> oam_;
    u8 vram_bank_;

    lcdc lcdc_;
    stat stat_;
    mode mode_{mode::hblank};
    u8 ly_;
    u8 lyc_;
    u8 scy_;
    u8 scx_;
    u8 wy_;
    u8 wx_;
    u8 bgp_;
    u8 obp0_;
    u8 obp1_;

    palette_ram bg_palettes_;
    palette_ram obj_palettes_;

    u32 dot_;
    u32 pixel_transfer_length_;
    bool stat_line_ = false;
    bool window_y_triggered_ = false;
    u8 window_line_;

    array<obj, max_objs_per_line.get()> line_objs_;
    usize line_obj_count_;

    bool cgb_mode_ = false;
    frame_buffer frame_buffer_;
    u64 frame_count_;

public:
    static inline constexpr auto addr_lcdc = 0xFF40_u16;
    static inline constexpr auto addr_stat = 0xFF41_u16;
    static inline constexpr auto addr_scy = 0xFF42_u16;
    static inline constexpr auto addr_scx = 0xFF43_u16;
    static inline constexpr auto addr_ly = 0xFF44_u16;
    static inline constexpr auto addr_lyc = 0xFF45_u16;
    static inline constexpr auto addr_bgp = 0xFF47_u16;
    static inline constexpr auto addr_obp0 = 0xFF48_u16;
    static inline constexpr auto addr_obp1 = 0xFF49_u16;
    static inline constexpr auto addr_wy = 0xFF4A_u16;
    static inline constexpr auto addr_wx = 0xFF4B_u16;
    static inline constexpr auto addr_vbk = 0xFF4F_u16;
    static inline constexpr auto addr_bcps = 0xFF68_u16;
    static inline constexpr auto addr_bcpd = 0xFF69_u16;
    static inline constexpr auto addr_ocps = 0xFF6A_u16;
    static inline constexpr auto addr_ocpd = 0xFF6B_u16;

    static constexpr u32 dots_per_line = 456_u32;
    static constexpr u32 dots_oam_scan = 80_u32;
    static constexpr u32 dots_pixel_transfer = 172_u32;
    static constexpr u8 total_lines = 154_u8;
    static constexpr u32 dots_per_frame = 70224_u32;

    event<> event_on_hblank;
    event<const frame_buffer&> event_on_frame;

    engine();

    void set_irq_controller_handle(const cpu::irq_controller_handle irq) noexcept { irq_ = irq; }
    void set_cgb_mode(bool cgb_mode) noexcept;

    void tick(u32 dots) noexcept;

    [[nodiscard]] mode current_mode() const noexcept { return mode_; }
    [[nodiscard]] u8 current_line() const noexcept { return ly_; }
    [[nodiscard]] u64 frame_count() const noexcept { return frame_count_; }
    [[nodiscard]] const frame_buffer& frame() const noexcept { return frame_buffer_; }

    [[nodiscard]] bool vram_accessible() const noexcept { return mode_ != mode::pixel_transfer; }
    [[nodiscard]] bool oam_accessible() const noexcept { return mode_ != mode::pixel_transfer && mode_ != mode::oam_scan; }

    [[nodiscard]] u8 read_vram(const u16 addr) const noexcept { return vram_[vram_offset(addr)]; }
    void write_vram(const u16 addr, const u8 data) noexcept { vram_[vram_offset(addr)] = data; }
    [[nodiscard]] u8 read_oam(const u16 addr) const noexcept { return oam_[widen<usize>(addr & 0xFF_u16)]; }
    void write_oam(const u16 addr, const u8 data) noexcept { oam_[widen<usize>(addr & 0xFF_u16)] = data; }

    [[nodiscard]] u8 read_stat() const noexcept;
    void write_lcdc(u8 data) noexcept;
    void write_stat(u8 data) noexcept;
    void write_lyc(u8 data) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(vram_);
        archive.serialize(oam_);
        archive.serialize(vram_bank_);
        archive.serialize(lcdc_);
        archive.serialize(stat_);
        archive.serialize(mode_);
        archive.serialize(ly_);
        archive.serialize(lyc_);
        archive.serialize(scy_);
        archive.serialize(scx_);
        archive.serialize(wy_);
        archive.serialize(wx_);
        archive.serialize(bgp_);
        archive.serialize(obp0_);
        archive.serialize(obp1_);
        archive.serialize(bg_palettes_);
        archive.serialize(obj_palettes_);
        archive.serialize(dot_);
        archive.serialize(pixel_transfer_length_);
        archive.serialize(stat_line_);
        archive.serialize(window_y_triggered_);
        archive.serialize(window_line_);
        archive.serialize(frame_count_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(vram_);
        archive.deserialize(oam_);
        archive.deserialize(vram_bank_);
        archive.deserialize(lcdc_);
        archive.deserialize(stat_);
        archive.deserialize(mode_);
        archive.deserialize(ly_);
        archive.deserialize(lyc_);
        archive.deserialize(scy_);
        archive.deserialize(scx_);
        archive.deserialize(wy_);
        archive.deserialize(wx_);
        archive.deserialize(bgp_);
        archive.deserialize(obp0_);
        archive.deserialize(obp1_);
        archive.deserialize(bg_palettes_);
        archive.deserialize(obj_palettes_);
        archive.deserialize(dot_);
        archive.deserialize(pixel_transfer_length_);
        archive.deserialize(stat_line_);
        archive.deserialize(window_y_triggered_);
        archive.deserialize(window_line_);
        archive.deserialize(frame_count_);

        if(vram_.size() != 16_kb || oam_.size() != 160_usize || vram_bank_ > 1_u8 || ly_ >= total_lines
          || from_enum<u8>(mode_) > from_enum<u8>(mode::pixel_transfer)
          || pixel_transfer_length_ > dots_per_line - dots_oam_scan
          || dot_ >= next_transition_dot()) {
            archive.mark_corrupted();
        }
    }

private:
    [[nodiscard]] usize vram_offset(const u16 addr) const noexcept
    {
        return widen<usize>(addr & 0x1FFF_u16) + widen<usize>(vram_bank_) * 8_kb;
    }

    [[nodiscard]] u32 next_transition_dot() const noexcept;
    void on_transition() noexcept;
    void enter_mode(mode m) noexcept;
    void start_line() noexcept;
    void update_stat_line() noexcept;
    void blank_frame() noexcept;

    [[nodiscard]] bool window_visible_on_line() const noexcept;
    [[nodiscard]] u32 calculate_pixel_transfer_length() const noexcept;

    // ppu_render.cpp
    void scan_oam() noexcept;
    void render_scanline() noexcept;
    [[nodiscard]] u8 tile_color_index(usize tile_addr, u8 x, u8 y) const noexcept;
    [[nodiscard]] color dmg_color(u8 palette, u8 color_idx) const noexcept;
};

} // namespace gbc::ppu

#endif //GAMEBOICOLOR_PPU_H
