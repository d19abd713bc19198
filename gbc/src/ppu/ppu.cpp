/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/ppu/ppu.h>

#include <algorithm>

namespace gbc::ppu {

namespace {

constexpr u32 window_penalty = 6_u32;
constexpr u32 obj_penalty = 6_u32;
constexpr u8 max_window_x = 166_u8;

} // namespace

engine::engine()
  : vram_(16_kb),
    oam_(160_usize)
{
    blank_frame();
}

void engine::set_cgb_mode(const bool cgb_mode) noexcept
{
    cgb_mode_ = cgb_mode;
    blank_frame();
}

void engine::tick(u32 dots) noexcept
{
    if(!lcdc_.enabled) {
        return;
    }

    while(dots > 0_u32) {
        const u32 step = std::min(dots, next_transition_dot() - dot_);
        dot_ += step;
        dots -= step;

        if(dot_ == next_transition_dot()) {
            on_transition();
        }
    }
}

u8 engine::read_stat() const noexcept
{
    return 0x80_u8
      | stat_.read_irq_bits()
      | bit::from_bool<u8>(ly_ == lyc_) << 2_u8
      | from_enum<u8>(mode_);
}

void engine::write_lcdc(const u8 data) noexcept
{
    const bool was_enabled = lcdc_.enabled;
    lcdc_.write(data);

    if(was_enabled && !lcdc_.enabled) {
        ly_ = 0_u8;
        dot_ = 0_u32;
        mode_ = mode::hblank;
        stat_line_ = false;
        blank_frame();
        LOG_TRACE(ppu, "lcd disabled");
    } else if(!was_enabled && lcdc_.enabled) {
        ly_ = 0_u8;
        dot_ = 0_u32;
        window_line_ = 0_u8;
        window_y_triggered_ = false;
        start_line();
        LOG_TRACE(ppu, "lcd enabled");
    }
}

void engine::write_stat(const u8 data) noexcept
{
    stat_.write(data);
    if(lcdc_.enabled) {
        update_stat_line();
    }
}

void engine::write_lyc(const u8 data) noexcept
{
    lyc_ = data;
    if(lcdc_.enabled) {
        update_stat_line();
    }
}

u32 engine::next_transition_dot() const noexcept
{
    switch(mode_) {
        case mode::oam_scan:       return dots_oam_scan;
        case mode::pixel_transfer: return dots_oam_scan + pixel_transfer_length_;
        case mode::hblank:
        case mode::vblank:         return dots_per_line;
        default:
            UNREACHABLE();
    }
}

void engine::on_transition() noexcept
{
    switch(mode_) {
        case mode::oam_scan:
            scan_oam();
            pixel_transfer_length_ = calculate_pixel_transfer_length();
            enter_mode(mode::pixel_transfer);
            break;
        case mode::pixel_transfer:
            render_scanline();
            enter_mode(mode::hblank);
            event_on_hblank();
            break;
        case mode::hblank:
            dot_ = 0_u32;
            ++ly_;
            if(ly_ == screen_height) {
                enter_mode(mode::vblank);
                irq_.request_interrupt(cpu::interrupt_source::vblank);
            } else {
                start_line();
            }
            break;
        case mode::vblank:
            dot_ = 0_u32;
            ++ly_;
            if(ly_ == total_lines) {
                ly_ = 0_u8;
                window_line_ = 0_u8;
                window_y_triggered_ = false;
                ++frame_count_;
                event_on_frame(frame_buffer_);
                start_line();
            } else {
                update_stat_line();
            }
            break;
        default:
            UNREACHABLE();
    }
}

void engine::enter_mode(const mode m) noexcept
{
    mode_ = m;
    update_stat_line();
}

void engine::start_line() noexcept
{
    if(ly_ == wy_) {
        window_y_triggered_ = true;
    }
    enter_mode(mode::oam_scan);
}

void engine::update_stat_line() noexcept
{
    const bool line = (stat_.lyc_irq_enabled && ly_ == lyc_)
      || (stat_.hblank_irq_enabled && mode_ == mode::hblank)
      || (stat_.vblank_irq_enabled && mode_ == mode::vblank)
      || (stat_.oam_irq_enabled && mode_ == mode::oam_scan);

    // the interrupt fires on the rising edge of the combined line only
    if(line && !stat_line_) {
        irq_.request_interrupt(cpu::interrupt_source::lcd_stat);
    }
    stat_line_ = line;
}

void engine::blank_frame() noexcept
{
    std::fill(frame_buffer_.begin(), frame_buffer_.end(), cgb_mode_ ? color::white() : dmg_shades[0_usize]);
}

bool engine::window_visible_on_line() const noexcept
{
    return lcdc_.window_enabled
      && window_y_triggered_
      && wx_ <= max_window_x
      && (cgb_mode_ || lcdc_.bg_enabled);
}

u32 engine::calculate_pixel_transfer_length() const noexcept
{
    u32 length = dots_pixel_transfer + widen<u32>(scx_ & 0x07_u8);
    length += obj_penalty * narrow<u32>(line_obj_count_);
    if(window_visible_on_line()) {
        length += window_penalty;
    }
    return length;
}

} // namespace gbc::ppu
