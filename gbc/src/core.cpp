/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/core.h>

#include <gbc/helper/gzip.h>

namespace gbc {

namespace {

constexpr std::string_view state_magic = "GBCS";
constexpr usize wram_size = 32_kb;
constexpr usize wram_bank_size = 4_kb;

bool select_cgb_mode(const model hardware, const cartridge::header& header) noexcept
{
    switch(hardware) {
        case model::automatic:
            return header.supports_cgb();
        case model::cgb:
            if(!header.supports_cgb()) {
                LOG_WARN(core, "cartridge has no color support, running as dmg");
                return false;
            }
            return true;
        case model::dmg:
            if(header.requires_cgb()) {
                LOG_WARN(core, "cartridge requires the color model, running as dmg anyway");
            }
            return false;
        default:
            UNREACHABLE();
    }
}

} // namespace

core::core(construct_key, cartridge::cartridge cart, vector<u8> boot_rom, const bool cgb_mode)
  : cartridge_{std::move(cart)},
    cpu_{this},
    dma_{this},
    serial_{&scheduler_},
    boot_rom_{std::move(boot_rom)},
    boot_rom_mapped_{!boot_rom_.empty()},
    cgb_mode_{cgb_mode},
    wram_(wram_size)
{
    cpu_.set_cgb_mode(cgb_mode_);
    ppu_.set_cgb_mode(cgb_mode_);
    serial_.set_cgb_mode(cgb_mode_);

    timer_.set_irq_controller_handle(cpu_.get_interrupt_handle());
    ppu_.set_irq_controller_handle(cpu_.get_interrupt_handle());
    joypad_.set_irq_controller_handle(cpu_.get_interrupt_handle());
    serial_.set_irq_controller_handle(cpu_.get_interrupt_handle());

    cpu_.on_speed_switch = {connect_arg<&core::on_speed_switch>, this};
    ppu_.event_on_hblank.add_delegate({connect_arg<&dma::controller::on_hblank>, &dma_});

    if(!boot_rom_mapped_) {
        skip_boot_rom();
    }
}

std::unique_ptr<core> core::make(vector<u8> rom, config cfg, std::error_code& err)
{
    std::optional<cartridge::cartridge> cart = cartridge::cartridge::load(std::move(rom), err);
    if(!cart.has_value()) {
        return nullptr;
    }

    const bool cgb_mode = select_cgb_mode(cfg.hardware, cart->get_header());

    vector<u8> boot_rom;
    if(cfg.boot_rom.has_value()) {
        boot_rom = std::move(*cfg.boot_rom);

        const usize expected_size = cgb_mode ? cgb_boot_rom_size : dmg_boot_rom_size;
        if(boot_rom.size() != expected_size) {
            LOG_ERROR(core, "invalid boot rom size for the {} model: {} (expected {})",
              cgb_mode ? "cgb" : "dmg", boot_rom.size(), expected_size);
            err = error::invalid_boot_rom;
            return nullptr;
        }
    }

    LOG_INFO(core, "running \"{}\" in {} mode", cart->get_header().title, cgb_mode ? "cgb" : "dmg");
    return std::make_unique<core>(construct_key{}, std::move(*cart), std::move(boot_rom), cgb_mode);
}

u32 core::run_one_step(std::error_code& err) noexcept
{
    if(UNLIKELY(cpu_.locked())) {
        err = error::undefined_opcode;
        return 0_u32;
    }

    const u32 cycles = cpu_.step();
    tick_components(cycles);

    const u32 stall = dma_.settle(cycles);
    if(stall != 0_u32) {
        tick_components(stall);
    }

    scheduler_.add_cycles(cycles + stall);

    if(joypad_.poll()) {
        cpu_.wake_from_stop();
    }

    if(UNLIKELY(cpu_.locked())) {
        err = error::undefined_opcode;
    }
    return cycles + stall;
}

void core::run_frame(std::error_code& err) noexcept
{
    const u64 frame = ppu_.frame_count();
    const u64 deadline = scheduler_.now() + (widen<u64>(ppu::engine::dots_per_frame) << bit::from_bool<u64>(cpu_.double_speed()));

    while(!err && ppu_.frame_count() == frame) {
        if(!ppu_.lcdc_.enabled && scheduler_.now() >= deadline) {
            break;
        }
        run_one_step(err);
    }
}

std::optional<vector<u8>> core::save_state() const
{
    archive archive;
    serialize(archive);
    return gzip::compress(archive.data());
}

void core::load_state(const vector<u8>& data, std::error_code& err)
{
    std::optional<vector<u8>> decompressed = gzip::decompress(data);
    if(!decompressed.has_value()) {
        LOG_ERROR(core, "could not decompress state");
        err = error::corrupted_state;
        return;
    }

    archive backup;
    serialize(backup);

    const archive state{std::move(*decompressed)};
    deserialize(state);

    if(state.corrupted() || !state.fully_consumed()) {
        LOG_ERROR(core, "corrupted state, restoring the previous one");
        deserialize(backup);
        err = error::corrupted_state;
        return;
    }

    LOG_INFO(core, "state loaded");
}

void core::tick_components(const u32 cycles) noexcept
{
    // the display and the cartridge clock don't follow the double speed switch
    const u32 dots = cycles >> bit::from_bool<u32>(cpu_.double_speed());
    timer_.tick(cycles);
    ppu_.tick(dots);
    cartridge_.tick(dots);
}

void core::on_speed_switch() noexcept
{
    timer_.write_div();
    dma_.set_double_speed(cpu_.double_speed());
}

void core::skip_boot_rom() noexcept
{
    cpu::register_file& r = cpu_.registers();
    r.sp = 0xFFFE_u16;
    r.pc = 0x0100_u16;

    if(cgb_mode_) {
        r.set_af(0x1180_u16);
        r.set_bc(0x0000_u16);
        r.set_de(0xFF56_u16);
        r.set_hl(0x000D_u16);
        timer_.set_internal_counter(0x1EA0_u16);
        ppu_.bg_palettes_.fill(0xFF_u8);
    } else {
        r.set_af(0x01B0_u16);
        r.set_bc(0x0013_u16);
        r.set_de(0x00D8_u16);
        r.set_hl(0x014D_u16);
        timer_.set_internal_counter(0xABCC_u16);
    }

    cpu_.interrupts_.write_if(0x01_u8);
    joypad_.write(0x00_u8);
    ppu_.bgp_ = 0xFC_u8;
    ppu_.obp0_ = 0xFF_u8;
    ppu_.obp1_ = 0xFF_u8;
    ppu_.write_lcdc(0x91_u8);
}

bool core::in_boot_rom(const u16 addr) const noexcept
{
    if(addr < 0x0100_u16) {
        return true;
    }

    // the color boot rom leaves a hole for the cartridge header
    return boot_rom_.size() == cgb_boot_rom_size && addr >= 0x0200_u16 && addr < 0x0900_u16;
}

usize core::wram_offset(const u16 addr) const noexcept
{
    const u16 offset = addr & 0x1FFF_u16;
    if(offset < 0x1000_u16) {
        return widen<usize>(offset);
    }
    return widen<usize>(offset & 0x0FFF_u16) + widen<usize>(wram_bank_) * wram_bank_size;
}

void core::serialize(archive& archive) const noexcept
{
    archive.serialize(state_magic);
    archive.serialize(state_version);
    archive.serialize(std::string_view{cartridge_.get_header().title});
    archive.serialize(cartridge_.get_header().header_checksum);
    archive.serialize(cgb_mode_);

    archive.serialize(scheduler_);
    archive.serialize(cartridge_);
    archive.serialize(cpu_);
    archive.serialize(timer_);
    archive.serialize(dma_);
    archive.serialize(ppu_);
    archive.serialize(joypad_);
    archive.serialize(serial_);

    archive.serialize(boot_rom_mapped_);
    archive.serialize(wram_);
    archive.serialize(wram_bank_);
    archive.serialize(hram_);
}

void core::deserialize(const archive& archive) noexcept
{
    const auto magic = archive.deserialize<std::string_view>();
    const auto version = archive.deserialize<u32>();
    const auto title = archive.deserialize<std::string_view>();
    const auto checksum = archive.deserialize<u8>();
    const auto cgb_mode = archive.deserialize<bool>();

    if(archive.corrupted() || magic != state_magic || version != state_version) {
        LOG_ERROR(core, "not a save state or an unsupported version");
        archive.mark_corrupted();
        return;
    }

    if(title != cartridge_.get_header().title || checksum != cartridge_.get_header().header_checksum || cgb_mode != cgb_mode_) {
        LOG_ERROR(core, "state belongs to another cartridge or model: {}", title);
        archive.mark_corrupted();
        return;
    }

    archive.deserialize(scheduler_);
    archive.deserialize(cartridge_);
    archive.deserialize(cpu_);
    archive.deserialize(timer_);
    archive.deserialize(dma_);
    archive.deserialize(ppu_);
    archive.deserialize(joypad_);
    archive.deserialize(serial_);

    archive.deserialize(boot_rom_mapped_);
    archive.deserialize(wram_);
    archive.deserialize(wram_bank_);
    archive.deserialize(hram_);

    if(wram_.size() != wram_size || wram_bank_ == 0_u8 || wram_bank_ > 7_u8) {
        archive.mark_corrupted();
    }

    if(boot_rom_mapped_ && boot_rom_.empty()) {
        LOG_ERROR(core, "state has the boot rom mapped but this machine has none");
        archive.mark_corrupted();
    }
}

} // namespace gbc
