/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/spdlog.h>

#include <gbc/core.h>
#include <gbc/helper/filesystem.h>
#include <gbc/version.h>

namespace {

void print_serial(const gbc::u8 data)
{
    fmt::print("{}", static_cast<char>(data.get()));
    std::fflush(stdout);
}

std::optional<gbc::model> parse_model(const std::string& name) noexcept
{
    if(name == "auto") { return gbc::model::automatic; }
    if(name == "dmg") { return gbc::model::dmg; }
    if(name == "cgb") { return gbc::model::cgb; }
    return std::nullopt;
}

// binary PPM, 8 bits per channel
gbc::vector<gbc::u8> make_ppm(const gbc::ppu::frame_buffer& frame)
{
    const std::string header = fmt::format("P6\n{} {}\n255\n", gbc::ppu::screen_width, gbc::ppu::screen_height);

    gbc::vector<gbc::u8> image;
    for(const char c : header) {
        image.push_back(gbc::u8{static_cast<gbc::u8::type>(c)});
    }
    for(const gbc::ppu::color& pixel : frame) {
        image.push_back(pixel.r);
        image.push_back(pixel.g);
        image.push_back(pixel.b);
    }
    return image;
}

void load_battery_ram(gbc::core& core, const gbc::fs::path& save_path)
{
    if(!core.cartridge_header().has_battery || !gbc::fs::exists(save_path)) {
        return;
    }

    std::error_code err;
    const gbc::vector<gbc::u8> data = gbc::fs::read_file(save_path, err);
    if(!err) {
        core.import_battery_ram(data, err);
    }

    if(err) {
        LOG_WARN(runner, "could not load battery ram from {}: {}", save_path.string(), err.message());
    } else {
        LOG_INFO(runner, "battery ram loaded from {}", save_path.string());
    }
}

void save_battery_ram(const gbc::core& core, const gbc::fs::path& save_path)
{
    const gbc::vector<gbc::u8> data = core.export_battery_ram();
    if(data.empty()) {
        return;
    }

    std::error_code err;
    gbc::fs::write_file(save_path, data, err);
    if(err) {
        LOG_ERROR(runner, "could not write battery ram to {}: {}", save_path.string(), err.message());
    }
}

} // namespace

int main(int argc, char** argv)
{
#if SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF
    static constexpr const char* log_pattern = "[%H:%M:%S:%e] [%s:%#] [%^%L%$] %v";

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern(log_pattern);
    spdlog::set_default_logger(spdlog::stdout_color_st("core"));
#endif // SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF

    cxxopts::Options options("gameboicolor", "A headless Gameboy and Gameboy Color emulator");
    options
      .show_positional_help()
      .add_options()
        ("v,version", "Print version and exit")
        ("h,help", "Show this help text")
#if SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF
        ("enable-file-log", "Enables file logging")
        ("log-level", "One of trace, debug, info, warn, err, critical, off", cxxopts::value<std::string>()->default_value("info"))
#endif // SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF
        ("boot-rom", "Boot rom binary path, the post-boot state is used if not provided", cxxopts::value<std::string>())
        ("m,model", "Hardware model: auto, dmg or cgb", cxxopts::value<std::string>()->default_value("auto"))
        ("f,frames", "Number of frames to run", cxxopts::value<uint32_t>()->default_value("600"))
        ("serial", "Print bytes sent through the serial port")
        ("screenshot", "Write the last frame to this file as PPM", cxxopts::value<std::string>())
        ("no-save", "Don't load or store battery ram")
        ("load-state", "Save state to load before running", cxxopts::value<std::string>())
        ("save-state", "Write a save state here after running", cxxopts::value<std::string>())
        ("rom-path", "Rom path", cxxopts::value<std::string>());

    options.parse_positional("rom-path");

    const auto parsed = options.parse(argc, argv);

#if SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF
    spdlog::set_level(spdlog::level::from_str(parsed["log-level"].as<std::string>()));

    if(parsed["enable-file-log"].as<bool>()) {
        auto file_log_sink = std::make_shared<spdlog::sinks::daily_file_sink_st>("logs/gbc.log", 0, 0, false, 5);
        file_log_sink->set_pattern(log_pattern);
        spdlog::default_logger()->sinks().push_back(std::move(file_log_sink));
    }
#endif // SPDLOG_ACTIVE_LEVEL != SPDLOG_LEVEL_OFF

    if(parsed["version"].as<bool>()) {
        fmt::print("gameboicolor v{}\n", gbc::version);
        return EXIT_SUCCESS;
    }

    if(parsed["help"].as<bool>() || parsed["rom-path"].count() == 0) {
        fmt::print("{}", options.help());
        return EXIT_FAILURE;
    }

    const std::optional<gbc::model> hardware = parse_model(parsed["model"].as<std::string>());
    if(!hardware.has_value()) {
        fmt::print("unknown model: {}\n{}", parsed["model"].as<std::string>(), options.help());
        return EXIT_FAILURE;
    }

    std::error_code err;
    const gbc::fs::path rom_path = parsed["rom-path"].as<std::string>();
    gbc::vector<gbc::u8> rom = gbc::fs::read_file(rom_path, err);
    if(err) {
        fmt::print("could not read rom {}: {}\n", rom_path.string(), err.message());
        return EXIT_FAILURE;
    }

    gbc::core::config config{*hardware, std::nullopt};
    if(parsed["boot-rom"].count() != 0) {
        const gbc::fs::path boot_rom_path = parsed["boot-rom"].as<std::string>();
        config.boot_rom = gbc::fs::read_file(boot_rom_path, err);
        if(err) {
            fmt::print("could not read boot rom {}: {}\n", boot_rom_path.string(), err.message());
            return EXIT_FAILURE;
        }
    }

    std::unique_ptr<gbc::core> core = gbc::core::make(std::move(rom), std::move(config), err);
    if(!core) {
        fmt::print("could not load {}: {}\n", rom_path.string(), err.message());
        return EXIT_FAILURE;
    }

    gbc::fs::path save_path = rom_path;
    save_path.replace_extension(".sav");

    const bool use_battery_file = !parsed["no-save"].as<bool>();
    if(use_battery_file) {
        load_battery_ram(*core, save_path);
    }

    if(parsed["load-state"].count() != 0) {
        const gbc::fs::path state_path = parsed["load-state"].as<std::string>();
        const gbc::vector<gbc::u8> state = gbc::fs::read_file(state_path, err);
        if(!err) {
            core->load_state(state, err);
        }

        if(err) {
            fmt::print("could not load state {}: {}\n", state_path.string(), err.message());
            return EXIT_FAILURE;
        }
    }

    if(parsed["serial"].as<bool>()) {
        core->on_serial_transfer_event().add_delegate({gbc::connect_arg<&print_serial>});
    }

    int exit_code = EXIT_SUCCESS;
    const uint32_t frames = parsed["frames"].as<uint32_t>();
    for(uint32_t frame = 0; frame < frames; ++frame) {
        core->run_frame(err);
        if(err) {
            const gbc::cpu::sm83& cpu = core->processor();
            LOG_CRITICAL(runner, "{}: opcode {:02X} at {:04X} after {} frames",
              err.message(), cpu.fault_opcode(), cpu.fault_address(), core->frame_count());
            exit_code = EXIT_FAILURE;
            break;
        }
    }

    LOG_INFO(runner, "ran {} frames, {} cycles", core->frame_count(), core->cycles());

    if(parsed["screenshot"].count() != 0) {
        const gbc::fs::path screenshot_path = parsed["screenshot"].as<std::string>();
        std::error_code write_err;
        gbc::fs::write_file(screenshot_path, make_ppm(core->frame()), write_err);
        if(write_err) {
            LOG_ERROR(runner, "could not write screenshot {}: {}", screenshot_path.string(), write_err.message());
            exit_code = EXIT_FAILURE;
        }
    }

    if(parsed["save-state"].count() != 0) {
        const gbc::fs::path state_path = parsed["save-state"].as<std::string>();
        const std::optional<gbc::vector<gbc::u8>> state = core->save_state();
        if(!state.has_value()) {
            LOG_ERROR(runner, "could not compress the save state");
            exit_code = EXIT_FAILURE;
        } else {
            std::error_code write_err;
            gbc::fs::write_file(state_path, *state, write_err);
            if(write_err) {
                LOG_ERROR(runner, "could not write state {}: {}", state_path.string(), write_err.message());
                exit_code = EXIT_FAILURE;
            }
        }
    }

    if(use_battery_file) {
        save_battery_ram(*core, save_path);
    }

    return exit_code;
}
