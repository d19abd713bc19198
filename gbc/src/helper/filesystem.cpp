/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/helper/filesystem.h>

#include <fstream>

namespace gbc::fs {

vector<u8> read_file(const path& path, std::error_code& err)
{
    std::ifstream stream{path, std::ios::binary | std::ios::ate};
    if(!stream.is_open()) {
        LOG_ERROR(fs, "input file stream could not be opened: {}", path.string());
        err = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }

    const std::ifstream::pos_type file_size = stream.tellg();

    vector<u8> bytes(usize{static_cast<usize::type>(file_size)});
    stream.seekg(0, std::ios::beg);
    stream.read(reinterpret_cast<char*>(bytes.data()), file_size); // NOLINT
    if(!stream) {
        LOG_ERROR(fs, "could not read {}", path.string());
        err = std::make_error_code(std::errc::io_error);
        return {};
    }

    LOG_TRACE(fs, "read {} bytes from {}", bytes.size(), path.string());
    return bytes;
}

void write_file(const path& path, const view<u8> data, std::error_code& err)
{
    std::ofstream stream{path, std::ios::binary};
    if(!stream.is_open()) {
        LOG_ERROR(fs, "output file stream could not be opened: {}", path.string());
        err = std::make_error_code(std::errc::permission_denied);
        return;
    }

    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size().get())); // NOLINT
    if(!stream) {
        err = std::make_error_code(std::errc::io_error);
        return;
    }

    LOG_TRACE(fs, "wrote {} bytes to {}", data.size(), path.string());
}

} // namespace gbc::fs
