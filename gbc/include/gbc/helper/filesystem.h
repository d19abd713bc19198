/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_FILESYSTEM_H
#define GAMEBOICOLOR_FILESYSTEM_H

#include <filesystem>
#include <system_error>

#include <gbc/core/container.h>

namespace gbc::fs {

using namespace std::filesystem;

vector<u8> read_file(const path& path, std::error_code& err);
void write_file(const path& path, view<u8> data, std::error_code& err);

} // namespace gbc::fs

#endif //GAMEBOICOLOR_FILESYSTEM_H
