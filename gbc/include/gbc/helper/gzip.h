/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_GZIP_H
#define GAMEBOICOLOR_GZIP_H

#include <optional>

#include <gbc/core/container.h>

namespace gbc::gzip {

[[nodiscard]] std::optional<vector<u8>> compress(const vector<u8>& uncompressed) noexcept;
[[nodiscard]] std::optional<vector<u8>> decompress(const vector<u8>& compressed) noexcept;

} // namespace gbc::gzip

#endif  // GAMEBOICOLOR_GZIP_H
