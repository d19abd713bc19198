/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_VERSION_H
#define GAMEBOICOLOR_VERSION_H

#include <string_view>

namespace gbc {

[[maybe_unused]] constexpr auto version_major = 0;
[[maybe_unused]] constexpr auto version_minor = 1;
[[maybe_unused]] constexpr auto version_patch = 0;

[[maybe_unused]] constexpr std::string_view version = "0.1.0";

} // namespace gbc

#endif //GAMEBOICOLOR_VERSION_H
