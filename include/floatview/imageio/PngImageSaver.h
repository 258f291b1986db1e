/*
 * floatview -- the float image viewer
 *
 * Copyright (C) 2025 Thomas Müller <contact@tom94.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <floatview/Common.h>

#include <ostream>
#include <span>

namespace floatview {

class PngImageSaver {
public:
    // Writes 8-bit samples with 1 (gray), 2 (gray + alpha), 3 (RGB) or 4 (RGBA) interleaved channels.
    void save(std::ostream& oStream, std::span<const uint8_t> data, int width, int height, int nChannels) const;
    void save(const fs::path& path, std::span<const uint8_t> data, int width, int height, int nChannels) const;
};

} // namespace floatview
