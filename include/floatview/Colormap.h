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

#include <floatview/SampleBuffer.h>

#include <array>
#include <map>
#include <string>
#include <vector>

namespace floatview {

using ColormapTable = std::array<std::array<uint8_t, 3>, 256>;

// Recovers scalar values from images rendered through a known colormap.
class ColormapConverter {
public:
    ColormapConverter();

    // Throws std::invalid_argument for unknown colormap names.
    const ColormapTable& colormap(const std::string& name) const;
    std::vector<std::string> names() const;

    // Index of the table entry closest to the color in RGB space. Ties resolve to the lowest index.
    static int findClosestIndex(const ColormapTable& table, uint8_t r, uint8_t g, uint8_t b);

    // Maps every pixel of an RGBA8 raster to min..max through its colormap index (optionally inverted, optionally in log space) and
    // returns a single-channel float buffer.
    SampleBuffer convertToFloat(const RGBA8Buffer& image, const std::string& name, double min, double max, bool inverted, bool logarithmic)
        const;

private:
    std::map<std::string, ColormapTable> mColormaps;
};

} // namespace floatview
