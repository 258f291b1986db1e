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

#include <floatview/MaskFilter.h>
#include <floatview/Normalization.h>
#include <floatview/ToneMapper.h>

#include <array>
#include <string>
#include <vector>

namespace floatview {

enum class ENanColor {
    Black,
    Fuchsia,
};

ENanColor toNanColor(std::string_view name);
std::string_view toString(ENanColor color);

inline std::array<uint8_t, 3> nanColorRgb(ENanColor color) {
    return color == ENanColor::Fuchsia ? std::array<uint8_t, 3>{255, 0, 255} : std::array<uint8_t, 3>{0, 0, 0};
}

// Everything a render, histogram or pixel readout of one image depends on.
struct ViewSettings {
    NormalizationSettings normalization;
    ToneSettings tone;
    ENanColor nanColor = ENanColor::Black;

    // Interpret the first three channels as one packed 24-bit integer. Ignored for images with fewer than 3 channels.
    bool rgbAs24BitGrayscale = false;
    // Divisor for 24-bit values in the pixel readout.
    double scale24BitFactor = 1000.0;

    std::vector<MaskFilter> masks;

    // Float sources start out auto-normalized, integer sources in gamma mode.
    static ViewSettings defaultsFor(const FormatInfo& info);

    void validate() const;
};

struct SettingsChange {
    // Only display parameters changed: cached statistics stay valid.
    bool parametersOnly = false;
    bool changedMasks = false;
    // 24-bit mode, its scale factor or normalized-float mode changed.
    bool changedStructure = false;

    bool any() const { return parametersOnly || changedMasks || changedStructure; }
};

SettingsChange diffSettings(const ViewSettings& oldSettings, const ViewSettings& newSettings);

} // namespace floatview
