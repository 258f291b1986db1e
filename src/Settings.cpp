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

#include <floatview/Settings.h>

using namespace std;

namespace floatview {

ENanColor toNanColor(string_view name) {
    const string lower = toLower(name);
    if (lower == "black") {
        return ENanColor::Black;
    } else if (lower == "fuchsia") {
        return ENanColor::Fuchsia;
    }

    throw SettingsError{fmt::format("Unknown NaN color '{}'. Valid colors are black and fuchsia.", name)};
}

string_view toString(ENanColor color) {
    switch (color) {
        case ENanColor::Black: return "black";
        case ENanColor::Fuchsia: return "fuchsia";
    }

    return "unknown";
}

ViewSettings ViewSettings::defaultsFor(const FormatInfo& info) {
    ViewSettings result;
    if (info.isFloat()) {
        result.normalization.autoNormalize = true;
    } else {
        result.normalization.gammaMode = true;
    }

    return result;
}

void ViewSettings::validate() const {
    normalization.validate();
    tone.validate();

    if (!isfinite(scale24BitFactor) || scale24BitFactor <= 0) {
        throw SettingsError{fmt::format("24-bit scale factor must be positive and finite, got {}.", scale24BitFactor)};
    }

    for (const auto& mask : masks) {
        if (!isfinite(mask.threshold)) {
            throw SettingsError{fmt::format("Mask threshold must be finite, got {}.", mask.threshold)};
        }
    }
}

SettingsChange diffSettings(const ViewSettings& oldSettings, const ViewSettings& newSettings) {
    SettingsChange result;

    result.changedStructure = oldSettings.rgbAs24BitGrayscale != newSettings.rgbAs24BitGrayscale ||
        oldSettings.scale24BitFactor != newSettings.scale24BitFactor ||
        oldSettings.normalization.normalizedFloatMode != newSettings.normalization.normalizedFloatMode;

    result.changedMasks = oldSettings.masks != newSettings.masks;

    const bool changedParameters = oldSettings.normalization != newSettings.normalization || oldSettings.tone != newSettings.tone ||
        oldSettings.nanColor != newSettings.nanColor;

    result.parametersOnly = changedParameters && !result.changedStructure && !result.changedMasks;
    return result;
}

} // namespace floatview
