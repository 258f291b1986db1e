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

namespace floatview {

struct ToneSettings {
    double gammaIn = 1.0;
    double gammaOut = 1.0;
    double exposureStops = 0.0;

    bool isIdentity() const;

    // Throws SettingsError for non-positive or non-finite gammas and non-finite exposure.
    void validate() const;

    bool operator==(const ToneSettings&) const = default;
};

// normalized^gammaIn * 2^exposureStops, raised to 1/gammaOut. Not clamped: HDR values may exceed 1.
double applyTone(double normalized, const ToneSettings& tone);

// Inverse of applyTone for displayed values in (0,1]. Values <= 0 map to 0.
double invertTone(double displayed, const ToneSettings& tone);

} // namespace floatview
