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

#include <floatview/ToneMapper.h>

#include <cmath>

using namespace std;

namespace floatview {

bool ToneSettings::isIdentity() const {
    static const double EPSILON = 1e-3;
    return abs(gammaIn - 1.0) < EPSILON && abs(gammaOut - 1.0) < EPSILON && abs(exposureStops) < EPSILON;
}

void ToneSettings::validate() const {
    if (!isfinite(gammaIn) || gammaIn <= 0) {
        throw SettingsError{fmt::format("Input gamma must be positive and finite, got {}.", gammaIn)};
    }

    if (!isfinite(gammaOut) || gammaOut <= 0) {
        throw SettingsError{fmt::format("Output gamma must be positive and finite, got {}.", gammaOut)};
    }

    if (!isfinite(exposureStops)) {
        throw SettingsError{fmt::format("Exposure must be finite, got {}.", exposureStops)};
    }
}

double applyTone(double normalized, const ToneSettings& tone) {
    if (tone.isIdentity()) {
        return normalized;
    }

    double linear = pow(normalized, tone.gammaIn);
    if (tone.exposureStops != 0) {
        linear *= exp2(tone.exposureStops);
    }

    return pow(linear, 1.0 / tone.gammaOut);
}

double invertTone(double displayed, const ToneSettings& tone) {
    if (tone.isIdentity()) {
        return displayed;
    }

    if (displayed <= 0) {
        return 0.0;
    }

    const double linear = pow(displayed, tone.gammaOut) / exp2(tone.exposureStops);
    return pow(linear, 1.0 / tone.gammaIn);
}

} // namespace floatview
