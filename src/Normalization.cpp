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

#include <floatview/Normalization.h>

#include <cmath>

using namespace std;

namespace floatview {

void NormalizationSettings::validate() const {
    if (min && !isfinite(*min)) {
        throw SettingsError{fmt::format("Normalization minimum must be finite, got {}.", *min)};
    }

    if (max && !isfinite(*max)) {
        throw SettingsError{fmt::format("Normalization maximum must be finite, got {}.", *max)};
    }
}

NormRange resolveRange(const NormalizationSettings& settings, const optional<Stats>& stats, double typeMax, bool isFloat) {
    if (settings.autoNormalize) {
        return {
            stats && isfinite(stats->min) ? stats->min : 0.0,
            stats && isfinite(stats->max) ? stats->max : typeMax,
        };
    }

    if (settings.gammaMode) {
        return {0.0, typeMax};
    }

    if (settings.hasManualRange()) {
        NormRange result{*settings.min, *settings.max};
        if (settings.normalizedFloatMode && !isFloat) {
            result.min *= typeMax;
            result.max *= typeMax;
        }

        return result;
    }

    return {0.0, typeMax};
}

double linearMap(double t, double min, double max) { return min + t * (max - min); }

double logMap(double t, double min, double max) {
    static const double EPSILON = 1e-10;

    const double logMin = log10(std::max(abs(min), EPSILON));
    const double logMax = log10(std::max(abs(max), EPSILON));
    const double value = pow(10.0, logMin + t * (logMax - logMin));

    if (min < 0 && max < 0) {
        return -value;
    } else if (min < 0) {
        return linearMap(t, min, max);
    }

    return value;
}

} // namespace floatview
