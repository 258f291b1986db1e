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

#include <floatview/Statistics.h>

#include <optional>

namespace floatview {

struct NormalizationSettings {
    // Stretch the observed finite min/max of the image to the display range. Takes precedence over everything else.
    bool autoNormalize = false;
    // Show the full native range (0..typeMax) and enable gamma/exposure.
    bool gammaMode = false;

    // Manual range. Only used when both bounds are set.
    std::optional<double> min;
    std::optional<double> max;

    // The manual range of an integer image is given as a fraction of typeMax.
    bool normalizedFloatMode = false;

    bool hasManualRange() const { return min.has_value() && max.has_value(); }

    // Throws SettingsError for non-finite manual bounds.
    void validate() const;

    bool operator==(const NormalizationSettings&) const = default;
};

struct NormRange {
    double min;
    double max;

    double range() const { return max - min; }
    // 0 for degenerate ranges, which maps every value to the lower end.
    double invRange() const { return range() > 0 ? 1.0 / range() : 0.0; }

    double normalize(double value) const { return range() > 0 ? (value - min) / range() : 0.0; }

    bool operator==(const NormRange&) const = default;
};

// Resolves the display range in this order: auto-normalize (observed stats, falling back to 0..typeMax per bound), gamma mode (0..typeMax),
// manual range (scaled by typeMax for integer sources in normalized-float mode), and finally 0..typeMax.
NormRange resolveRange(const NormalizationSettings& settings, const std::optional<Stats>& stats, double typeMax, bool isFloat);

// Maps t in [0,1] onto [min,max].
double linearMap(double t, double min, double max);

// Maps t in [0,1] onto [min,max] uniformly in log10 space of the absolute bounds (clamped to 1e-10). When both bounds are negative, the
// result is negated. A range whose lower bound is negative while the upper one is not falls back to linear interpolation.
double logMap(double t, double min, double max);

} // namespace floatview
