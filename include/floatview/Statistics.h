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

#include <optional>

namespace floatview {

struct Stats {
    double min;
    double max;

    bool operator==(const Stats&) const = default;
};

// Min/max over the finite samples of the first three channels (alpha is never part of the display range). Returns nullopt when no finite
// sample exists.
std::optional<Stats> computeStats(const SampleBuffer& buffer);

// Min/max over the packed (R<<16)|(G<<8)|B values of every pixel whose first three channels are finite. Requires at least 3 channels.
std::optional<Stats> compute24BitStats(const SampleBuffer& buffer, double typeMax);

} // namespace floatview
