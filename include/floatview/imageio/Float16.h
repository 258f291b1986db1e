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

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>

namespace floatview {

// IEEE-754 binary16 -> binary32. Subnormals, signed zeros, infinities and NaN are preserved.
inline float halfToFloat(uint16_t h) {
    const uint32_t sign = (h >> 15) & 0x1;
    const uint32_t exponent = (h >> 10) & 0x1f;
    const uint32_t fraction = h & 0x3ff;

    float magnitude;
    if (exponent == 0) {
        // Zero or subnormal: fraction * 2^-24
        magnitude = std::ldexp((float)fraction, -24);
    } else if (exponent == 0x1f) {
        magnitude = fraction == 0 ? std::numeric_limits<float>::infinity() : std::numeric_limits<float>::quiet_NaN();
    } else {
        magnitude = std::ldexp((float)(fraction | 0x400), (int)exponent - 25);
    }

    return sign ? -magnitude : magnitude;
}

} // namespace floatview
