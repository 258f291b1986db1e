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

#include <floatview/Normalization.h>
#include <floatview/ToneMapper.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <list>
#include <memory>
#include <span>
#include <vector>

namespace floatview {

// Size of the table float sources are quantized into.
static const size_t FLOAT_LUT_SIZE = 65536;

// Immutable table mapping every representable input value to its displayed byte.
class Lut {
public:
    // lut[i] = round(clamp01(applyTone(clamp01((i - range.min) * range.invRange()))) * 255) for i in [0, domainSize)
    static std::shared_ptr<const Lut> build(const ToneSettings& tone, const NormRange& range, size_t domainSize);

    // Table for float sources. Indexed by quantizeFloat().
    static std::shared_ptr<const Lut> buildFloat(const ToneSettings& tone) {
        return build(tone, {0.0, (double)(FLOAT_LUT_SIZE - 1)}, FLOAT_LUT_SIZE);
    }

    uint8_t operator[](size_t i) const { return mEntries[i]; }
    size_t size() const { return mEntries.size(); }
    std::span<const uint8_t> entries() const { return mEntries; }

private:
    Lut(std::vector<uint8_t>&& entries) : mEntries{std::move(entries)} {}

    std::vector<uint8_t> mEntries;
};

// Quantizes a float sample into a FLOAT_LUT_SIZE-entry index over the given range:
// clamp(round((v - min) * 65535 / range), 0, 65535). Degenerate ranges yield 0. The caller must handle non-finite samples.
inline size_t quantizeFloat(double value, const NormRange& range) {
    const double index = std::round(range.normalize(value) * (double)(FLOAT_LUT_SIZE - 1));
    return (size_t)std::clamp(index, 0.0, (double)(FLOAT_LUT_SIZE - 1));
}

// Small LRU cache of built tables, keyed by everything that determines their content.
class LutCache {
public:
    LutCache(size_t capacity = 8) : mCapacity{capacity} {}

    std::shared_ptr<const Lut> get(const ToneSettings& tone, const NormRange& range, size_t domainSize);

    size_t size() const { return mEntries.size(); }
    size_t numBuilds() const { return mNumBuilds; }

    void clear() { mEntries.clear(); }

private:
    struct Key {
        ToneSettings tone;
        NormRange range;
        size_t domainSize;

        bool operator==(const Key&) const = default;
    };

    struct Entry {
        Key key;
        std::shared_ptr<const Lut> lut;
    };

    size_t mCapacity;
    size_t mNumBuilds = 0;

    // Most recently used first
    std::list<Entry> mEntries;
};

} // namespace floatview
