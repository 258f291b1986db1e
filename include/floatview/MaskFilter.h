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

#include <memory>
#include <optional>
#include <vector>

namespace floatview {

struct MaskFilter {
    std::shared_ptr<const DecodedImage> mask;
    double threshold = 0.0;
    // Filter out pixels whose mask value is above the threshold instead of below it.
    bool filterHigher = false;
    bool enabled = true;

    bool operator==(const MaskFilter&) const = default;
};

// Returns an F32 copy of the image in which every sample of a filtered pixel is NaN. A pixel is filtered when the first channel of the
// mask is above (filterHigher) or below the threshold. Throws FormatError(Unsupported) if the pixel counts differ.
SampleBuffer applyMaskFilter(const SampleBuffer& image, const SampleBuffer& mask, double threshold, bool filterHigher);

// Applies every enabled filter in sequence. Returns nullopt if none is enabled, in which case the unfiltered image should be used.
std::optional<SampleBuffer> applyMaskFilters(const SampleBuffer& image, const std::vector<MaskFilter>& filters);

} // namespace floatview
