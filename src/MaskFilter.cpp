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

#include <floatview/MaskFilter.h>

#include <limits>

using namespace std;

namespace floatview {

namespace {
void filterInPlace(SampleBuffer& target, const SampleBuffer& mask, double threshold, bool filterHigher) {
    if (target.numPixels() != mask.numPixels()) {
        throw FormatError{
            EFormatError::Unsupported,
            fmt::format(
                "Mask size {}x{} does not match image size {}x{}", mask.width(), mask.height(), target.width(), target.height()
            ),
        };
    }

    const int nChannels = target.numChannels();
    const int nMaskChannels = mask.numChannels();
    auto data = target.data<float>();

    size_t numFiltered = 0;
    for (size_t i = 0; i < target.numPixels(); ++i) {
        const double m = mask.at(i * nMaskChannels);
        if (filterHigher ? m > threshold : m < threshold) {
            for (int c = 0; c < nChannels; ++c) {
                data[i * nChannels + c] = numeric_limits<float>::quiet_NaN();
            }

            ++numFiltered;
        }
    }

    tlog::debug() << fmt::format(
        "Mask filter (threshold={}, {}) removed {} of {} pixels", threshold, filterHigher ? "higher" : "lower", numFiltered, target.numPixels()
    );
}
} // namespace

SampleBuffer applyMaskFilter(const SampleBuffer& image, const SampleBuffer& mask, double threshold, bool filterHigher) {
    SampleBuffer result = image.toFloat32();
    filterInPlace(result, mask, threshold, filterHigher);
    return result;
}

optional<SampleBuffer> applyMaskFilters(const SampleBuffer& image, const vector<MaskFilter>& filters) {
    optional<SampleBuffer> result;
    for (const auto& filter : filters) {
        if (!filter.enabled || !filter.mask) {
            continue;
        }

        if (!result) {
            result = image.toFloat32();
        }

        filterInPlace(*result, filter.mask->buffer, filter.threshold, filter.filterHigher);
    }

    return result;
}

} // namespace floatview
