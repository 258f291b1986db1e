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

#include <floatview/Statistics.h>

#include <limits>

using namespace std;

namespace floatview {

namespace {
template <typename T> optional<Stats> finiteMinMax(span<const T> samples, int numChannels) {
    const int nColorChannels = min(numChannels, 3);

    double minimum = numeric_limits<double>::infinity();
    double maximum = -numeric_limits<double>::infinity();
    bool any = false;

    for (size_t i = 0; i < samples.size(); i += numChannels) {
        for (int c = 0; c < nColorChannels; ++c) {
            const double v = samples[i + c];
            if constexpr (is_floating_point_v<T>) {
                if (!isfinite(v)) {
                    continue;
                }
            }

            minimum = std::min(minimum, v);
            maximum = std::max(maximum, v);
            any = true;
        }
    }

    if (!any) {
        return nullopt;
    }

    return Stats{minimum, maximum};
}
} // namespace

optional<Stats> computeStats(const SampleBuffer& buffer) {
    switch (buffer.pixelFormat()) {
        case EPixelFormat::U8: return finiteMinMax(buffer.data<uint8_t>(), buffer.numChannels());
        case EPixelFormat::U16: return finiteMinMax(buffer.data<uint16_t>(), buffer.numChannels());
        case EPixelFormat::F32: return finiteMinMax(buffer.data<float>(), buffer.numChannels());
    }

    return nullopt;
}

optional<Stats> compute24BitStats(const SampleBuffer& buffer, double typeMax) {
    if (buffer.numChannels() < 3) {
        throw invalid_argument{fmt::format("24-bit statistics require at least 3 channels, got {}.", buffer.numChannels())};
    }

    uint32_t minimum = numeric_limits<uint32_t>::max();
    uint32_t maximum = 0;
    bool any = false;

    for (size_t i = 0; i < buffer.numPixels(); ++i) {
        uint32_t combined;
        if (!combine24Bit(buffer, i, typeMax, combined)) {
            continue;
        }

        minimum = std::min(minimum, combined);
        maximum = std::max(maximum, combined);
        any = true;
    }

    if (!any) {
        return nullopt;
    }

    return Stats{(double)minimum, (double)maximum};
}

} // namespace floatview
