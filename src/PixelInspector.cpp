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

#include <floatview/PixelInspector.h>

using namespace std;

namespace floatview {

namespace {
string formatSample(double value, bool isFloat, bool padded) {
    if (isFloat) {
        return toPrecision(value, 4);
    }

    return padded ? fmt::format("{:03}", (int64_t)value) : fmt::format("{}", (int64_t)value);
}

string formatAlpha(double alpha, double typeMax) { return fmt::format("α:{:.2f}", alpha / typeMax); }
} // namespace

string formatPixelValue(const DecodedImage& image, int x, int y, const ViewSettings& settings) {
    const SampleBuffer& buffer = image.buffer;
    if (x < 0 || y < 0 || x >= buffer.width() || y >= buffer.height()) {
        return "";
    }

    const int nChannels = buffer.numChannels();
    const bool isFloat = buffer.isFloat();
    const size_t base = ((size_t)y * buffer.width() + x) * nChannels;

    auto sample = [&](int c) { return (double)buffer.at(base + c); };

    if (nChannels == 1) {
        if (settings.normalization.normalizedFloatMode && !isFloat) {
            return toPrecision(sample(0) / image.typeMax, 4);
        }

        return formatSample(sample(0), isFloat, false);
    }

    if (nChannels == 2) {
        return fmt::format("{} {}", formatSample(sample(0), isFloat, false), formatAlpha(sample(1), image.typeMax));
    }

    if (settings.rgbAs24BitGrayscale) {
        uint32_t combined;
        string result = combine24Bit(buffer, (size_t)y * buffer.width() + x, image.typeMax, combined) ?
            fmt::format("{:.3f}", combined / settings.scale24BitFactor) :
            "NaN";

        if (nChannels == 4) {
            result += " " + formatAlpha(sample(3), image.typeMax);
        }

        return result;
    }

    if (isFloat) {
        vector<string> values;
        for (int c = 0; c < nChannels; ++c) {
            values.emplace_back(toPrecision(sample(c), 4));
        }

        return join(values, " ");
    }

    // 8-bit values are zero-padded to a fixed width, wider ones printed as-is.
    const bool padded = buffer.sampleKind() == ESampleKind::U8 && !buffer.isSigned();
    vector<string> values;
    for (int c = 0; c < 3; ++c) {
        values.emplace_back(formatSample(sample(c), false, padded));
    }

    string result = join(values, " ");
    if (nChannels == 4) {
        result += " " + formatAlpha(sample(3), image.typeMax);
    }

    return result;
}

} // namespace floatview
