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

#include <floatview/imageio/PfmImageLoader.h>

#include <bit>
#include <cstring>

using namespace std;

namespace floatview {

DecodedImage PfmImageLoader::load(istream& iStream, const fs::path&) const {
    char pf[2];
    iStream.read(pf, 2);
    if (!iStream || pf[0] != 'P' || (pf[1] != 'F' && pf[1] != 'f')) {
        throw FormatNotSupported{"Invalid PFM magic string."};
    }

    iStream.clear();
    iStream.seekg(0);

    string magic;
    iStream >> magic;

    int numChannels;
    if (magic == "Pf") {
        numChannels = 1;
    } else if (magic == "PF") {
        numChannels = 3;
    } else {
        throw FormatNotSupported{"Invalid PFM magic string", magic};
    }

    string widthToken, heightToken, scaleToken;
    iStream >> widthToken >> heightToken >> scaleToken;
    if (!iStream) {
        throw FormatError{EFormatError::Truncated, "PFM header ends early"};
    }

    int width = 0, height = 0;
    float scale = 0;
    try {
        width = stoi(widthToken);
        height = stoi(heightToken);
        scale = stof(scaleToken);
    } catch (const logic_error&) {
        throw FormatError{EFormatError::Malformed, "Invalid PFM header", fmt::format("{} {} {}", widthToken, heightToken, scaleToken)};
    }

    if (width <= 0 || height <= 0) {
        throw FormatError{EFormatError::Malformed, "Invalid PFM dimensions", fmt::format("{} {}", widthToken, heightToken)};
    }

    if (!isfinite(scale) || scale == 0) {
        throw FormatError{EFormatError::Malformed, "Invalid PFM scale", scaleToken};
    }

    // The sign of the scale selects the byte order. Its magnitude is not applied: scientific PFMs store raw values.
    const bool isPfmLittleEndian = scale < 0;

    // Skip last newline at the end of the header.
    {
        char c;
        if (iStream.get(c) && c == '\r' && iStream.peek() == '\n') {
            iStream.get(c);
        }
    }

    const vector<uint8_t> data = readAll(iStream);
    requirePayload({(size_t)width, (size_t)height, (size_t)numChannels, sizeof(float)}, data.size(), "PFM");

    tlog::debug() << fmt::format(
        "PFM header: size={}x{} numChannels={} endianness={}", width, height, numChannels, isPfmLittleEndian ? "little" : "big"
    );

    // Reverse bytes of every float if endianness does not match up with system
    const bool shallSwapBytes = (std::endian::native == std::endian::little) != isPfmLittleEndian;

    DecodedImage result{
        SampleBuffer{width, height, numChannels, EPixelFormat::F32, ESampleKind::F32, false, true},
        1.0,
        {},
    };

    auto dst = result.buffer.data<float>();
    const size_t rowSamples = (size_t)width * numChannels;
    for (int y = 0; y < height; ++y) {
        // Flip image vertically due to PFM format
        const uint8_t* srcRow = data.data() + (size_t)(height - 1 - y) * rowSamples * sizeof(float);
        float* dstRow = dst.data() + (size_t)y * rowSamples;
        memcpy(dstRow, srcRow, rowSamples * sizeof(float));
        if (shallSwapBytes) {
            for (size_t i = 0; i < rowSamples; ++i) {
                dstRow[i] = swapBytes(dstRow[i]);
            }
        }
    }

    FormatInfo& info = result.info;
    info.formatLabel = "PFM";
    info.formatType = "pfm";
    info.width = width;
    info.height = height;
    info.samplesPerPixel = numChannels;
    info.bitsPerSample = 32;
    info.sampleFormat = 3;

    return result;
}

} // namespace floatview
