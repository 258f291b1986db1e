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

#include <floatview/SampleBuffer.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace std;

namespace floatview {

string toString(ESampleKind kind, bool isSigned) {
    switch (kind) {
        case ESampleKind::U8: return isSigned ? "I8" : "U8";
        case ESampleKind::U16: return isSigned ? "I16" : "U16";
        case ESampleKind::U32: return isSigned ? "I32" : "U32";
        case ESampleKind::U64: return isSigned ? "I64" : "U64";
        case ESampleKind::F16: return "F16";
        case ESampleKind::F32: return "F32";
        case ESampleKind::F64: return "F64";
    }

    throw runtime_error{"Unknown sample kind."};
}

double typeMaxFor(ESampleKind kind, bool isSigned) {
    switch (kind) {
        case ESampleKind::U8: return isSigned ? 127.0 : 255.0;
        case ESampleKind::U16: return isSigned ? 32767.0 : 65535.0;
        case ESampleKind::U32: return isSigned ? 2147483647.0 : 4294967295.0;
        case ESampleKind::U64: return isSigned ? (double)numeric_limits<int64_t>::max() : (double)numeric_limits<uint64_t>::max();
        case ESampleKind::F16:
        case ESampleKind::F32:
        case ESampleKind::F64: return 1.0;
    }

    return 1.0;
}

SampleBuffer::SampleBuffer(int width, int height, int numChannels, EPixelFormat format, ESampleKind kind, bool isSigned, bool isFloat) :
    mWidth{width},
    mHeight{height},
    mNumChannels{numChannels},
    mPixelFormat{format},
    mSampleKind{kind},
    mIsSigned{isSigned},
    mIsFloat{isFloat} {
    FLOATVIEW_ASSERT(width >= 0 && height >= 0, "Invalid sample buffer size {}x{}.", width, height);
    FLOATVIEW_ASSERT(numChannels >= 1 && numChannels <= 4, "Invalid number of channels {}.", numChannels);
    FLOATVIEW_ASSERT(
        format == EPixelFormat::F32 || !isSigned, "Signed samples must be stored as F32, got {}.", toString(kind, isSigned)
    );

    FLOATVIEW_ASSERT(
        numSamples() <= numeric_limits<size_t>::max() / nBytes(format), "Sample buffer size {}x{}x{} is not addressable.", width, height, numChannels
    );

    mData.resize(numSamples() * nBytes(format));
}

void SampleBuffer::flipVertically() {
    const size_t rowBytes = (size_t)mWidth * mNumChannels * nBytes(mPixelFormat);
    vector<uint8_t> tmp(rowBytes);
    for (int y = 0; y < mHeight / 2; ++y) {
        uint8_t* top = mData.data() + (size_t)y * rowBytes;
        uint8_t* bottom = mData.data() + (size_t)(mHeight - 1 - y) * rowBytes;
        memcpy(tmp.data(), top, rowBytes);
        memcpy(top, bottom, rowBytes);
        memcpy(bottom, tmp.data(), rowBytes);
    }
}

SampleBuffer SampleBuffer::toFloat32() const {
    SampleBuffer result{mWidth, mHeight, mNumChannels, EPixelFormat::F32, mSampleKind, mIsSigned, mIsFloat};
    auto dst = result.data<float>();
    for (size_t i = 0; i < dst.size(); ++i) {
        dst[i] = at(i);
    }

    return result;
}

bool combine24Bit(const SampleBuffer& buffer, size_t pixel, double typeMax, uint32_t& combined) {
    FLOATVIEW_ASSERT(buffer.numChannels() >= 3, "24-bit combination requires at least 3 channels, got {}.", buffer.numChannels());

    const size_t base = pixel * buffer.numChannels();
    uint32_t bytes[3];
    for (int c = 0; c < 3; ++c) {
        const double v = buffer.at(base + c);
        if (!isfinite(v)) {
            return false;
        }

        switch (buffer.sampleKind()) {
            case ESampleKind::U8: bytes[c] = (uint32_t)std::clamp(std::round(v), 0.0, 255.0); break;
            case ESampleKind::U16: bytes[c] = (uint32_t)std::clamp(std::round(v / 257.0), 0.0, 255.0); break;
            default: bytes[c] = (uint32_t)std::round(clamp01(typeMax > 0 ? v / typeMax : 0.0) * 255.0); break;
        }
    }

    combined = (bytes[0] << 16) | (bytes[1] << 8) | bytes[2];
    return true;
}

} // namespace floatview
