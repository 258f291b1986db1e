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

#include <floatview/Common.h>

#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace floatview {

// How samples are physically stored in a SampleBuffer.
enum class EPixelFormat {
    U8,
    U16,
    F32,
};

inline size_t nBytes(EPixelFormat format) {
    switch (format) {
        case EPixelFormat::U8: return 1;
        case EPixelFormat::U16: return 2;
        case EPixelFormat::F32: return 4;
    }

    return 0;
}

// The element kind of the source file. May differ from the storage format, e.g. NumPy integers are upcast to F32 and half-float EXR
// channels are widened to F32, but the source kind still determines the full-scale value.
enum class ESampleKind {
    U8,
    U16,
    U32,
    U64,
    F16,
    F32,
    F64,
};

std::string toString(ESampleKind kind, bool isSigned = false);

// Full-scale value of an element kind: 255 for u8, 65535 for u16 and so on; 1 for floating point kinds.
double typeMaxFor(ESampleKind kind, bool isSigned);

// A flat, row-major, channel-interleaved array of samples, rows ordered top to bottom.
class SampleBuffer {
public:
    SampleBuffer(int width, int height, int numChannels, EPixelFormat format, ESampleKind kind, bool isSigned, bool isFloat);

    SampleBuffer(SampleBuffer&&) = default;
    SampleBuffer& operator=(SampleBuffer&&) = default;
    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    int width() const { return mWidth; }
    int height() const { return mHeight; }
    int numChannels() const { return mNumChannels; }

    size_t numPixels() const { return (size_t)mWidth * mHeight; }
    size_t numSamples() const { return numPixels() * mNumChannels; }

    EPixelFormat pixelFormat() const { return mPixelFormat; }
    ESampleKind sampleKind() const { return mSampleKind; }
    bool isSigned() const { return mIsSigned; }
    bool isFloat() const { return mIsFloat; }

    // Natural full-scale value derived from the element kind. Decoders may carry a different one (e.g. a PGM's maxval).
    double typeMax() const { return typeMaxFor(mSampleKind, mIsSigned); }

    template <typename T> std::span<T> data() {
        checkType<T>();
        return {reinterpret_cast<T*>(mData.data()), numSamples()};
    }

    template <typename T> std::span<const T> data() const {
        checkType<T>();
        return {reinterpret_cast<const T*>(mData.data()), numSamples()};
    }

    uint8_t* bytes() { return mData.data(); }
    const uint8_t* bytes() const { return mData.data(); }
    size_t numBytes() const { return mData.size(); }

    float at(size_t index) const {
        switch (mPixelFormat) {
            case EPixelFormat::U8: return mData[index];
            case EPixelFormat::U16: return *(const uint16_t*)(mData.data() + index * 2);
            case EPixelFormat::F32: return *(const float*)(mData.data() + index * 4);
        }

        return 0;
    }

    float at(int x, int y, int c) const { return at(((size_t)y * mWidth + x) * mNumChannels + c); }

    void setAt(size_t index, float value) {
        switch (mPixelFormat) {
            case EPixelFormat::U8: mData[index] = (uint8_t)value; break;
            case EPixelFormat::U16: *(uint16_t*)(mData.data() + index * 2) = (uint16_t)value; break;
            case EPixelFormat::F32: *(float*)(mData.data() + index * 4) = value; break;
        }
    }

    void flipVertically();

    // A F32 copy with the same shape and source kind. Used by filters that need to write NaN into integer images.
    SampleBuffer toFloat32() const;

private:
    template <typename T> void checkType() const {
        if constexpr (std::is_same_v<std::remove_const_t<T>, uint8_t>) {
            FLOATVIEW_ASSERT(mPixelFormat == EPixelFormat::U8, "Sample buffer is not in U8 format.");
        } else if constexpr (std::is_same_v<std::remove_const_t<T>, uint16_t>) {
            FLOATVIEW_ASSERT(mPixelFormat == EPixelFormat::U16, "Sample buffer is not in U16 format.");
        } else {
            static_assert(std::is_same_v<std::remove_const_t<T>, float>, "Unsupported sample type.");
            FLOATVIEW_ASSERT(mPixelFormat == EPixelFormat::F32, "Sample buffer is not in F32 format.");
        }
    }

    int mWidth;
    int mHeight;
    int mNumChannels;

    EPixelFormat mPixelFormat;
    ESampleKind mSampleKind;
    bool mIsSigned;
    bool mIsFloat;

    std::vector<uint8_t> mData;
};

// Per-file metadata reported next to the decoded samples.
struct FormatInfo {
    std::string formatLabel;
    // Key for per-format default settings, e.g. "pfm", "npy-float", "tiff-int".
    std::string formatType;

    int width = 0;
    int height = 0;
    int samplesPerPixel = 0;
    int bitsPerSample = 0;
    // 1 = unsigned integer, 2 = signed integer, 3 = IEEE float (TIFF SampleFormat convention)
    int sampleFormat = 1;

    std::string compression;
    int planarConfig = 1;

    // NumPy only
    std::string dtype;
    std::string arrayName;

    bool isFloat() const { return sampleFormat == 3; }
};

// Display raster, 4 bytes per pixel, rows top to bottom.
struct RGBA8Buffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;

    const uint8_t* pixel(int x, int y) const { return data.data() + ((size_t)y * width + x) * 4; }
};

struct DecodedImage {
    SampleBuffer buffer;
    double typeMax;
    FormatInfo info;
};

// Converts the first three channels of a pixel to bytes and packs them as (R<<16)|(G<<8)|B. Returns false if any of the three is not
// finite. Byte conversion: u8 sources as-is, u16 sources divided by 257, everything else scaled by typeMax.
bool combine24Bit(const SampleBuffer& buffer, size_t pixel, double typeMax, uint32_t& combined);

static const double MAX_24BIT = 16777215.0;

} // namespace floatview
