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

#include <floatview/imageio/PngImageLoader.h>

#include <png.h>

#include <bit>
#include <cstring>

using namespace std;

namespace floatview {

namespace {
// Owns a libpng read struct and its info struct. libpng reports errors through the error callback, which throws.
class PngDecoder {
public:
    PngDecoder(span<const uint8_t> bytes) : mBytes{bytes} {
        mPng = png_create_read_struct(PNG_LIBPNG_VER_STRING, this, onError, onWarning);
        if (!mPng) {
            throw ImageLoadError{"Failed to create PNG read struct."};
        }

        mInfo = png_create_info_struct(mPng);
        if (!mInfo) {
            png_destroy_read_struct(&mPng, nullptr, nullptr);
            throw ImageLoadError{"Failed to create PNG info struct."};
        }

        png_set_read_fn(mPng, this, onRead);
    }

    ~PngDecoder() { png_destroy_read_struct(&mPng, &mInfo, nullptr); }

    PngDecoder(const PngDecoder&) = delete;
    PngDecoder& operator=(const PngDecoder&) = delete;

    png_structp png() const { return mPng; }
    png_infop info() const { return mInfo; }

private:
    static void onError(png_structp, png_const_charp message) {
        throw FormatError{EFormatError::Malformed, fmt::format("PNG error: {}", message)};
    }

    static void onWarning(png_structp, png_const_charp message) { tlog::warning() << fmt::format("PNG warning: {}", message); }

    static void onRead(png_structp png, png_bytep out, png_size_t length) {
        auto* self = static_cast<PngDecoder*>(png_get_io_ptr(png));
        const size_t available = self->mBytes.size() - self->mOffset;
        if (available < length) {
            throw FormatError{EFormatError::Truncated, fmt::format("PNG data ends early ({} vs {} bytes)", available, length)};
        }

        memcpy(out, self->mBytes.data() + self->mOffset, length);
        self->mOffset += length;
    }

    span<const uint8_t> mBytes;
    size_t mOffset = 0;

    png_structp mPng = nullptr;
    png_infop mInfo = nullptr;
};

// Number of channels a color type decodes to, before tRNS expansion. 0 for unknown color types.
int channelsOf(int colorType) {
    switch (colorType) {
        case PNG_COLOR_TYPE_GRAY: return 1;
        case PNG_COLOR_TYPE_GRAY_ALPHA: return 2;
        case PNG_COLOR_TYPE_RGB:
        case PNG_COLOR_TYPE_PALETTE: return 3;
        case PNG_COLOR_TYPE_RGB_ALPHA: return 4;
        default: return 0;
    }
}
} // namespace

DecodedImage PngImageLoader::load(istream& iStream, const fs::path&) const {
    const vector<uint8_t> bytes = readAll(iStream);
    if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8)) {
        throw FormatNotSupported{"File is not a PNG image."};
    }

    PngDecoder decoder{bytes};
    png_structp png = decoder.png();
    png_infop info = decoder.info();

    png_read_info(png, info);

    const png_uint_32 width = png_get_image_width(png, info);
    const png_uint_32 height = png_get_image_height(png, info);
    const int colorType = png_get_color_type(png, info);
    const int storedBitDepth = png_get_bit_depth(png, info);

    if (width == 0 || height == 0 || width > INT32_MAX || height > INT32_MAX) {
        throw FormatError{EFormatError::Malformed, "Invalid PNG dimensions", fmt::format("{}x{}", width, height)};
    }

    int numChannels = channelsOf(colorType);
    if (numChannels == 0) {
        throw FormatError{EFormatError::Unsupported, "Unsupported PNG color type", fmt::format("{}", colorType)};
    }

    // Everything is expanded to plain gray/RGB(A) with 8 or 16 bits per sample.
    if (colorType == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    } else if (colorType == PNG_COLOR_TYPE_GRAY && storedBitDepth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }

    if (png_get_valid(png, info, PNG_INFO_tRNS)) {
        if (numChannels == 2 || numChannels == 4) {
            throw FormatError{EFormatError::Malformed, "PNG has both a tRNS chunk and an alpha channel"};
        }

        png_set_tRNS_to_alpha(png);
        ++numChannels;
    }

    if (png_get_interlace_type(png, info) != PNG_INTERLACE_NONE) {
        png_set_interlace_handling(png);
    }

    png_read_update_info(png, info);

    const int bitDepth = png_get_bit_depth(png, info);
    if (bitDepth != 8 && bitDepth != 16) {
        throw FormatError{EFormatError::Unsupported, "Unsupported PNG bit depth", fmt::format("{}", bitDepth)};
    }

    // PNG stores 16-bit samples big endian
    if (bitDepth == 16 && endian::native == endian::little) {
        png_set_swap(png);
    }

    tlog::debug() << fmt::format("PNG: {}x{} channels={} bitDepth={} colorType={}", width, height, numChannels, bitDepth, colorType);

    const bool wide = bitDepth == 16;
    DecodedImage result{
        SampleBuffer{
            (int)width,
            (int)height,
            numChannels,
            wide ? EPixelFormat::U16 : EPixelFormat::U8,
            wide ? ESampleKind::U16 : ESampleKind::U8,
            false,
            false,
        },
        wide ? 65535.0 : 255.0,
        {},
    };

    const size_t rowBytes = png_get_rowbytes(png, info);
    FLOATVIEW_ASSERT(rowBytes * height == result.buffer.numBytes(), "Unexpected PNG row size {}.", rowBytes);

    vector<png_bytep> rows(height);
    for (size_t y = 0; y < rows.size(); ++y) {
        rows[y] = result.buffer.bytes() + y * rowBytes;
    }

    png_read_image(png, rows.data());
    png_read_end(png, nullptr);

    FormatInfo& formatInfo = result.info;
    formatInfo.formatLabel = "PNG";
    formatInfo.formatType = "png";
    formatInfo.width = (int)width;
    formatInfo.height = (int)height;
    formatInfo.samplesPerPixel = numChannels;
    formatInfo.bitsPerSample = bitDepth;
    formatInfo.sampleFormat = 1;
    formatInfo.compression = "Deflate";

    return result;
}

} // namespace floatview
