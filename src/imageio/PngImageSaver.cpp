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

#include <floatview/imageio/PngImageSaver.h>

#include <png.h>
#include <zlib.h>

#include <fstream>
#include <vector>

using namespace std;

namespace floatview {

namespace {
int colorTypeFor(int nChannels) {
    switch (nChannels) {
        case 1: return PNG_COLOR_TYPE_GRAY;
        case 2: return PNG_COLOR_TYPE_GRAY_ALPHA;
        case 3: return PNG_COLOR_TYPE_RGB;
        case 4: return PNG_COLOR_TYPE_RGB_ALPHA;
    }

    throw ImageSaveError{fmt::format("Invalid number of channels {}.", nChannels)};
}

// Owns a libpng write struct that streams into an ostream.
class PngEncoder {
public:
    PngEncoder(ostream& oStream) : mStream{oStream} {
        mPng = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, onError, onWarning);
        if (!mPng) {
            throw ImageSaveError{"Failed to create PNG write struct."};
        }

        mInfo = png_create_info_struct(mPng);
        if (!mInfo) {
            png_destroy_write_struct(&mPng, nullptr);
            throw ImageSaveError{"Failed to create PNG info struct."};
        }

        png_set_write_fn(mPng, this, onWrite, onFlush);
    }

    ~PngEncoder() { png_destroy_write_struct(&mPng, &mInfo); }

    PngEncoder(const PngEncoder&) = delete;
    PngEncoder& operator=(const PngEncoder&) = delete;

    png_structp png() const { return mPng; }
    png_infop info() const { return mInfo; }

private:
    static void onError(png_structp, png_const_charp message) { throw ImageSaveError{fmt::format("PNG error: {}", message)}; }
    static void onWarning(png_structp, png_const_charp message) { tlog::warning() << fmt::format("PNG warning: {}", message); }

    static void onWrite(png_structp png, png_bytep data, png_size_t length) {
        ostream& stream = static_cast<PngEncoder*>(png_get_io_ptr(png))->mStream;
        stream.write(reinterpret_cast<const char*>(data), length);
        if (!stream) {
            throw ImageSaveError{"Failed to write PNG data to the output stream."};
        }
    }

    static void onFlush(png_structp png) { static_cast<PngEncoder*>(png_get_io_ptr(png))->mStream.flush(); }

    ostream& mStream;
    png_structp mPng = nullptr;
    png_infop mInfo = nullptr;
};
} // namespace

void PngImageSaver::save(ostream& oStream, span<const uint8_t> data, int width, int height, int nChannels) const {
    const int colorType = colorTypeFor(nChannels);
    if (width <= 0 || height <= 0) {
        throw ImageSaveError{fmt::format("Invalid image size {}x{}.", width, height)};
    }

    const size_t rowBytes = (size_t)width * nChannels;
    if (data.size() < rowBytes * height) {
        throw ImageSaveError{fmt::format("Not enough pixel data ({} vs {} bytes).", data.size(), rowBytes * height)};
    }

    PngEncoder encoder{oStream};

    png_set_compression_level(encoder.png(), 1);
    png_set_compression_strategy(encoder.png(), Z_RLE);
    png_set_filter(encoder.png(), PNG_FILTER_TYPE_BASE, PNG_FAST_FILTERS);

    png_set_IHDR(
        encoder.png(), encoder.info(), width, height, 8, colorType, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT
    );

    vector<png_bytep> rows(height);
    for (int y = 0; y < height; ++y) {
        rows[y] = const_cast<png_bytep>(data.data() + y * rowBytes);
    }

    png_set_rows(encoder.png(), encoder.info(), rows.data());
    png_write_png(encoder.png(), encoder.info(), PNG_TRANSFORM_IDENTITY, nullptr);
}

void PngImageSaver::save(const fs::path& path, span<const uint8_t> data, int width, int height, int nChannels) const {
    ofstream f{path, ios_base::out | ios_base::binary};
    if (!f) {
        throw ImageSaveError{fmt::format("Could not open {} for writing.", path)};
    }

    save(f, data, width, height, nChannels);
    tlog::success() << fmt::format("Wrote {}x{} render to {}", width, height, path);
}

} // namespace floatview
