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

#include <floatview/imageio/PnmImageLoader.h>

#include <charconv>

using namespace std;

namespace floatview {

namespace {

bool isPnmWhitespace(uint8_t c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

class PnmTokenizer {
public:
    PnmTokenizer(span<const uint8_t> bytes) : mBytes{bytes} {}

    // Returns the next whitespace-delimited token, or an empty string at the end of the data. '#' starts a comment that runs to the end of
    // the line.
    string_view next() {
        skipWhitespaceAndComments();

        const size_t begin = mOffset;
        while (mOffset < mBytes.size() && !isPnmWhitespace(mBytes[mOffset]) && mBytes[mOffset] != '#') {
            ++mOffset;
        }

        return {reinterpret_cast<const char*>(mBytes.data()) + begin, mOffset - begin};
    }

    // Returns the next single non-whitespace character, or 0 at the end of the data. Plain PBM rasters may omit whitespace between bits.
    char nextChar() {
        skipWhitespaceAndComments();
        return mOffset < mBytes.size() ? (char)mBytes[mOffset++] : 0;
    }

    // The raster of binary variants begins after exactly one whitespace byte.
    void skipSingleWhitespace() {
        if (mOffset < mBytes.size() && isPnmWhitespace(mBytes[mOffset])) {
            ++mOffset;
        }
    }

    size_t offset() const { return mOffset; }
    size_t remaining() const { return mBytes.size() - mOffset; }

private:
    void skipWhitespaceAndComments() {
        while (mOffset < mBytes.size()) {
            if (mBytes[mOffset] == '#') {
                while (mOffset < mBytes.size() && mBytes[mOffset] != '\n') {
                    ++mOffset;
                }
            } else if (isPnmWhitespace(mBytes[mOffset])) {
                ++mOffset;
            } else {
                break;
            }
        }
    }

    span<const uint8_t> mBytes;
    size_t mOffset = 0;
};

int parseInt(string_view token, string_view what) {
    if (token.empty()) {
        throw FormatError{EFormatError::Truncated, fmt::format("PNM data ends before {}", what)};
    }

    int value = 0;
    const auto [ptr, ec] = from_chars(token.data(), token.data() + token.size(), value);
    if (ec != errc{} || ptr != token.data() + token.size()) {
        throw FormatError{EFormatError::Malformed, fmt::format("Invalid PNM {}", what), token};
    }

    return value;
}

string formatLabelFor(char type) {
    switch (type) {
        case '1': return "PBM (ASCII)";
        case '2': return "PGM (ASCII)";
        case '3': return "PPM (ASCII)";
        case '4': return "PBM (Binary)";
        case '5': return "PGM (Binary)";
        case '6': return "PPM (Binary)";
    }

    return "PNM";
}

} // namespace

DecodedImage PnmImageLoader::load(istream& iStream, const fs::path&) const {
    char magic[2] = {};
    iStream.read(magic, sizeof(magic));
    if (!iStream || magic[0] != 'P' || magic[1] < '1' || magic[1] > '6') {
        throw FormatNotSupported{"Invalid PNM magic string."};
    }

    iStream.clear();
    iStream.seekg(0);

    const vector<uint8_t> bytes = readAll(iStream);
    PnmTokenizer tokenizer{bytes};

    const string_view magicToken = tokenizer.next();
    if (magicToken.size() != 2) {
        throw FormatNotSupported{"Invalid PNM magic string", magicToken};
    }

    const char type = magicToken[1];
    const bool isPbm = type == '1' || type == '4';
    const bool isAscii = type >= '1' && type <= '3';
    const int numChannels = type == '3' || type == '6' ? 3 : 1;

    const string_view widthToken = tokenizer.next();
    const int width = parseInt(widthToken, "width");
    const string_view heightToken = tokenizer.next();
    const int height = parseInt(heightToken, "height");
    if (width <= 0 || height <= 0) {
        throw FormatError{EFormatError::Malformed, "Invalid PNM dimensions", fmt::format("{} {}", widthToken, heightToken)};
    }

    int maxval = 1;
    if (!isPbm) {
        const string_view maxvalToken = tokenizer.next();
        maxval = parseInt(maxvalToken, "maxval");
        if (maxval <= 0 || maxval > 65535) {
            throw FormatError{EFormatError::Malformed, "Invalid PNM maxval", maxvalToken};
        }
    }

    const bool use16Bit = !isPbm && maxval > 255;
    const size_t numPixels = (size_t)width * height;
    const size_t numSamples = numPixels * numChannels;

    tlog::debug() << fmt::format("PNM header: type=P{} size={}x{} maxval={} use16Bit={}", type, width, height, maxval, use16Bit);

    // Binary rasters follow a single whitespace character. ASCII samples take at least one byte each.
    if (!isAscii) {
        tokenizer.skipSingleWhitespace();
    }

    const size_t bytesPerSample = use16Bit && !isAscii ? 2 : 1;
    const size_t bytesPerRow = isPbm && !isAscii ? ((size_t)width + 7) / 8 : (size_t)width * numChannels * bytesPerSample;
    requirePayload({bytesPerRow, (size_t)height}, tokenizer.remaining(), formatLabelFor(type));

    DecodedImage result{
        SampleBuffer{
            width,
            height,
            numChannels,
            use16Bit ? EPixelFormat::U16 : EPixelFormat::U8,
            use16Bit ? ESampleKind::U16 : ESampleKind::U8,
            false,
            false,
        },
        // Bitmaps decode to 0 and 255, so that is their full-scale value rather than the implicit maxval of 1.
        isPbm ? 255.0 : (double)maxval,
        {},
    };

    SampleBuffer& buffer = result.buffer;

    if (isPbm && isAscii) {
        auto dst = buffer.data<uint8_t>();
        for (size_t i = 0; i < numSamples; ++i) {
            const char bit = tokenizer.nextChar();
            if (bit == 0) {
                throw FormatError{EFormatError::Truncated, fmt::format("PBM data ends after {} of {} pixels", i, numSamples)};
            } else if (bit != '0' && bit != '1') {
                throw FormatError{EFormatError::Malformed, "Invalid PBM pixel value", string(1, bit)};
            }

            // 1 is black, 0 is white
            dst[i] = bit == '1' ? 0 : 255;
        }
    } else if (isPbm) {
        const uint8_t* src = bytes.data() + tokenizer.offset();
        auto dst = buffer.data<uint8_t>();
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                const uint8_t packed = src[(size_t)y * bytesPerRow + x / 8];
                const int bit = (packed >> (7 - x % 8)) & 1;
                dst[(size_t)y * width + x] = bit ? 0 : 255;
            }
        }
    } else if (isAscii) {
        for (size_t i = 0; i < numSamples; ++i) {
            const string_view token = tokenizer.next();
            const int value = parseInt(token, "pixel value");
            if (value < 0 || value > maxval) {
                throw FormatError{EFormatError::Malformed, fmt::format("PNM pixel value out of range [0,{}]", maxval), token};
            }

            buffer.setAt(i, (float)value);
        }
    } else {
        const uint8_t* src = bytes.data() + tokenizer.offset();
        if (use16Bit) {
            // 16-bit samples are big endian
            auto dst = buffer.data<uint16_t>();
            for (size_t i = 0; i < numSamples; ++i) {
                dst[i] = (uint16_t)((src[i * 2] << 8) | src[i * 2 + 1]);
            }
        } else {
            auto dst = buffer.data<uint8_t>();
            copy(src, src + numSamples, dst.begin());
        }
    }

    FormatInfo& info = result.info;
    info.formatLabel = formatLabelFor(type);
    info.formatType = isPbm ? "pbm" : numChannels == 3 ? "ppm" : "pgm";
    info.width = width;
    info.height = height;
    info.samplesPerPixel = numChannels;
    info.bitsPerSample = isPbm ? 1 : use16Bit ? 16 : 8;
    info.sampleFormat = 1;

    return result;
}

} // namespace floatview
