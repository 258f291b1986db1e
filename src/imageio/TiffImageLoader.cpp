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

#include <floatview/imageio/Float16.h>
#include <floatview/imageio/TiffImageLoader.h>

#include <tiffio.h>

#include <bit>
#include <cstdarg>
#include <cstring>

using namespace std;

namespace floatview {

// Upper bound on decoded bytes per encoded byte for compressed TIFF data
static const size_t MAX_COMPRESSION_RATIO = 4096;

// Custom TIFF error and warning handlers to avoid console output
static void tiffErrorHandler(const char* module, const char* fmt, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    tlog::error() << fmt::format("TIFF error ({}): {}", module ? module : "unknown", buffer);
}

static void tiffWarningHandler(const char* module, const char* fmt, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    tlog::warning() << fmt::format("TIFF warning ({}): {}", module ? module : "unknown", buffer);
}

// Custom TIFF I/O functions for reading from memory
struct TiffData {
    TiffData(const uint8_t* data, size_t size) : data(data), offset(0), size(size) {}

    const uint8_t* data;
    toff_t offset;
    tsize_t size;
};

static tsize_t tiffReadProc(thandle_t handle, tdata_t data, tsize_t size) {
    auto tiffData = reinterpret_cast<TiffData*>(handle);
    if ((tsize_t)tiffData->offset >= tiffData->size) {
        return 0;
    }

    size = std::min(size, tiffData->size - (tsize_t)tiffData->offset);
    memcpy(data, tiffData->data + tiffData->offset, size);
    tiffData->offset += size;
    return size;
}

static tsize_t tiffWriteProc(thandle_t, tdata_t, tsize_t) {
    return 0; // Read-only
}

static toff_t tiffSeekProc(thandle_t handle, toff_t offset, int whence) {
    auto tiffData = reinterpret_cast<TiffData*>(handle);

    switch (whence) {
        case SEEK_SET: tiffData->offset = offset; break;
        case SEEK_CUR: tiffData->offset += offset; break;
        case SEEK_END: tiffData->offset = tiffData->size - offset; break;
    }

    return tiffData->offset;
}

static int tiffCloseProc(thandle_t) {
    return 0; // The caller owns the memory
}

static toff_t tiffSizeProc(thandle_t handle) {
    auto tiffData = reinterpret_cast<TiffData*>(handle);
    return tiffData->size;
}

static int tiffMapProc(thandle_t handle, tdata_t* pdata, toff_t* psize) {
    // Not actual memory mapping: the file already lives in memory.
    auto tiffData = reinterpret_cast<TiffData*>(handle);
    *pdata = (tdata_t)tiffData->data;
    *psize = tiffData->size;
    return 1;
}

static void tiffUnmapProc(thandle_t, tdata_t, toff_t) {}

static string compressionName(uint16_t compression) {
    switch (compression) {
        case COMPRESSION_NONE: return "None";
        case COMPRESSION_LZW: return "LZW";
        case COMPRESSION_JPEG: return "JPEG";
        case COMPRESSION_ADOBE_DEFLATE:
        case COMPRESSION_DEFLATE: return "Deflate";
        case COMPRESSION_PACKBITS: return "PackBits";
        default: return fmt::format("{}", compression);
    }
}

// Converts one sample of a type that has no direct storage format to float.
static float readWideSample(const uint8_t* p, uint16_t sampleFormat, uint16_t bitsPerSample) {
    if (sampleFormat == SAMPLEFORMAT_IEEEFP) {
        switch (bitsPerSample) {
            case 16: {
                uint16_t h;
                memcpy(&h, p, sizeof(h));
                return halfToFloat(h);
            }
            case 32: {
                float f;
                memcpy(&f, p, sizeof(f));
                return f;
            }
            case 64: {
                double d;
                memcpy(&d, p, sizeof(d));
                return (float)d;
            }
        }
    } else if (sampleFormat == SAMPLEFORMAT_INT) {
        switch (bitsPerSample) {
            case 8: return (float)(int8_t)p[0];
            case 16: {
                int16_t i;
                memcpy(&i, p, sizeof(i));
                return (float)i;
            }
        }
    }

    throw runtime_error{"Invalid TIFF sample type encountered."};
}

DecodedImage TiffImageLoader::load(istream& iStream, const fs::path& path) const {
    char magic[4] = {0};
    iStream.read(magic, sizeof(magic));
    if (!iStream || (magic[0] != 'I' && magic[0] != 'M') || magic[1] != magic[0]) {
        throw FormatNotSupported{"File is not a TIFF image."};
    }

    const auto fileEndianness = magic[0] == 'I' ? endian::little : endian::big;
    const uint16_t answer = fileEndianness == endian::little ? ((uint8_t)magic[3] << 8 | (uint8_t)magic[2]) :
                                                              ((uint8_t)magic[2] << 8 | (uint8_t)magic[3]);
    if (answer != 42) {
        throw FormatNotSupported{"File is not a TIFF image."};
    }

    TIFFSetErrorHandler(tiffErrorHandler);
    TIFFSetWarningHandler(tiffWarningHandler);

    iStream.clear();
    iStream.seekg(0);
    const vector<uint8_t> buffer = readAll(iStream);

    TiffData data(buffer.data(), buffer.size());
    TIFF* tif = TIFFClientOpen(
        path.string().c_str(),
        "rMc", // read-only w/ memory mapping; no strip chopping
        reinterpret_cast<thandle_t>(&data),
        tiffReadProc,
        tiffWriteProc,
        tiffSeekProc,
        tiffCloseProc,
        tiffSizeProc,
        tiffMapProc,
        tiffUnmapProc
    );

    if (!tif) {
        throw FormatError{EFormatError::Malformed, "Failed to open TIFF image."};
    }

    ScopeGuard tiffGuard{[tif] { TIFFClose(tif); }};

    uint32_t width, height;
    if (!TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width) || !TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height)) {
        throw FormatError{EFormatError::Malformed, "Failed to read dimensions."};
    }

    uint16_t bitsPerSample;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &bitsPerSample)) {
        throw FormatError{EFormatError::Malformed, "Failed to read bits per sample."};
    }

    uint16_t samplesPerPixel;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &samplesPerPixel)) {
        throw FormatError{EFormatError::Malformed, "Failed to read samples per pixel."};
    }

    uint16_t sampleFormat;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLEFORMAT, &sampleFormat)) {
        throw FormatError{EFormatError::Malformed, "Failed to read sample format."};
    }

    // Interpret untyped data as unsigned integer
    if (sampleFormat == SAMPLEFORMAT_VOID) {
        sampleFormat = SAMPLEFORMAT_UINT;
    }

    uint16_t compression;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_COMPRESSION, &compression)) {
        throw FormatError{EFormatError::Malformed, "Failed to read compression type."};
    }

    uint16_t planar;
    if (!TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &planar)) {
        throw FormatError{EFormatError::Malformed, "Failed to read planar configuration."};
    }

    uint16_t photometric = PHOTOMETRIC_MINISBLACK;
    if (!TIFFGetField(tif, TIFFTAG_PHOTOMETRIC, &photometric)) {
        tlog::debug() << "TIFF has no photometric interpretation. Assuming min-is-black.";
    }

    if (width == 0 || height == 0 || width > INT32_MAX || height > INT32_MAX) {
        throw FormatError{EFormatError::Malformed, "Invalid TIFF dimensions", fmt::format("{}x{}", width, height)};
    }

    if (samplesPerPixel < 1 || samplesPerPixel > 4) {
        throw FormatError{EFormatError::Unsupported, "Unsupported number of TIFF samples per pixel", fmt::format("{}", samplesPerPixel)};
    }

    if (photometric == PHOTOMETRIC_PALETTE) {
        throw FormatError{EFormatError::Unsupported, "Palette TIFF images are not supported"};
    }

    // Pick the output type: float data becomes F32, unsigned integers keep their 8/16-bit storage, signed integers are widened to F32.
    EPixelFormat pixelFormat;
    ESampleKind sampleKind;
    bool isSigned = false;
    if (sampleFormat == SAMPLEFORMAT_IEEEFP) {
        pixelFormat = EPixelFormat::F32;
        switch (bitsPerSample) {
            case 16: sampleKind = ESampleKind::F16; break;
            case 32: sampleKind = ESampleKind::F32; break;
            case 64: sampleKind = ESampleKind::F64; break;
            default: throw FormatError{EFormatError::Unsupported, "Unsupported TIFF float bit depth", fmt::format("{}", bitsPerSample)};
        }
    } else if (sampleFormat == SAMPLEFORMAT_UINT || sampleFormat == SAMPLEFORMAT_INT) {
        isSigned = sampleFormat == SAMPLEFORMAT_INT;
        switch (bitsPerSample) {
            case 8:
                sampleKind = ESampleKind::U8;
                pixelFormat = isSigned ? EPixelFormat::F32 : EPixelFormat::U8;
                break;
            case 16:
                sampleKind = ESampleKind::U16;
                pixelFormat = isSigned ? EPixelFormat::F32 : EPixelFormat::U16;
                break;
            default: throw FormatError{EFormatError::Unsupported, "Unsupported TIFF integer bit depth", fmt::format("{}", bitsPerSample)};
        }
    } else {
        throw FormatError{EFormatError::Unsupported, "Unsupported TIFF sample format", fmt::format("{}", sampleFormat)};
    }

    const bool isFloat = sampleFormat == SAMPLEFORMAT_IEEEFP;

    tlog::debug() << fmt::format(
        "TIFF info: size={}x{}, bps={}, spp={}, photometric={}, planar={}, sampleFormat={}, compression={}",
        width,
        height,
        bitsPerSample,
        samplesPerPixel,
        photometric,
        planar,
        sampleFormat,
        compressionName(compression)
    );

    // TIFF images are either broken into strips or tiles. Strips are just tiles with the same width as the image, which lets both share
    // the copy loop below.
    const bool isTiled = TIFFIsTiled(tif);

    struct TileInfo {
        size_t size, rowSize, count, numX, numY;
        uint32_t width, height;
    } tile;
    auto readTile = isTiled ? TIFFReadEncodedTile : TIFFReadEncodedStrip;

    const size_t numPlanes = planar == PLANARCONFIG_CONTIG ? 1 : samplesPerPixel;
    const size_t samplesPerPlanePixel = samplesPerPixel / numPlanes;
    const size_t bytesPerSample = bitsPerSample / 8;

    if (isTiled) {
        tile.size = TIFFTileSize64(tif);
        tile.rowSize = TIFFTileRowSize64(tif);
        tile.count = TIFFNumberOfTiles(tif);

        if (!TIFFGetField(tif, TIFFTAG_TILEWIDTH, &tile.width) || !TIFFGetField(tif, TIFFTAG_TILELENGTH, &tile.height)) {
            throw FormatError{EFormatError::Malformed, "Failed to read tile dimensions."};
        }

        tile.numX = (width + tile.width - 1) / tile.width;
        tile.numY = (height + tile.height - 1) / tile.height;
    } else {
        tile.size = TIFFStripSize64(tif);
        tile.rowSize = TIFFScanlineSize64(tif);
        tile.count = TIFFNumberOfStrips(tif);

        if (tile.rowSize == 0) {
            throw FormatError{EFormatError::Malformed, "TIFF scanline size is zero."};
        }

        tile.width = width;
        tile.height = (uint32_t)(tile.size / tile.rowSize);

        tile.numX = 1;
        tile.numY = (height + tile.height - 1) / tile.height;
    }

    if (tile.count != tile.numX * tile.numY * numPlanes) {
        throw FormatError{
            EFormatError::Malformed,
            fmt::format("Number of tiles/strips does not match expected dimensions. Expected {}, got {}.", tile.numX * tile.numY * numPlanes, tile.count),
        };
    }

    tlog::debug() << fmt::format(
        "tile: size={}, count={}, width={}, height={}, numX={}, numY={}", tile.size, tile.count, tile.width, tile.height, tile.numX, tile.numY
    );

    // Uncompressed rasters must be covered by the file itself. Compressed ones are bounded by the largest expansion the codecs reach in
    // practice.
    const size_t maxRasterBytes = compression == COMPRESSION_NONE ? buffer.size() : buffer.size() * MAX_COMPRESSION_RATIO;
    requirePayload({(size_t)width, (size_t)height, samplesPerPixel, bytesPerSample}, maxRasterBytes, "TIFF");
    requirePayload({tile.size}, maxRasterBytes, "TIFF tile");

    // Gather every plane into a full-size raster first; planar-separate images have one raster per sample.
    const size_t planePixelBytes = samplesPerPlanePixel * bytesPerSample;
    vector<vector<uint8_t>> planes(numPlanes, vector<uint8_t>((size_t)width * height * planePixelBytes));
    vector<uint8_t> tileData(tile.size);

    const size_t numTilesPerPlane = tile.count / numPlanes;
    for (size_t i = 0; i < tile.count; ++i) {
        if (readTile(tif, (uint32_t)i, tileData.data(), tile.size) < 0) {
            throw FormatError{EFormatError::Truncated, fmt::format("Failed to read tile {}", i)};
        }

        const size_t plane = i / numTilesPerPlane;
        const size_t planeTile = i % numTilesPerPlane;
        const size_t xStart = (planeTile % tile.numX) * tile.width;
        const size_t yStart = (planeTile / tile.numX) * tile.height;
        const size_t xEnd = std::min<size_t>(xStart + tile.width, width);
        const size_t yEnd = std::min<size_t>(yStart + tile.height, height);

        for (size_t y = yStart; y < yEnd; ++y) {
            memcpy(
                planes[plane].data() + (y * width + xStart) * planePixelBytes,
                tileData.data() + tile.rowSize * (y - yStart),
                (xEnd - xStart) * planePixelBytes
            );
        }
    }

    DecodedImage result{
        SampleBuffer{(int)width, (int)height, samplesPerPixel, pixelFormat, sampleKind, isSigned, isFloat},
        isFloat ? 1.0 : typeMaxFor(sampleKind, isSigned),
        {},
    };

    SampleBuffer& out = result.buffer;
    const size_t numPixels = out.numPixels();
    auto sampleAt = [&](size_t pixel, size_t c) -> const uint8_t* {
        return numPlanes == 1 ? planes[0].data() + (pixel * samplesPerPixel + c) * bytesPerSample :
                                planes[c].data() + pixel * bytesPerSample;
    };

    if (pixelFormat != EPixelFormat::F32 && numPlanes == 1) {
        memcpy(out.bytes(), planes[0].data(), out.numBytes());
    } else {
        for (size_t i = 0; i < numPixels; ++i) {
            for (size_t c = 0; c < samplesPerPixel; ++c) {
                const uint8_t* p = sampleAt(i, c);
                float value;
                if (pixelFormat == EPixelFormat::U8) {
                    value = p[0];
                } else if (pixelFormat == EPixelFormat::U16) {
                    uint16_t v;
                    memcpy(&v, p, sizeof(v));
                    value = v;
                } else {
                    value = readWideSample(p, sampleFormat, bitsPerSample);
                }

                out.setAt(i * samplesPerPixel + c, value);
            }
        }
    }

    FormatInfo& info = result.info;
    info.formatLabel = "TIFF";
    info.formatType = isFloat ? "tiff-float" : "tiff-int";
    info.width = (int)width;
    info.height = (int)height;
    info.samplesPerPixel = samplesPerPixel;
    info.bitsPerSample = bitsPerSample;
    info.sampleFormat = sampleFormat;
    info.compression = compressionName(compression);
    info.planarConfig = planar;

    return result;
}

} // namespace floatview
