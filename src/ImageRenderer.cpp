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

#include <floatview/ImageRenderer.h>

#include <cstring>

using namespace std;

namespace floatview {

namespace {
uint8_t toByte(double displayed) {
    if (std::isnan(displayed)) {
        return 0;
    }

    return (uint8_t)round(clamp01(displayed) * 255.0);
}

uint8_t alphaToByte(float alpha, double typeMax) {
    if (!isfinite(alpha)) {
        return 255;
    }

    return (uint8_t)round(clamp01(alpha / typeMax) * 255.0);
}

RGBA8Buffer allocateRaster(const SampleBuffer& buffer) {
    RGBA8Buffer result;
    result.width = buffer.width();
    result.height = buffer.height();
    result.data.resize(buffer.numPixels() * 4);
    return result;
}

// Shared per-pixel layout logic of the direct and LUT paths. `isFinite` and `mapColor` receive the flat sample index.
template <typename IsFinite, typename MapColor>
void fillRaster(RGBA8Buffer& raster, const SampleBuffer& buffer, double typeMax, ENanColor nanColor, IsFinite isFinite, MapColor mapColor) {
    const int nChannels = buffer.numChannels();
    const int nColorChannels = min(nChannels, 3);
    const bool hasAlpha = nChannels == 2 || nChannels == 4;
    const auto nan = nanColorRgb(nanColor);

    for (size_t i = 0; i < buffer.numPixels(); ++i) {
        const size_t base = i * nChannels;
        uint8_t* out = raster.data.data() + i * 4;

        bool finite = true;
        for (int c = 0; c < nColorChannels; ++c) {
            finite = finite && isFinite(base + c);
        }

        if (!finite) {
            out[0] = nan[0];
            out[1] = nan[1];
            out[2] = nan[2];
        } else if (nChannels < 3) {
            out[0] = out[1] = out[2] = mapColor(base);
        } else {
            out[0] = mapColor(base);
            out[1] = mapColor(base + 1);
            out[2] = mapColor(base + 2);
        }

        out[3] = hasAlpha ? alphaToByte(buffer.at(base + nChannels - 1), typeMax) : 255;
    }
}
} // namespace

string_view toString(ERenderPath path) {
    switch (path) {
        case ERenderPath::Direct: return "direct";
        case ERenderPath::Lut: return "LUT";
        case ERenderPath::Packed24Bit: return "24-bit";
    }

    return "unknown";
}

ERenderPath chooseRenderPath(const NormalizationSettings& normalization, const ToneSettings& tone, bool rgbAs24BitGrayscale, int numChannels) {
    if (rgbAs24BitGrayscale && numChannels >= 3) {
        return ERenderPath::Packed24Bit;
    }

    if (!normalization.gammaMode || tone.isIdentity()) {
        return ERenderPath::Direct;
    }

    return ERenderPath::Lut;
}

double resolveTypeMax(const SampleBuffer& buffer, const optional<double>& typeMax) {
    if (typeMax) {
        return *typeMax;
    }

    return buffer.isFloat() ? 1.0 : buffer.typeMax();
}

ImageRenderer::ImageRenderer(shared_ptr<LutCache> lutCache) : mLutCache{lutCache ? std::move(lutCache) : make_shared<LutCache>()} {}

RGBA8Buffer ImageRenderer::render(
    const SampleBuffer& buffer,
    const optional<Stats>& stats,
    const NormalizationSettings& normalization,
    const ToneSettings& tone,
    const RenderOptions& options
) const {
    const double typeMax = resolveTypeMax(buffer, options.typeMax);

    const ERenderPath path = chooseRenderPath(normalization, tone, options.rgbAs24BitGrayscale, buffer.numChannels());
    if (options.rgbAs24BitGrayscale && path != ERenderPath::Packed24Bit) {
        tlog::debug() << fmt::format("Ignoring 24-bit mode for {}-channel image", buffer.numChannels());
    }

    const NormRange range = path == ERenderPath::Packed24Bit ? resolveRange(normalization, stats, MAX_24BIT, false) :
                                                                resolveRange(normalization, stats, typeMax, buffer.isFloat());

    tlog::debug() << fmt::format(
        "Rendering {}x{}x{} via {} path, range [{}, {}]", buffer.width(), buffer.height(), buffer.numChannels(), toString(path), range.min, range.max
    );

    RGBA8Buffer result;
    switch (path) {
        case ERenderPath::Direct: result = renderDirect(buffer, range, typeMax, options.nanColor); break;
        case ERenderPath::Lut: result = renderWithLut(buffer, range, tone, typeMax, options.nanColor); break;
        case ERenderPath::Packed24Bit: {
            const bool useTone = normalization.gammaMode && !tone.isIdentity();
            result = render24Bit(buffer, range, useTone ? &tone : nullptr, typeMax, options.nanColor);
        } break;
    }

    if (options.flipY) {
        flipVertically(result);
    }

    return result;
}

RGBA8Buffer ImageRenderer::renderDirect(const SampleBuffer& buffer, const NormRange& range, double typeMax, ENanColor nanColor) const {
    RGBA8Buffer result = allocateRaster(buffer);
    const double min = range.min;
    const double invRange = range.invRange();

    switch (buffer.pixelFormat()) {
        case EPixelFormat::U8: {
            auto data = buffer.data<uint8_t>();
            fillRaster(
                result, buffer, typeMax, nanColor, [](size_t) { return true; }, [&](size_t i) { return toByte((data[i] - min) * invRange); }
            );
        } break;
        case EPixelFormat::U16: {
            auto data = buffer.data<uint16_t>();
            fillRaster(
                result, buffer, typeMax, nanColor, [](size_t) { return true; }, [&](size_t i) { return toByte((data[i] - min) * invRange); }
            );
        } break;
        case EPixelFormat::F32: {
            auto data = buffer.data<float>();
            fillRaster(
                result,
                buffer,
                typeMax,
                nanColor,
                [&](size_t i) { return isfinite(data[i]); },
                [&](size_t i) { return toByte((data[i] - min) * invRange); }
            );
        } break;
    }

    return result;
}

RGBA8Buffer ImageRenderer::renderWithLut(
    const SampleBuffer& buffer, const NormRange& range, const ToneSettings& tone, double typeMax, ENanColor nanColor
) const {
    RGBA8Buffer result = allocateRaster(buffer);

    switch (buffer.pixelFormat()) {
        case EPixelFormat::U8: {
            auto lut = mLutCache->get(tone, range, 256);
            auto data = buffer.data<uint8_t>();
            fillRaster(result, buffer, typeMax, nanColor, [](size_t) { return true; }, [&](size_t i) { return (*lut)[data[i]]; });
        } break;
        case EPixelFormat::U16: {
            auto lut = mLutCache->get(tone, range, 65536);
            auto data = buffer.data<uint16_t>();
            fillRaster(result, buffer, typeMax, nanColor, [](size_t) { return true; }, [&](size_t i) { return (*lut)[data[i]]; });
        } break;
        case EPixelFormat::F32: {
            // Float samples are quantized into 16 bit over the display range first, so the table itself always spans (0, 65535).
            auto lut = mLutCache->get(tone, {0.0, (double)(FLOAT_LUT_SIZE - 1)}, FLOAT_LUT_SIZE);
            auto data = buffer.data<float>();
            fillRaster(
                result,
                buffer,
                typeMax,
                nanColor,
                [&](size_t i) { return isfinite(data[i]); },
                [&](size_t i) { return (*lut)[quantizeFloat(data[i], range)]; }
            );
        } break;
    }

    return result;
}

RGBA8Buffer ImageRenderer::render24Bit(
    const SampleBuffer& buffer, const NormRange& range, const ToneSettings* tone, double typeMax, ENanColor nanColor
) const {
    FLOATVIEW_ASSERT(buffer.numChannels() >= 3, "24-bit rendering requires at least 3 channels, got {}.", buffer.numChannels());

    RGBA8Buffer result = allocateRaster(buffer);
    const auto nan = nanColorRgb(nanColor);

    for (size_t i = 0; i < buffer.numPixels(); ++i) {
        uint8_t* out = result.data.data() + i * 4;

        uint32_t combined;
        if (!combine24Bit(buffer, i, typeMax, combined)) {
            out[0] = nan[0];
            out[1] = nan[1];
            out[2] = nan[2];
        } else {
            double displayed = range.normalize(combined);
            if (tone) {
                displayed = applyTone(clamp01(displayed), *tone);
            }

            out[0] = out[1] = out[2] = toByte(displayed);
        }

        out[3] = 255;
    }

    return result;
}

void flipVertically(RGBA8Buffer& raster) {
    const size_t rowBytes = (size_t)raster.width * 4;
    vector<uint8_t> tmp(rowBytes);
    for (int y = 0; y < raster.height / 2; ++y) {
        uint8_t* top = raster.data.data() + (size_t)y * rowBytes;
        uint8_t* bottom = raster.data.data() + (size_t)(raster.height - 1 - y) * rowBytes;
        memcpy(tmp.data(), top, rowBytes);
        memcpy(top, bottom, rowBytes);
        memcpy(bottom, tmp.data(), rowBytes);
    }
}

} // namespace floatview
