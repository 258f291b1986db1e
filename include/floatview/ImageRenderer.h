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

#include <floatview/Lut.h>
#include <floatview/Normalization.h>
#include <floatview/SampleBuffer.h>
#include <floatview/Settings.h>
#include <floatview/Statistics.h>
#include <floatview/ToneMapper.h>

#include <memory>
#include <optional>

namespace floatview {

struct RenderOptions {
    // Full-scale value of the source. Derived from the buffer if not given.
    std::optional<double> typeMax;
    ENanColor nanColor = ENanColor::Black;
    bool flipY = false;
    bool rgbAs24BitGrayscale = false;
};

enum class ERenderPath {
    Direct,
    Lut,
    Packed24Bit,
};

std::string_view toString(ERenderPath path);

// The packed 24-bit path needs at least three channels. Otherwise gamma and exposure only take effect in gamma mode, and only through a
// LUT when they are not the identity.
ERenderPath chooseRenderPath(
    const NormalizationSettings& normalization, const ToneSettings& tone, bool rgbAs24BitGrayscale = false, int numChannels = 1
);

// 1.0 for float sources, otherwise the natural full-scale value of the source element kind.
double resolveTypeMax(const SampleBuffer& buffer, const std::optional<double>& typeMax);

class ImageRenderer {
public:
    ImageRenderer(std::shared_ptr<LutCache> lutCache = nullptr);

    // Converts raw samples into a displayable RGBA8 raster. In 24-bit mode, `stats` must be the statistics of the packed values
    // (compute24BitStats) rather than of the channels.
    RGBA8Buffer render(
        const SampleBuffer& buffer,
        const std::optional<Stats>& stats,
        const NormalizationSettings& normalization,
        const ToneSettings& tone,
        const RenderOptions& options
    ) const;

    RGBA8Buffer renderDirect(const SampleBuffer& buffer, const NormRange& range, double typeMax, ENanColor nanColor) const;
    RGBA8Buffer renderWithLut(const SampleBuffer& buffer, const NormRange& range, const ToneSettings& tone, double typeMax, ENanColor nanColor)
        const;
    RGBA8Buffer render24Bit(const SampleBuffer& buffer, const NormRange& range, const ToneSettings* tone, double typeMax, ENanColor nanColor)
        const;

    const std::shared_ptr<LutCache>& lutCache() const { return mLutCache; }

private:
    std::shared_ptr<LutCache> mLutCache;
};

void flipVertically(RGBA8Buffer& raster);

} // namespace floatview
