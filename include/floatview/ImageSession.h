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

#include <floatview/Histogram.h>
#include <floatview/ImageRenderer.h>
#include <floatview/Lut.h>
#include <floatview/Settings.h>
#include <floatview/Statistics.h>

#include <memory>
#include <optional>
#include <string>

namespace floatview {

// One loaded image together with its view settings and the caches derived from both. The image is replaced wholesale on reload and
// never mutated; every cache entry remembers which image generation it was computed from.
class ImageSession {
public:
    ImageSession(std::shared_ptr<LutCache> lutCache = nullptr);

    // Decodes the file and makes it the current image, starting from the per-format default settings.
    void load(const fs::path& path);
    void setImage(std::shared_ptr<const DecodedImage> image, std::optional<ViewSettings> settings = {});

    const std::shared_ptr<const DecodedImage>& image() const { return mImage; }
    uint64_t generation() const { return mGeneration; }

    const ViewSettings& settings() const { return mSettings; }
    SettingsChange updateSettings(ViewSettings settings);
    void setMasks(std::vector<MaskFilter> masks);

    // Statistics of what is currently displayed: the masked buffer if masks are active, packed 24-bit values in 24-bit mode.
    std::optional<Stats> stats();

    RGBA8Buffer render(bool flipY = false);
    Histogram histogram();
    std::string pixelValue(int x, int y) const;

    size_t numStatsComputations() const { return mNumStatsComputations; }
    const std::shared_ptr<LutCache>& lutCache() const { return mLutCache; }

private:
    const SampleBuffer& displayBuffer();
    bool uses24BitMode() const;

    std::shared_ptr<const DecodedImage> mImage;
    uint64_t mGeneration = 0;

    ViewSettings mSettings;
    uint64_t mMaskGeneration = 0;

    struct StatsCache {
        uint64_t generation;
        bool rgbAs24BitGrayscale;
        uint64_t maskGeneration;
        std::optional<Stats> stats;
    };

    std::optional<StatsCache> mStatsCache;
    size_t mNumStatsComputations = 0;

    struct MaskedBuffer {
        uint64_t generation;
        uint64_t maskGeneration;
        std::optional<SampleBuffer> buffer;
    };

    std::optional<MaskedBuffer> mMaskedBuffer;

    std::shared_ptr<LutCache> mLutCache;
    ImageRenderer mRenderer;
    HistogramEngine mHistogramEngine;
};

} // namespace floatview
