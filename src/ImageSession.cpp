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

#include <floatview/ImageSession.h>
#include <floatview/PixelInspector.h>
#include <floatview/imageio/ImageLoader.h>

using namespace std;

namespace floatview {

ImageSession::ImageSession(shared_ptr<LutCache> lutCache) :
    mLutCache{lutCache ? std::move(lutCache) : make_shared<LutCache>()}, mRenderer{mLutCache}, mHistogramEngine{mLutCache} {}

void ImageSession::load(const fs::path& path) { setImage(make_shared<const DecodedImage>(loadImage(path))); }

void ImageSession::setImage(shared_ptr<const DecodedImage> image, optional<ViewSettings> settings) {
    FLOATVIEW_ASSERT(image, "Cannot set a null image.");

    ViewSettings newSettings = settings ? std::move(*settings) : ViewSettings::defaultsFor(image->info);
    newSettings.validate();

    mImage = std::move(image);
    ++mGeneration;

    mSettings = std::move(newSettings);
    mStatsCache.reset();
    mMaskedBuffer.reset();

    tlog::debug() << fmt::format(
        "Session image generation {}: {} {}x{}", mGeneration, mImage->info.formatLabel, mImage->buffer.width(), mImage->buffer.height()
    );
}

SettingsChange ImageSession::updateSettings(ViewSettings settings) {
    settings.validate();

    const SettingsChange change = diffSettings(mSettings, settings);
    if (change.changedMasks) {
        ++mMaskGeneration;
        mMaskedBuffer.reset();
    }

    if (change.changedMasks || change.changedStructure) {
        mStatsCache.reset();
    }

    mSettings = std::move(settings);
    return change;
}

void ImageSession::setMasks(vector<MaskFilter> masks) {
    ViewSettings settings = mSettings;
    settings.masks = std::move(masks);
    updateSettings(std::move(settings));
}

bool ImageSession::uses24BitMode() const { return mSettings.rgbAs24BitGrayscale && mImage->buffer.numChannels() >= 3; }

const SampleBuffer& ImageSession::displayBuffer() {
    FLOATVIEW_ASSERT(mImage, "No image loaded.");

    if (!mMaskedBuffer || mMaskedBuffer->generation != mGeneration || mMaskedBuffer->maskGeneration != mMaskGeneration) {
        mMaskedBuffer = MaskedBuffer{mGeneration, mMaskGeneration, applyMaskFilters(mImage->buffer, mSettings.masks)};
    }

    return mMaskedBuffer->buffer ? *mMaskedBuffer->buffer : mImage->buffer;
}

optional<Stats> ImageSession::stats() {
    const SampleBuffer& buffer = displayBuffer();
    const bool rgb24 = uses24BitMode();

    if (mStatsCache && mStatsCache->generation == mGeneration && mStatsCache->rgbAs24BitGrayscale == rgb24 &&
        mStatsCache->maskGeneration == mMaskGeneration) {
        return mStatsCache->stats;
    }

    ++mNumStatsComputations;
    optional<Stats> stats = rgb24 ? compute24BitStats(buffer, mImage->typeMax) : computeStats(buffer);
    mStatsCache = StatsCache{mGeneration, rgb24, mMaskGeneration, stats};

    if (stats) {
        tlog::debug() << fmt::format("Computed statistics: min={} max={}", stats->min, stats->max);
    } else {
        tlog::debug() << "Computed statistics: no finite samples";
    }

    return stats;
}

RGBA8Buffer ImageSession::render(bool flipY) {
    const optional<Stats> currentStats = stats();
    const SampleBuffer& buffer = displayBuffer();

    RenderOptions options;
    options.typeMax = mImage->typeMax;
    options.nanColor = mSettings.nanColor;
    options.flipY = flipY;
    options.rgbAs24BitGrayscale = mSettings.rgbAs24BitGrayscale;

    return mRenderer.render(buffer, currentStats, mSettings.normalization, mSettings.tone, options);
}

Histogram ImageSession::histogram() {
    HistogramOptions options;
    options.normalization = mSettings.normalization;
    options.tone = mSettings.tone;
    options.stats = stats();
    options.typeMax = mImage->typeMax;
    options.rgbAs24BitGrayscale = mSettings.rgbAs24BitGrayscale;

    return mHistogramEngine.compute(displayBuffer(), options);
}

string ImageSession::pixelValue(int x, int y) const {
    FLOATVIEW_ASSERT(mImage, "No image loaded.");
    return formatPixelValue(*mImage, x, y, mSettings);
}

} // namespace floatview
