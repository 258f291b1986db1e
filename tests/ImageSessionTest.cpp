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

#include <TestUtils.h>

#include <gtest/gtest.h>

#include <fstream>

using namespace std;

namespace floatview::test {

namespace {
shared_ptr<const DecodedImage> floatImage(const vector<float>& values, int width, int height) {
    FormatInfo info;
    info.formatLabel = "PFM";
    info.formatType = "pfm";
    info.sampleFormat = 3;
    return make_shared<const DecodedImage>(DecodedImage{makeFloat(width, height, 1, values), 1.0, info});
}

shared_ptr<const DecodedImage> rgbImage(const vector<uint8_t>& values, int width, int height) {
    FormatInfo info;
    info.formatLabel = "PPM";
    info.formatType = "ppm";
    info.sampleFormat = 1;
    return make_shared<const DecodedImage>(DecodedImage{makeU8(width, height, 3, values), 255.0, info});
}
} // namespace

TEST(ImageSession, StartsFromFormatDefaults) {
    ImageSession session;
    session.setImage(floatImage({0.0f, 1.0f}, 2, 1));
    EXPECT_TRUE(session.settings().normalization.autoNormalize);

    session.setImage(rgbImage({0, 0, 0}, 1, 1));
    EXPECT_TRUE(session.settings().normalization.gammaMode);
    EXPECT_EQ(session.generation(), 2u);
}

TEST(ImageSession, RejectsInvalidSettings) {
    ImageSession session;
    ViewSettings settings;
    settings.tone.gammaIn = 0;
    EXPECT_THROW(session.setImage(floatImage({0.0f}, 1, 1), settings), SettingsError);
    EXPECT_EQ(session.image(), nullptr);

    session.setImage(floatImage({0.0f}, 1, 1));
    EXPECT_THROW(session.updateSettings(settings), SettingsError);
    EXPECT_DOUBLE_EQ(session.settings().tone.gammaIn, 1.0);
}

TEST(ImageSession, RendersWithCachedStatistics) {
    ImageSession session;
    session.setImage(floatImage({2.0f, 4.0f}, 2, 1));

    const RGBA8Buffer raster = session.render();
    EXPECT_EQ(raster.pixel(0, 0)[0], 0);
    EXPECT_EQ(raster.pixel(1, 0)[0], 255);

    session.render();
    session.histogram();
    EXPECT_EQ(session.numStatsComputations(), 1u);
    EXPECT_EQ(session.stats(), (Stats{2.0, 4.0}));
}

TEST(ImageSession, ParameterChangesKeepStatistics) {
    ImageSession session;
    session.setImage(floatImage({2.0f, 4.0f}, 2, 1));
    session.stats();

    ViewSettings settings = session.settings();
    settings.tone.exposureStops = 1.0;
    settings.nanColor = ENanColor::Fuchsia;
    const SettingsChange change = session.updateSettings(settings);
    EXPECT_TRUE(change.parametersOnly);

    session.render();
    EXPECT_EQ(session.numStatsComputations(), 1u);
}

TEST(ImageSession, NewImageInvalidatesStatistics) {
    ImageSession session;
    session.setImage(floatImage({2.0f, 4.0f}, 2, 1));
    EXPECT_EQ(session.stats(), (Stats{2.0, 4.0}));

    session.setImage(floatImage({-1.0f, 8.0f}, 2, 1));
    EXPECT_EQ(session.stats(), (Stats{-1.0, 8.0}));
    EXPECT_EQ(session.numStatsComputations(), 2u);
}

TEST(ImageSession, PackedModeUsesPackedStatistics) {
    ImageSession session;
    session.setImage(rgbImage({0, 0, 1, 0, 1, 0}, 2, 1));
    EXPECT_EQ(session.stats(), (Stats{0.0, 1.0}));

    ViewSettings settings = session.settings();
    settings.rgbAs24BitGrayscale = true;
    settings.normalization.gammaMode = false;
    settings.normalization.autoNormalize = true;
    EXPECT_TRUE(session.updateSettings(settings).changedStructure);

    EXPECT_EQ(session.stats(), (Stats{1.0, 256.0}));
    EXPECT_EQ(session.numStatsComputations(), 2u);

    const RGBA8Buffer raster = session.render();
    EXPECT_EQ(raster.pixel(0, 0)[0], 0);
    EXPECT_EQ(raster.pixel(1, 0)[0], 255);
    EXPECT_EQ(session.pixelValue(1, 0), "0.256");
}

TEST(ImageSession, MasksFilterDisplayedPixels) {
    ImageSession session;
    session.setImage(floatImage({1.0f, 2.0f, 3.0f, 4.0f}, 4, 1));
    EXPECT_EQ(session.stats(), (Stats{1.0, 4.0}));

    auto mask = floatImage({0.0f, 1.0f, 1.0f, 0.0f}, 4, 1);
    session.setMasks({{mask, 0.5, false, true}});

    // Pixels whose mask is below the threshold are gone
    EXPECT_EQ(session.stats(), (Stats{2.0, 3.0}));
    EXPECT_EQ(session.numStatsComputations(), 2u);

    const Histogram histogram = session.histogram();
    EXPECT_EQ(histogram.nanCount, 2u);

    RGBA8Buffer raster = session.render();
    EXPECT_EQ(raster.pixel(0, 0)[0], 0);
    EXPECT_EQ(raster.pixel(2, 0)[0], 255);

    // The readout still shows the unfiltered value
    EXPECT_EQ(session.pixelValue(0, 0), "1.000");

    session.setMasks({{mask, 0.5, false, false}});
    EXPECT_EQ(session.stats(), (Stats{1.0, 4.0}));
    EXPECT_EQ(session.numStatsComputations(), 3u);
}

TEST(ImageSession, MismatchedMaskIsRejectedOnUse) {
    ImageSession session;
    session.setImage(floatImage({1.0f, 2.0f}, 2, 1));
    session.setMasks({{floatImage({1.0f}, 1, 1), 0.5, false, true}});
    EXPECT_EQ(formatErrorKind([&] { session.stats(); }), EFormatError::Unsupported);
}

TEST(ImageSession, LoadsFromDisk) {
    const fs::path path = fs::temp_directory_path() / "floatview-session-test.pfm";
    {
        vector<uint8_t> bytes = toBytes("Pf\n2 1\n-1.0\n");
        appendFloatLe(bytes, 0.0f);
        appendFloatLe(bytes, 1.0f);

        ofstream f{path, ios_base::out | ios_base::binary};
        f.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    ScopeGuard removeGuard{[&] {
        error_code ec;
        fs::remove(path, ec);
    }};

    ImageSession session;
    session.load(path);
    EXPECT_EQ(session.image()->info.formatType, "pfm");
    EXPECT_EQ(session.render().pixel(1, 0)[0], 255);
    EXPECT_EQ(session.pixelValue(1, 0), "1.000");
}

TEST(ImageSession, SharesLutCacheBetweenRenderAndHistogram) {
    ImageSession session;
    session.setImage(rgbImage({10, 20, 30}, 1, 1));

    ViewSettings settings = session.settings();
    settings.tone.gammaIn = 2.2;
    session.updateSettings(settings);

    session.render();
    session.histogram();
    EXPECT_EQ(session.lutCache()->numBuilds(), 1u);
}

} // namespace floatview::test
