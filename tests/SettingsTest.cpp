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

#include <floatview/Settings.h>

#include <gtest/gtest.h>

#include <limits>

using namespace std;

namespace floatview::test {

TEST(Settings, DefaultsDependOnSampleFormat) {
    FormatInfo floatInfo;
    floatInfo.sampleFormat = 3;
    const ViewSettings floatDefaults = ViewSettings::defaultsFor(floatInfo);
    EXPECT_TRUE(floatDefaults.normalization.autoNormalize);
    EXPECT_FALSE(floatDefaults.normalization.gammaMode);

    FormatInfo intInfo;
    intInfo.sampleFormat = 1;
    const ViewSettings intDefaults = ViewSettings::defaultsFor(intInfo);
    EXPECT_FALSE(intDefaults.normalization.autoNormalize);
    EXPECT_TRUE(intDefaults.normalization.gammaMode);
    EXPECT_TRUE(intDefaults.tone.isIdentity());
}

TEST(Settings, ParsesNanColors) {
    EXPECT_EQ(toNanColor("black"), ENanColor::Black);
    EXPECT_EQ(toNanColor("Fuchsia"), ENanColor::Fuchsia);
    EXPECT_THROW(toNanColor("magenta"), SettingsError);

    EXPECT_EQ(toString(ENanColor::Fuchsia), "fuchsia");
    EXPECT_EQ(nanColorRgb(ENanColor::Fuchsia), (array<uint8_t, 3>{255, 0, 255}));
    EXPECT_EQ(nanColorRgb(ENanColor::Black), (array<uint8_t, 3>{0, 0, 0}));
}

TEST(Settings, Validate) {
    ViewSettings settings;
    EXPECT_NO_THROW(settings.validate());

    settings.scale24BitFactor = 0;
    EXPECT_THROW(settings.validate(), SettingsError);

    settings.scale24BitFactor = 1000;
    settings.tone.gammaOut = -1;
    EXPECT_THROW(settings.validate(), SettingsError);

    settings.tone.gammaOut = 1;
    settings.masks.push_back({nullptr, numeric_limits<double>::quiet_NaN(), false, true});
    EXPECT_THROW(settings.validate(), SettingsError);
}

TEST(Settings, DiffClassifiesChanges) {
    const ViewSettings base;

    EXPECT_FALSE(diffSettings(base, base).any());

    ViewSettings tone = base;
    tone.tone.exposureStops = 1.0;
    const SettingsChange toneChange = diffSettings(base, tone);
    EXPECT_TRUE(toneChange.parametersOnly);
    EXPECT_FALSE(toneChange.changedStructure);
    EXPECT_FALSE(toneChange.changedMasks);

    ViewSettings nan = base;
    nan.nanColor = ENanColor::Fuchsia;
    EXPECT_TRUE(diffSettings(base, nan).parametersOnly);

    ViewSettings packed = base;
    packed.rgbAs24BitGrayscale = true;
    const SettingsChange packedChange = diffSettings(base, packed);
    EXPECT_TRUE(packedChange.changedStructure);
    EXPECT_FALSE(packedChange.parametersOnly);

    ViewSettings normalizedFloat = base;
    normalizedFloat.normalization.normalizedFloatMode = true;
    const SettingsChange normalizedFloatChange = diffSettings(base, normalizedFloat);
    EXPECT_TRUE(normalizedFloatChange.changedStructure);
    EXPECT_FALSE(normalizedFloatChange.parametersOnly);

    ViewSettings masked = base;
    masked.masks.push_back({});
    const SettingsChange maskChange = diffSettings(base, masked);
    EXPECT_TRUE(maskChange.changedMasks);
    EXPECT_FALSE(maskChange.parametersOnly);
}

} // namespace floatview::test
