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

#include <floatview/Normalization.h>

#include <gtest/gtest.h>

#include <limits>

using namespace std;

namespace floatview::test {

TEST(Normalization, AutoNormalizeUsesStats) {
    NormalizationSettings settings;
    settings.autoNormalize = true;
    settings.gammaMode = true;
    settings.min = 5.0;
    settings.max = 6.0;

    EXPECT_EQ(resolveRange(settings, Stats{-1.0, 3.0}, 255.0, false), (NormRange{-1.0, 3.0}));
}

TEST(Normalization, AutoNormalizeFallsBackWithoutStats) {
    NormalizationSettings settings;
    settings.autoNormalize = true;

    EXPECT_EQ(resolveRange(settings, nullopt, 65535.0, false), (NormRange{0.0, 65535.0}));
}

TEST(Normalization, GammaModeShowsNativeRange) {
    NormalizationSettings settings;
    settings.gammaMode = true;
    settings.min = 10.0;
    settings.max = 20.0;

    EXPECT_EQ(resolveRange(settings, Stats{3.0, 4.0}, 255.0, false), (NormRange{0.0, 255.0}));
}

TEST(Normalization, ManualRangeNeedsBothBounds) {
    NormalizationSettings settings;
    settings.min = 10.0;
    EXPECT_EQ(resolveRange(settings, nullopt, 255.0, false), (NormRange{0.0, 255.0}));

    settings.max = 20.0;
    EXPECT_EQ(resolveRange(settings, nullopt, 255.0, false), (NormRange{10.0, 20.0}));
}

TEST(Normalization, NormalizedFloatModeScalesIntegerSources) {
    NormalizationSettings settings;
    settings.min = 0.25;
    settings.max = 0.5;
    settings.normalizedFloatMode = true;

    EXPECT_EQ(resolveRange(settings, nullopt, 200.0, false), (NormRange{50.0, 100.0}));
    // Float sources are already in normalized units
    EXPECT_EQ(resolveRange(settings, nullopt, 1.0, true), (NormRange{0.25, 0.5}));
}

TEST(Normalization, DegenerateRangeMapsToLowerEnd) {
    const NormRange range{7.0, 7.0};
    EXPECT_EQ(range.invRange(), 0.0);
    EXPECT_EQ(range.normalize(7.0), 0.0);
    EXPECT_EQ(range.normalize(100.0), 0.0);

    const NormRange inverted{1.0, 0.0};
    EXPECT_EQ(inverted.invRange(), 0.0);
}

TEST(Normalization, ValidateRejectsNonFiniteBounds) {
    NormalizationSettings settings;
    settings.min = numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(settings.validate(), SettingsError);

    settings.min = 0.0;
    settings.max = numeric_limits<double>::infinity();
    EXPECT_THROW(settings.validate(), SettingsError);

    settings.max = 1.0;
    EXPECT_NO_THROW(settings.validate());
}

TEST(Normalization, LinearMap) {
    EXPECT_DOUBLE_EQ(linearMap(0.0, -2.0, 6.0), -2.0);
    EXPECT_DOUBLE_EQ(linearMap(0.5, -2.0, 6.0), 2.0);
    EXPECT_DOUBLE_EQ(linearMap(1.0, -2.0, 6.0), 6.0);
}

TEST(Normalization, LogMapPositiveRange) {
    EXPECT_NEAR(logMap(0.0, 1.0, 1000.0), 1.0, 1e-9);
    EXPECT_NEAR(logMap(0.5, 1.0, 10000.0), 100.0, 1e-9);
    EXPECT_NEAR(logMap(1.0, 1.0, 1000.0), 1000.0, 1e-9);
}

TEST(Normalization, LogMapClampsZeroBound) {
    EXPECT_NEAR(logMap(0.0, 0.0, 1.0), 1e-10, 1e-20);
    EXPECT_NEAR(logMap(0.5, 0.0, 1.0), 1e-5, 1e-15);
}

TEST(Normalization, LogMapNegativeRanges) {
    // Both bounds negative: interpolate magnitudes, keep the sign
    EXPECT_NEAR(logMap(0.0, -100.0, -1.0), -100.0, 1e-9);
    EXPECT_NEAR(logMap(0.5, -100.0, -1.0), -10.0, 1e-9);

    // Mixed signs fall back to linear interpolation
    EXPECT_DOUBLE_EQ(logMap(0.25, -1.0, 3.0), 0.0);
}

} // namespace floatview::test
