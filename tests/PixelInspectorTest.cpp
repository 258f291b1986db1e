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

#include <floatview/PixelInspector.h>

#include <TestUtils.h>

#include <gtest/gtest.h>

#include <limits>

using namespace std;

namespace floatview::test {

namespace {
DecodedImage decoded(SampleBuffer&& buffer, double typeMax) { return {std::move(buffer), typeMax, {}}; }
} // namespace

TEST(PixelInspector, FloatGrayscale) {
    const DecodedImage image = decoded(makeFloat(2, 1, 1, {0.5f, 12346.0f}), 1.0);
    EXPECT_EQ(formatPixelValue(image, 0, 0, {}), "0.5000");
    EXPECT_EQ(formatPixelValue(image, 1, 0, {}), "1.235e+4");
}

TEST(PixelInspector, IntegerGrayscale) {
    const DecodedImage image = decoded(makeU16(1, 1, 1, {1000}), 65535.0);
    EXPECT_EQ(formatPixelValue(image, 0, 0, {}), "1000");

    ViewSettings settings;
    settings.normalization.normalizedFloatMode = true;
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 1, {51}), 255.0), 0, 0, settings), "0.2000");
}

TEST(PixelInspector, GrayscaleWithAlpha) {
    const DecodedImage image = decoded(makeU8(1, 1, 2, {7, 128}), 255.0);
    EXPECT_EQ(formatPixelValue(image, 0, 0, {}), "7 α:0.50");
}

TEST(PixelInspector, EightBitColorIsZeroPadded) {
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 3, {7, 42, 255}), 255.0), 0, 0, {}), "007 042 255");
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 4, {1, 2, 3, 255}), 255.0), 0, 0, {}), "001 002 003 α:1.00");
    EXPECT_EQ(formatPixelValue(decoded(makeU16(1, 1, 3, {7, 420, 65535}), 65535.0), 0, 0, {}), "7 420 65535");
}

TEST(PixelInspector, FloatColorListsAllChannels) {
    const DecodedImage image = decoded(makeFloat(1, 1, 4, {0.25f, 1.5f, -2.0f, 1.0f}), 1.0);
    EXPECT_EQ(formatPixelValue(image, 0, 0, {}), "0.2500 1.500 -2.000 1.000");

    const DecodedImage nan = decoded(makeFloat(1, 1, 3, {numeric_limits<float>::quiet_NaN(), 0.0f, 1.0f}), 1.0);
    EXPECT_EQ(formatPixelValue(nan, 0, 0, {}), "NaN 0.000 1.000");
}

TEST(PixelInspector, PackedValues) {
    ViewSettings settings;
    settings.rgbAs24BitGrayscale = true;

    // (1 << 16) | (2 << 8) | 3 = 66051
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 3, {1, 2, 3}), 255.0), 0, 0, settings), "66.051");
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 4, {1, 2, 3, 0}), 255.0), 0, 0, settings), "66.051 α:0.00");

    settings.scale24BitFactor = 1.0;
    EXPECT_EQ(formatPixelValue(decoded(makeU8(1, 1, 3, {0, 1, 0}), 255.0), 0, 0, settings), "256.000");

    const DecodedImage nan = decoded(makeFloat(1, 1, 3, {numeric_limits<float>::quiet_NaN(), 0.0f, 1.0f}), 1.0);
    EXPECT_EQ(formatPixelValue(nan, 0, 0, settings), "NaN");
}

TEST(PixelInspector, OutOfBoundsIsEmpty) {
    const DecodedImage image = decoded(makeU8(2, 2, 1, {1, 2, 3, 4}), 255.0);
    EXPECT_EQ(formatPixelValue(image, -1, 0, {}), "");
    EXPECT_EQ(formatPixelValue(image, 2, 0, {}), "");
    EXPECT_EQ(formatPixelValue(image, 0, 2, {}), "");
    EXPECT_EQ(formatPixelValue(image, 1, 1, {}), "4");
}

} // namespace floatview::test
