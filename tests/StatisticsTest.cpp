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

#include <floatview/Statistics.h>

#include <TestUtils.h>

#include <gtest/gtest.h>

#include <limits>

using namespace std;

namespace floatview::test {

static const float NaN = numeric_limits<float>::quiet_NaN();
static const float Inf = numeric_limits<float>::infinity();

TEST(Statistics, IgnoresNonFiniteSamples) {
    const SampleBuffer buffer = makeFloat(4, 1, 1, {NaN, -2.0f, Inf, 3.5f});
    EXPECT_EQ(computeStats(buffer), (Stats{-2.0, 3.5}));
}

TEST(Statistics, AllNonFiniteYieldsNothing) {
    const SampleBuffer buffer = makeFloat(2, 1, 1, {NaN, -Inf});
    EXPECT_FALSE(computeStats(buffer).has_value());
}

TEST(Statistics, SkipsAlphaChannel) {
    const SampleBuffer buffer = makeU8(2, 1, 4, {10, 20, 30, 255, 40, 50, 60, 0});
    EXPECT_EQ(computeStats(buffer), (Stats{10.0, 60.0}));

    const SampleBuffer grayAlpha = makeU16(2, 1, 2, {100, 65535, 200, 0});
    // Two channels: gray and alpha both count as color channels below three
    EXPECT_EQ(computeStats(grayAlpha), (Stats{0.0, 65535.0}));
}

TEST(Statistics, PackedRgbRange) {
    const SampleBuffer buffer = makeU8(2, 1, 3, {0, 0, 1, 1, 0, 0});
    EXPECT_EQ(compute24BitStats(buffer, 255.0), (Stats{1.0, 65536.0}));
}

TEST(Statistics, PackedRgbFromWideSources) {
    // u16 samples are reduced to bytes by dividing by 257
    const SampleBuffer u16 = makeU16(1, 1, 3, {65535, 257, 0});
    EXPECT_EQ(compute24BitStats(u16, 65535.0), (Stats{(double)0xff0100, (double)0xff0100}));

    // Floats are scaled by typeMax and clamped
    const SampleBuffer f32 = makeFloat(2, 1, 3, {1.0f, 2.0f, 0.0f, NaN, 0.0f, 0.0f});
    EXPECT_EQ(compute24BitStats(f32, 1.0), (Stats{(double)0xffff00, (double)0xffff00}));
}

TEST(Statistics, PackedRgbNeedsThreeChannels) {
    const SampleBuffer buffer = makeU8(1, 1, 2, {1, 2});
    EXPECT_THROW(compute24BitStats(buffer, 255.0), invalid_argument);
}

} // namespace floatview::test
