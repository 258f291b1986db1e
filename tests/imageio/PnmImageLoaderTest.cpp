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

#include <floatview/imageio/PnmImageLoader.h>

#include <TestUtils.h>

#include <gtest/gtest.h>

using namespace std;

namespace floatview::test {

namespace {
DecodedImage loadPnm(const vector<uint8_t>& bytes) {
    istringstream stream{toString(bytes)};
    return PnmImageLoader{}.load(stream, "test.pnm");
}

DecodedImage loadPnm(string_view text) { return loadPnm(toBytes(text)); }
} // namespace

TEST(PnmImageLoader, AsciiBitmap) {
    const DecodedImage image = loadPnm("P1\n2 1\n1 0\n");

    ASSERT_EQ(image.buffer.numSamples(), 2u);
    EXPECT_EQ(image.buffer.at(0), 0.0f);
    EXPECT_EQ(image.buffer.at(1), 255.0f);
    EXPECT_DOUBLE_EQ(image.typeMax, 255.0);
    EXPECT_EQ(image.info.formatLabel, "PBM (ASCII)");
    EXPECT_EQ(image.info.formatType, "pbm");
}

TEST(PnmImageLoader, AsciiBitmapWithoutSeparators) {
    const DecodedImage image = loadPnm("P1\n3 1\n101");
    EXPECT_EQ(image.buffer.at(0), 0.0f);
    EXPECT_EQ(image.buffer.at(1), 255.0f);
    EXPECT_EQ(image.buffer.at(2), 0.0f);
}

TEST(PnmImageLoader, BinaryBitmapIsMsbFirst) {
    // 10 pixels wide: two bytes per row, bits 0 and 9 set.
    vector<uint8_t> bytes = toBytes("P4\n10 1\n");
    bytes.push_back(0b10000000);
    bytes.push_back(0b01000000);

    const DecodedImage image = loadPnm(bytes);
    ASSERT_EQ(image.buffer.numSamples(), 10u);
    for (int x = 0; x < 10; ++x) {
        EXPECT_EQ(image.buffer.at(x), x == 0 || x == 9 ? 0.0f : 255.0f) << "x=" << x;
    }

    EXPECT_EQ(image.info.formatLabel, "PBM (Binary)");
}

TEST(PnmImageLoader, AsciiGraymapWithComments) {
    const DecodedImage image = loadPnm("P2\n# created by hand\n2 2 # size\n100\n0 50\n100 25\n");

    EXPECT_EQ(image.buffer.pixelFormat(), EPixelFormat::U8);
    EXPECT_DOUBLE_EQ(image.typeMax, 100.0);
    EXPECT_EQ(image.buffer.at(1), 50.0f);
    EXPECT_EQ(image.buffer.at(3), 25.0f);
    EXPECT_EQ(image.info.formatType, "pgm");
}

TEST(PnmImageLoader, AsciiPixmap) {
    const DecodedImage image = loadPnm("P3 1 1 255 10 20 30");
    EXPECT_EQ(image.buffer.numChannels(), 3);
    EXPECT_EQ(image.buffer.at(2), 30.0f);
    EXPECT_EQ(image.info.formatLabel, "PPM (ASCII)");
}

TEST(PnmImageLoader, BinaryPixmap) {
    vector<uint8_t> bytes = toBytes("P6\n2 1\n255\n");
    for (uint8_t v : {1, 2, 3, 4, 5, 6}) {
        bytes.push_back(v);
    }

    const DecodedImage image = loadPnm(bytes);
    EXPECT_EQ(image.buffer.numChannels(), 3);
    EXPECT_EQ(image.buffer.at(1, 0, 2), 6.0f);
    EXPECT_EQ(image.info.formatType, "ppm");
    EXPECT_EQ(image.info.bitsPerSample, 8);
}

TEST(PnmImageLoader, SixteenBitSamplesAreBigEndian) {
    vector<uint8_t> bytes = toBytes("P5\n2 1\n1000\n");
    for (uint8_t v : {0x03, 0xe8, 0x00, 0x01}) {
        bytes.push_back(v);
    }

    const DecodedImage image = loadPnm(bytes);
    EXPECT_EQ(image.buffer.pixelFormat(), EPixelFormat::U16);
    EXPECT_EQ(image.buffer.at(0), 1000.0f);
    EXPECT_EQ(image.buffer.at(1), 1.0f);
    EXPECT_DOUBLE_EQ(image.typeMax, 1000.0);
    EXPECT_EQ(image.info.bitsPerSample, 16);
}

TEST(PnmImageLoader, ConsumesExactlyOneWhitespaceAfterMaxval) {
    // The first payload byte is itself a newline character.
    vector<uint8_t> bytes = toBytes("P5\n2 1\n255\n");
    bytes.push_back('\n');
    bytes.push_back(' ');

    const DecodedImage image = loadPnm(bytes);
    EXPECT_EQ(image.buffer.at(0), 10.0f);
    EXPECT_EQ(image.buffer.at(1), 32.0f);
}

TEST(PnmImageLoader, Errors) {
    EXPECT_THROW(loadPnm("P7\n1 1\n255\n"), ImageLoader::FormatNotSupported);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P2\n1 1\n70000\n0"); }), EFormatError::Malformed);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P2\nx 1\n255\n0"); }), EFormatError::Malformed);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P2\n1 1\n255\n300"); }), EFormatError::Malformed);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P1\n2 2\n1 0 1"); }), EFormatError::Truncated);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P2\n2"); }), EFormatError::Truncated);

    vector<uint8_t> shortPayload = toBytes("P5\n2 2\n255\n");
    shortPayload.insert(shortPayload.end(), {1, 2, 3});
    EXPECT_EQ(formatErrorKind([&] { loadPnm(shortPayload); }), EFormatError::Truncated);
}

TEST(PnmImageLoader, OversizedHeaderIsTruncatedBeforeAllocating) {
    vector<uint8_t> graymap = toBytes("P5\n2000000000 2000000000\n255\n");
    graymap.push_back(0);
    EXPECT_EQ(formatErrorKind([&] { loadPnm(graymap); }), EFormatError::Truncated);

    EXPECT_EQ(formatErrorKind([] { loadPnm("P4\n2000000000 2000000000\n\xff"); }), EFormatError::Truncated);
    EXPECT_EQ(formatErrorKind([] { loadPnm("P3\n2000000000 2000000000\n65535\n1 2 3"); }), EFormatError::Truncated);
}

} // namespace floatview::test
