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

#include <floatview/imageio/PngImageLoader.h>
#include <floatview/imageio/PngImageSaver.h>

#include <TestUtils.h>

#include <gtest/gtest.h>

#include <sstream>

using namespace std;

namespace floatview::test {

namespace {
DecodedImage roundTrip(const vector<uint8_t>& data, int width, int height, int nChannels) {
    ostringstream out;
    PngImageSaver{}.save(out, data, width, height, nChannels);

    istringstream in{out.str()};
    return PngImageLoader{}.load(in, "test.png");
}
} // namespace

TEST(PngImageLoader, ReadsRgbaWrittenBySaver) {
    const vector<uint8_t> data = {255, 0, 0, 255, 10, 20, 30, 128};
    const DecodedImage image = roundTrip(data, 2, 1, 4);

    ASSERT_EQ(image.buffer.numChannels(), 4);
    EXPECT_EQ(image.buffer.pixelFormat(), EPixelFormat::U8);
    EXPECT_DOUBLE_EQ(image.typeMax, 255.0);
    EXPECT_EQ(image.info.formatType, "png");
    EXPECT_EQ(image.info.bitsPerSample, 8);

    for (size_t i = 0; i < data.size(); ++i) {
        EXPECT_EQ(image.buffer.at(i), (float)data[i]) << "sample " << i;
    }
}

TEST(PngImageLoader, ReadsGrayscale) {
    const DecodedImage image = roundTrip({0, 64, 128, 255}, 2, 2, 1);
    EXPECT_EQ(image.buffer.numChannels(), 1);
    EXPECT_EQ(image.buffer.at(1, 1, 0), 255.0f);
}

TEST(PngImageLoader, RejectsOtherFormats) {
    istringstream in{"P5\n1 1\n255\n\x01"};
    EXPECT_THROW(PngImageLoader{}.load(in, "test.pgm"), ImageLoader::FormatNotSupported);
}

TEST(PngImageSaver, RejectsInconsistentSizes) {
    ostringstream out;
    const vector<uint8_t> data(3);
    EXPECT_THROW(PngImageSaver{}.save(out, data, 2, 2, 4), ImageSaveError);
}

} // namespace floatview::test
