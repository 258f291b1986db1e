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

#include <floatview/imageio/NpzImageLoader.h>

#include <TestUtils.h>

#include <gtest/gtest.h>

using namespace std;

namespace floatview::test {

namespace {
// Appends a ZIP local file header followed by the member data. Only the fields the loader reads are filled in.
void appendZipMember(vector<uint8_t>& zip, string_view name, const vector<uint8_t>& data, uint16_t method = 0) {
    appendLe32(zip, 0x04034b50);
    appendLe16(zip, 20); // version needed
    appendLe16(zip, 0); // flags
    appendLe16(zip, method);
    appendLe16(zip, 0); // time
    appendLe16(zip, 0); // date
    appendLe32(zip, 0); // crc32
    appendLe32(zip, (uint32_t)data.size());
    appendLe32(zip, (uint32_t)data.size());
    appendLe16(zip, (uint16_t)name.size());
    appendLe16(zip, 0); // extra field length
    zip.insert(zip.end(), name.begin(), name.end());
    zip.insert(zip.end(), data.begin(), data.end());
}

DecodedImage loadNpz(const vector<uint8_t>& bytes) {
    istringstream stream{toString(bytes)};
    return NpzImageLoader{}.load(stream, "test.npz");
}
} // namespace

TEST(NpzImageLoader, ListsStoredArrays) {
    vector<uint8_t> zip;
    appendZipMember(zip, "image.npy", npyBytes("<u1", "(1, 1)", {1}));
    appendZipMember(zip, "compressed.npy", {0x78, 0x9c, 0x00}, 8);
    appendZipMember(zip, "notes.txt", toBytes("hello"));
    appendZipMember(zip, "mask.npy", npyBytes("<u1", "(1, 1)", {2}));

    const vector<NpzEntry> entries = findNpzArrays(zip);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "image");
    EXPECT_EQ(entries[1].name, "mask");
}

TEST(NpzImageLoader, PrefersDepthLikeArrays) {
    vector<uint8_t> zip;
    appendZipMember(zip, "image.npy", npyBytes("<u1", "(1, 1)", {1}));
    appendZipMember(zip, "Disparity.npy", npyBytes("<u1", "(1, 1)", {2}));

    const vector<NpzEntry> entries = findNpzArrays(zip);
    EXPECT_EQ(selectNpzArray(entries).name, "Disparity");

    const DecodedImage image = loadNpz(zip);
    EXPECT_FLOAT_EQ(image.buffer.at(0), 2.0f);
    EXPECT_EQ(image.info.formatLabel, "NPZ");
    EXPECT_EQ(image.info.arrayName, "Disparity");
}

TEST(NpzImageLoader, FallsBackToFirstArray) {
    vector<uint8_t> zip;
    appendZipMember(zip, "image.npy", npyBytes("<u1", "(1, 1)", {1}));
    appendZipMember(zip, "labels.npy", npyBytes("<u1", "(1, 1)", {2}));

    EXPECT_FLOAT_EQ(loadNpz(zip).buffer.at(0), 1.0f);
}

TEST(NpzImageLoader, Errors) {
    EXPECT_THROW(loadNpz(toBytes("\x93NUMPY")), ImageLoader::FormatNotSupported);

    vector<uint8_t> onlyCompressed;
    appendZipMember(onlyCompressed, "depth.npy", {0x78, 0x9c, 0x00}, 8);
    EXPECT_EQ(formatErrorKind([&] { loadNpz(onlyCompressed); }), EFormatError::Unsupported);

    vector<uint8_t> badMember;
    appendZipMember(badMember, "depth.npy", toBytes("garbage bytes"));
    EXPECT_EQ(formatErrorKind([&] { loadNpz(badMember); }), EFormatError::Malformed);

    vector<uint8_t> truncated;
    appendZipMember(truncated, "depth.npy", npyBytes("<u1", "(1, 1)", {1}));
    truncated.resize(truncated.size() - 1);
    EXPECT_EQ(formatErrorKind([&] { loadNpz(truncated); }), EFormatError::Truncated);
}

} // namespace floatview::test
