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

#include <floatview/imageio/NpyImageLoader.h>
#include <floatview/imageio/NpzImageLoader.h>

#include <cstring>
#include <regex>

using namespace std;

namespace floatview {

static const uint32_t ZIP_LOCAL_FILE_HEADER_SIGNATURE = 0x04034b50;
static const size_t ZIP_LOCAL_FILE_HEADER_SIZE = 30;

vector<NpzEntry> findNpzArrays(span<const uint8_t> bytes) {
    vector<NpzEntry> result;

    size_t offset = 0;
    while (offset + 4 < bytes.size()) {
        if (readLe32(bytes.data() + offset) != ZIP_LOCAL_FILE_HEADER_SIGNATURE) {
            ++offset;
            continue;
        }

        if (offset + ZIP_LOCAL_FILE_HEADER_SIZE > bytes.size()) {
            throw FormatError{EFormatError::Truncated, fmt::format("ZIP local file header at offset {} ends early", offset)};
        }

        const uint8_t* header = bytes.data() + offset;
        const uint16_t compression = readLe16(header + 8);
        const uint32_t compressedSize = readLe32(header + 18);
        const uint16_t nameLength = readLe16(header + 26);
        const uint16_t extraLength = readLe16(header + 28);

        const size_t nameOffset = offset + ZIP_LOCAL_FILE_HEADER_SIZE;
        const size_t dataOffset = nameOffset + nameLength + extraLength;
        if (dataOffset > bytes.size() || compressedSize > bytes.size() - dataOffset) {
            throw FormatError{EFormatError::Truncated, fmt::format("ZIP member at offset {} exceeds the archive", offset)};
        }

        const string name{reinterpret_cast<const char*>(bytes.data()) + nameOffset, nameLength};
        if (name.ends_with(".npy")) {
            if (compression == 0) {
                result.push_back({name.substr(0, name.size() - 4), bytes.subspan(dataOffset, compressedSize)});
            } else {
                tlog::debug() << fmt::format("Skipping compressed NPZ member {} (method {})", name, compression);
            }
        }

        offset = dataOffset + compressedSize;
    }

    return result;
}

const NpzEntry& selectNpzArray(const vector<NpzEntry>& entries) {
    if (entries.empty()) {
        throw FormatError{EFormatError::Unsupported, "NPZ contains no uncompressed .npy arrays"};
    }

    static const regex depthLikeRegex{"depth|dispar|inv|z|range", regex_constants::icase};
    for (const auto& entry : entries) {
        if (regex_search(entry.name, depthLikeRegex)) {
            return entry;
        }
    }

    return entries.front();
}

DecodedImage NpzImageLoader::load(istream& iStream, const fs::path&) const {
    char magic[4] = {};
    iStream.read(magic, sizeof(magic));
    if (!iStream || memcmp(magic, "PK\x03\x04", sizeof(magic)) != 0) {
        throw FormatNotSupported{"File is not a ZIP archive."};
    }

    iStream.clear();
    iStream.seekg(0);

    const vector<uint8_t> bytes = readAll(iStream);
    const vector<NpzEntry> entries = findNpzArrays(bytes);
    const NpzEntry& entry = selectNpzArray(entries);

    tlog::debug() << fmt::format("NPZ: {} arrays, selected '{}'", entries.size(), entry.name);

    try {
        DecodedImage result = decodeNpy(entry.data, entry.name);
        result.info.formatLabel = "NPZ";
        return result;
    } catch (const FormatNotSupported& e) {
        // The archive itself is valid, so a bad member must not send dispatch on to the next loader.
        throw FormatError{EFormatError::Malformed, fmt::format("NPZ member is not a NPY array: {}", e.what()), entry.name};
    }
}

} // namespace floatview
