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

#include <floatview/imageio/ExrImageLoader.h>
#include <floatview/imageio/ImageLoader.h>
#include <floatview/imageio/NpyImageLoader.h>
#include <floatview/imageio/NpzImageLoader.h>
#include <floatview/imageio/PfmImageLoader.h>
#include <floatview/imageio/PngImageLoader.h>
#include <floatview/imageio/PnmImageLoader.h>
#include <floatview/imageio/TiffImageLoader.h>

#include <fstream>
#include <iterator>
#include <limits>

using namespace std;

namespace floatview {

const vector<unique_ptr<ImageLoader>>& ImageLoader::getLoaders() {
    auto makeLoaders = [] {
        vector<unique_ptr<ImageLoader>> imageLoaders;
        imageLoaders.emplace_back(new ExrImageLoader());
        imageLoaders.emplace_back(new PfmImageLoader());
        imageLoaders.emplace_back(new NpyImageLoader());
        imageLoaders.emplace_back(new NpzImageLoader());
        // PNM must come after PFM: both start with 'P', but only PNM accepts a digit as the second character.
        imageLoaders.emplace_back(new PnmImageLoader());
        imageLoaders.emplace_back(new TiffImageLoader());
        imageLoaders.emplace_back(new PngImageLoader());
        return imageLoaders;
    };

    static const vector imageLoaders = makeLoaders();
    return imageLoaders;
}

DecodedImage loadImage(istream& iStream, const fs::path& path) {
    for (const auto& loader : ImageLoader::getLoaders()) {
        iStream.clear();
        iStream.seekg(0);

        try {
            DecodedImage result = loader->load(iStream, path);
            tlog::debug() << fmt::format(
                "Loaded {} via {}: {}x{}x{} {}",
                path,
                loader->name(),
                result.buffer.width(),
                result.buffer.height(),
                result.buffer.numChannels(),
                toString(result.buffer.sampleKind(), result.buffer.isSigned())
            );

            return result;
        } catch (const ImageLoader::FormatNotSupported& e) {
            tlog::debug() << fmt::format("{} is not a {} image: {}", path, loader->name(), e.what());
        }
    }

    throw FormatError{EFormatError::Unsupported, fmt::format("No loader accepts {}", path), path.extension().string()};
}

DecodedImage loadImage(const fs::path& path) {
    ifstream f{path, ios_base::in | ios_base::binary};
    if (!f) {
        throw ImageLoadError{fmt::format("Could not open {}", path)};
    }

    return loadImage(f, path);
}

vector<uint8_t> readAll(istream& iStream) {
    return vector<uint8_t>{istreambuf_iterator<char>{iStream}, istreambuf_iterator<char>{}};
}

size_t requirePayload(initializer_list<size_t> factors, size_t available, string_view what) {
    size_t needed = 1;
    for (size_t f : factors) {
        if (f != 0 && needed > numeric_limits<size_t>::max() / f) {
            throw FormatError{EFormatError::Truncated, fmt::format("{} payload size exceeds the addressable range", what)};
        }

        needed *= f;
    }

    if (available < needed) {
        throw FormatError{EFormatError::Truncated, fmt::format("Not sufficient bytes to read {} payload ({} vs {})", what, available, needed)};
    }

    return needed;
}

} // namespace floatview
