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

#pragma once

#include <floatview/imageio/ImageLoader.h>

#include <string>
#include <vector>

namespace floatview {

struct ExrChannelSelection {
    // Channel names to decode, in output order. Names missing from the file (an RGB image's alpha) are filled with 1.
    std::vector<std::string> names;
    int numChannels() const { return (int)names.size(); }
};

// RGB(A) images become 4 channels, luminance- or red-only images 1 channel, anything else keeps its channel count.
ExrChannelSelection selectExrChannels(const std::vector<std::string>& available);

class ExrImageLoader : public ImageLoader {
public:
    DecodedImage load(std::istream& iStream, const fs::path& path) const override;

    std::string name() const override { return "OpenEXR"; }
};

} // namespace floatview
