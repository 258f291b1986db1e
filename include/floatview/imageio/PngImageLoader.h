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

namespace floatview {

// 8 and 16-bit PNGs. Samples are kept as stored; no color space conversion is applied.
class PngImageLoader : public ImageLoader {
public:
    DecodedImage load(std::istream& iStream, const fs::path& path) const override;

    std::string name() const override { return "PNG"; }
};

} // namespace floatview
