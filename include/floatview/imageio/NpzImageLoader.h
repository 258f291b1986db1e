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

#include <span>
#include <string>
#include <vector>

namespace floatview {

struct NpzEntry {
    std::string name;
    std::span<const uint8_t> data;
};

// Lists the stored (uncompressed) .npy members of a ZIP archive, in archive order. Compressed members are skipped.
std::vector<NpzEntry> findNpzArrays(std::span<const uint8_t> bytes);

// Picks the member that most likely holds depth-like data: the first whose name matches depth|dispar|inv|z|range, else the first one.
const NpzEntry& selectNpzArray(const std::vector<NpzEntry>& entries);

class NpzImageLoader : public ImageLoader {
public:
    DecodedImage load(std::istream& iStream, const fs::path& path) const override;

    std::string name() const override { return "NPZ"; }
};

} // namespace floatview
