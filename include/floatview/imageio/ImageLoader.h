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

#include <floatview/Common.h>
#include <floatview/SampleBuffer.h>

#include <initializer_list>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace floatview {

class ImageLoader {
public:
    // Thrown when the bytes are not in the loader's format at all. Load dispatch catches this and moves on to the next loader; any
    // other FormatError aborts the load.
    class FormatNotSupported : public FormatError {
    public:
        FormatNotSupported(const std::string& message, std::string_view token = {}) : FormatError{EFormatError::BadMagic, message, token} {}
    };

    virtual ~ImageLoader() {}

    virtual DecodedImage load(std::istream& iStream, const fs::path& path) const = 0;

    virtual std::string name() const = 0;

    static const std::vector<std::unique_ptr<ImageLoader>>& getLoaders();
};

// Tries every registered loader in order and returns the first successful decode.
DecodedImage loadImage(std::istream& iStream, const fs::path& path);
DecodedImage loadImage(const fs::path& path);

// Reads the remainder of the stream into memory.
std::vector<uint8_t> readAll(std::istream& iStream);

// Byte size of a payload that is the product of `factors` (e.g. width, height, channels and bytes per sample). Throws a Truncated
// FormatError if the payload does not fit into `available` bytes, including when the product overflows size_t.
size_t requirePayload(std::initializer_list<size_t> factors, size_t available, std::string_view what);

// Little-endian readers over an in-memory byte range. Callers are responsible for bounds checks.
inline uint16_t readLe16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
inline uint32_t readLe32(const uint8_t* p) { return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24); }

} // namespace floatview
