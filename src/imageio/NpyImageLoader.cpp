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

#include <floatview/imageio/Float16.h>
#include <floatview/imageio/NpyImageLoader.h>

#include <bit>
#include <cctype>
#include <cstring>
#include <regex>

using namespace std;

namespace floatview {

namespace {

struct NpyDtype {
    std::endian byteOrder;
    char typeCode;
    size_t itemSize;
};

NpyDtype parseDtype(const string& descr) {
    static const regex dtypeRegex{R"(^([<>=|]?)([fui])(\d+)$)"};

    smatch match;
    if (!regex_match(descr, match, dtypeRegex)) {
        throw FormatError{EFormatError::Unsupported, "Unsupported NPY dtype", descr};
    }

    NpyDtype dtype;
    dtype.byteOrder = match[1] == ">" ? endian::big : match[1] == "<" ? endian::little : endian::native;
    dtype.typeCode = match[2].str()[0];
    dtype.itemSize = stoul(match[3].str());

    const bool supported = dtype.typeCode == 'f' ? (dtype.itemSize == 2 || dtype.itemSize == 4 || dtype.itemSize == 8) :
                                                    (dtype.itemSize == 1 || dtype.itemSize == 2 || dtype.itemSize == 4 || dtype.itemSize == 8);
    if (!supported) {
        throw FormatError{EFormatError::Unsupported, "Unsupported NPY dtype", descr};
    }

    return dtype;
}

ESampleKind sampleKindOf(const NpyDtype& dtype) {
    if (dtype.typeCode == 'f') {
        switch (dtype.itemSize) {
            case 2: return ESampleKind::F16;
            case 4: return ESampleKind::F32;
            default: return ESampleKind::F64;
        }
    }

    switch (dtype.itemSize) {
        case 1: return ESampleKind::U8;
        case 2: return ESampleKind::U16;
        case 4: return ESampleKind::U32;
        default: return ESampleKind::U64;
    }
}

template <typename T> T readScalar(const uint8_t* p, bool swap) {
    T value;
    memcpy(&value, p, sizeof(T));
    return swap ? swapBytes(value) : value;
}

float readSample(const uint8_t* p, const NpyDtype& dtype) {
    const bool swap = dtype.itemSize > 1 && dtype.byteOrder != endian::native;
    if (dtype.typeCode == 'f') {
        switch (dtype.itemSize) {
            case 2: return halfToFloat(readScalar<uint16_t>(p, swap));
            case 4: return readScalar<float>(p, swap);
            default: return (float)readScalar<double>(p, swap);
        }
    }

    const bool isSigned = dtype.typeCode == 'i';
    switch (dtype.itemSize) {
        case 1: return isSigned ? (float)(int8_t)p[0] : (float)p[0];
        case 2: return isSigned ? (float)readScalar<int16_t>(p, swap) : (float)readScalar<uint16_t>(p, swap);
        case 4: return isSigned ? (float)readScalar<int32_t>(p, swap) : (float)readScalar<uint32_t>(p, swap);
        default: return isSigned ? (float)readScalar<int64_t>(p, swap) : (float)readScalar<uint64_t>(p, swap);
    }
}

vector<size_t> parseShape(const string& shapeText) {
    vector<size_t> dims;
    for (auto part : split(shapeText, ",")) {
        while (!part.empty() && isspace((unsigned char)part.front())) {
            part.remove_prefix(1);
        }
        while (!part.empty() && isspace((unsigned char)part.back())) {
            part.remove_suffix(1);
        }

        if (part.empty()) {
            continue;
        }

        try {
            size_t consumed = 0;
            const string token{part};
            dims.push_back(stoull(token, &consumed));
            if (consumed != token.size()) {
                throw FormatError{EFormatError::Malformed, "Invalid NPY shape", shapeText};
            }
        } catch (const logic_error&) { throw FormatError{EFormatError::Malformed, "Invalid NPY shape", shapeText}; }
    }

    return dims;
}

} // namespace

DecodedImage decodeNpy(span<const uint8_t> bytes, string_view arrayName) {
    static const uint8_t MAGIC[] = {0x93, 'N', 'U', 'M', 'P', 'Y'};
    if (bytes.size() < 10 || memcmp(bytes.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw ImageLoader::FormatNotSupported{"Invalid NPY magic string."};
    }

    const int major = bytes[6];
    const int minor = bytes[7];
    if (major != 1 && major != 2) {
        throw FormatError{EFormatError::Malformed, "Unsupported NPY version", fmt::format("{}.{}", major, minor)};
    }

    const size_t headerStart = major == 1 ? 10 : 12;
    if (bytes.size() < headerStart) {
        throw FormatError{EFormatError::Truncated, "NPY header ends early"};
    }

    const size_t headerLen = major == 1 ? readLe16(bytes.data() + 8) : readLe32(bytes.data() + 8);
    if (headerStart + headerLen > bytes.size()) {
        throw FormatError{EFormatError::Truncated, fmt::format("NPY header length {} exceeds file size {}", headerLen, bytes.size())};
    }

    const string header{reinterpret_cast<const char*>(bytes.data()) + headerStart, headerLen};

    static const regex descrRegex{R"('descr'\s*:\s*'([^']+)')"};
    static const regex shapeRegex{R"('shape'\s*:\s*\(([^)]*)\))"};
    static const regex fortranRegex{R"('fortran_order'\s*:\s*True)"};

    smatch descrMatch, shapeMatch;
    if (!regex_search(header, descrMatch, descrRegex)) {
        throw FormatError{EFormatError::Malformed, "NPY header is missing 'descr'", header};
    }

    if (!regex_search(header, shapeMatch, shapeRegex)) {
        throw FormatError{EFormatError::Malformed, "NPY header is missing 'shape'", header};
    }

    if (regex_search(header, fortranRegex)) {
        throw FormatError{EFormatError::Unsupported, "Fortran-ordered NPY arrays are not supported", header};
    }

    const string descr = descrMatch[1].str();
    const NpyDtype dtype = parseDtype(descr);

    const vector<size_t> dims = parseShape(shapeMatch[1].str());
    if (dims.size() != 2 && dims.size() != 3) {
        throw FormatError{EFormatError::Unsupported, fmt::format("Unsupported NPY dimensionality {}", dims.size()), shapeMatch[1].str()};
    }

    const size_t height = dims[0];
    const size_t width = dims[1];
    const size_t numChannels = dims.size() == 3 ? dims[2] : 1;
    if (width == 0 || height == 0 || width > INT32_MAX || height > INT32_MAX) {
        throw FormatError{EFormatError::Unsupported, "Unsupported NPY image size", shapeMatch[1].str()};
    }

    if (numChannels < 1 || numChannels > 4) {
        throw FormatError{EFormatError::Unsupported, fmt::format("Unsupported NPY channel count {}", numChannels), shapeMatch[1].str()};
    }

    const size_t payloadOffset = headerStart + headerLen;
    requirePayload({width, height, numChannels, dtype.itemSize}, bytes.size() - payloadOffset, "NPY");
    const size_t numSamples = width * height * numChannels;

    const ESampleKind kind = sampleKindOf(dtype);
    const bool isFloat = dtype.typeCode == 'f';
    const bool isSigned = dtype.typeCode == 'i';

    tlog::debug() << fmt::format("NPY header: version={}.{} dtype={} shape={}x{}x{}", major, minor, descr, height, width, numChannels);

    DecodedImage result{
        SampleBuffer{(int)width, (int)height, (int)numChannels, EPixelFormat::F32, kind, isSigned, isFloat},
        isFloat ? 1.0 : typeMaxFor(kind, isSigned),
        {},
    };

    auto dst = result.buffer.data<float>();
    const uint8_t* src = bytes.data() + payloadOffset;
    if (dtype.typeCode == 'f' && dtype.itemSize == 4 && dtype.byteOrder == endian::native) {
        memcpy(dst.data(), src, numSamples * sizeof(float));
    } else {
        for (size_t i = 0; i < numSamples; ++i) {
            dst[i] = readSample(src + i * dtype.itemSize, dtype);
        }
    }

    FormatInfo& info = result.info;
    info.formatLabel = "NPY";
    info.formatType = isFloat ? "npy-float" : isSigned ? "npy-int" : "npy-uint";
    info.width = (int)width;
    info.height = (int)height;
    info.samplesPerPixel = (int)numChannels;
    info.bitsPerSample = (int)dtype.itemSize * 8;
    info.sampleFormat = isFloat ? 3 : isSigned ? 2 : 1;
    info.dtype = descr;
    info.arrayName = arrayName;

    return result;
}

DecodedImage NpyImageLoader::load(istream& iStream, const fs::path&) const {
    char magic[6] = {};
    iStream.read(magic, sizeof(magic));
    if (!iStream || memcmp(magic, "\x93NUMPY", sizeof(magic)) != 0) {
        throw FormatNotSupported{"Invalid NPY magic string."};
    }

    iStream.clear();
    iStream.seekg(0);

    const vector<uint8_t> bytes = readAll(iStream);
    return decodeNpy(bytes);
}

} // namespace floatview
