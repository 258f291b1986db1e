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

#include <Iex.h>
#include <ImfChannelList.h>
#include <ImfFrameBuffer.h>
#include <ImfInputFile.h>
#include <ImfIO.h>

#include <algorithm>
#include <istream>

#include <errno.h>

using namespace std;

namespace floatview {

class StdIStream : public Imf::IStream {
public:
    StdIStream(istream& stream, const char fileName[]) : Imf::IStream{fileName}, mStream{stream} {}

    bool read(char c[/*n*/], int n) override {
        if (!mStream) {
            throw IEX_NAMESPACE::InputExc("Unexpected end of file.");
        }

        clearError();
        mStream.read(c, n);
        return checkError(mStream, n);
    }

    uint64_t tellg() override { return streamoff(mStream.tellg()); }

    void seekg(uint64_t pos) override {
        mStream.seekg(pos);
        checkError(mStream);
    }

    void clear() override { mStream.clear(); }

private:
    // Error checking mirrors OpenEXR's own StdIFStream
    static void clearError() { errno = 0; }

    static bool checkError(istream& is, streamsize expected = 0) {
        if (!is) {
            if (errno) {
                IEX_NAMESPACE::throwErrnoExc();
            }

            if (is.gcount() < expected) {
                THROW(IEX_NAMESPACE::InputExc, "Early end of file: read " << is.gcount() << " out of " << expected << " requested bytes.");
            }

            return false;
        }

        return true;
    }

    istream& mStream;
};

static bool isExrImage(istream& iStream) {
    char b[4];
    iStream.read(b, sizeof(b));

    bool result = !!iStream && iStream.gcount() == sizeof(b) && b[0] == 0x76 && b[1] == 0x2f && b[2] == 0x31 && b[3] == 0x01;

    iStream.clear();
    iStream.seekg(0);
    return result;
}

ExrChannelSelection selectExrChannels(const vector<string>& available) {
    auto has = [&](const char* name) { return find(available.begin(), available.end(), name) != available.end(); };

    if (has("R") && has("G") && has("B")) {
        return {{"R", "G", "B", "A"}};
    } else if (has("Y")) {
        return has("A") ? ExrChannelSelection{{"Y", "A"}} : ExrChannelSelection{{"Y"}};
    } else if (has("R")) {
        return {{"R"}};
    }

    if (available.empty() || available.size() > 4) {
        throw FormatError{EFormatError::Unsupported, "Unsupported EXR channel layout", join(available, ",")};
    }

    return {available};
}

DecodedImage ExrImageLoader::load(istream& iStream, const fs::path& path) const {
    if (!isExrImage(iStream)) {
        throw FormatNotSupported{"File is not an EXR image."};
    }

    try {
        StdIStream stdIStream{iStream, path.string().c_str()};
        Imf::InputFile file{stdIStream};

        const Imf::Header& header = file.header();
        const Imath::Box2i dataWindow = header.dataWindow();
        const int width = dataWindow.max.x - dataWindow.min.x + 1;
        const int height = dataWindow.max.y - dataWindow.min.y + 1;
        if (width <= 0 || height <= 0) {
            throw FormatError{EFormatError::Malformed, "EXR image has an empty data window"};
        }

        vector<string> available;
        bool allHalf = true;
        for (auto c = header.channels().begin(); c != header.channels().end(); ++c) {
            available.emplace_back(c.name());
        }

        const ExrChannelSelection selection = selectExrChannels(available);
        const int numChannels = selection.numChannels();

        for (const auto& name : selection.names) {
            const Imf::Channel* channel = header.channels().findChannel(name);
            if (!channel) {
                continue;
            }

            if (channel->xSampling != 1 || channel->ySampling != 1) {
                throw FormatError{EFormatError::Unsupported, "Subsampled EXR channels are not supported", name};
            }

            allHalf = allHalf && channel->type == Imf::HALF;
        }

        tlog::debug() << fmt::format(
            "EXR info: size={}x{} channels={} storage={}", width, height, join(selection.names, ","), allHalf ? "half" : "float"
        );

        DecodedImage result{
            SampleBuffer{width, height, numChannels, EPixelFormat::F32, allHalf ? ESampleKind::F16 : ESampleKind::F32, false, true},
            1.0,
            {},
        };

        // OpenEXR converts half and uint channels to float while filling the frame buffer, and missing channels get the fill value.
        float* data = result.buffer.data<float>().data();
        const size_t xStride = sizeof(float) * numChannels;
        const size_t yStride = xStride * width;
        const ptrdiff_t originOffset = -((ptrdiff_t)dataWindow.min.x * (ptrdiff_t)xStride + (ptrdiff_t)dataWindow.min.y * (ptrdiff_t)yStride);

        Imf::FrameBuffer frameBuffer;
        for (int c = 0; c < numChannels; ++c) {
            const string& name = selection.names[c];
            frameBuffer.insert(
                name.c_str(),
                Imf::Slice(Imf::FLOAT, reinterpret_cast<char*>(data + c) + originOffset, xStride, yStride, 1, 1, name == "A" ? 1.0 : 0.0)
            );
        }

        file.setFrameBuffer(frameBuffer);
        // Rows arrive in top-down order regardless of the file's line order, which is already our buffer layout.
        file.readPixels(dataWindow.min.y, dataWindow.max.y);

        FormatInfo& info = result.info;
        info.formatLabel = "EXR";
        info.formatType = "exr-float";
        info.width = width;
        info.height = height;
        info.samplesPerPixel = numChannels;
        info.bitsPerSample = allHalf ? 16 : 32;
        info.sampleFormat = 3;

        return result;
    } catch (const Iex::BaseExc& e) {
        // Translate OpenEXR errors to our own error type
        throw FormatError{EFormatError::Malformed, e.what()};
    }
}

} // namespace floatview
