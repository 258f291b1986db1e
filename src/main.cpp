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

#include <floatview/Common.h>
#include <floatview/ImageSession.h>
#include <floatview/imageio/ImageLoader.h>
#include <floatview/imageio/PngImageSaver.h>

#include <args.hxx>

#include <charconv>
#include <iostream>

using namespace args;
using namespace std;

namespace floatview {

static pair<int, int> parsePixelCoordinates(string_view text) {
    const auto parts = split(text, ",");
    if (parts.size() != 2) {
        throw invalid_argument{fmt::format("Pixel coordinates must have the format 'x,y', got '{}'.", text)};
    }

    int coords[2];
    for (int i = 0; i < 2; ++i) {
        const auto [ptr, ec] = from_chars(parts[i].data(), parts[i].data() + parts[i].size(), coords[i]);
        if (ec != errc{} || ptr != parts[i].data() + parts[i].size()) {
            throw invalid_argument{fmt::format("Invalid pixel coordinate '{}'.", parts[i])};
        }
    }

    return {coords[0], coords[1]};
}

static void printHistogram(const Histogram& histogram) {
    static const char* channelNames[] = {"R", "G", "B", "L"};

    tlog::info() << fmt::format(
        "Histogram range [{}, {}] ({}), NaN pixels: {}",
        histogram.valueRange.min,
        histogram.valueRange.max,
        histogram.valueRange.isFloat ? "float" : "integer",
        histogram.nanCount
    );

    for (int c = 0; c < NumHistogramChannels; ++c) {
        const BinStats& bins = histogram.binStats[c];
        string line = fmt::format("  {}: bins {}..{} mean {:.2f} total {}", channelNames[c], bins.minBin, bins.maxBin, bins.meanBin, bins.total);

        if (c < 3) {
            const ChannelStats& values = histogram.channelStats[c];
            line += fmt::format(
                " | values {}..{} mean {}", toPrecision(values.min, 6), toPrecision(values.max, 6), toPrecision(values.mean, 6)
            );
        }

        tlog::info() << line;
    }
}

static int mainFunc(const vector<string>& arguments) {
    ArgumentParser parser{
        "floatview -- the float image viewer\n"
        "version " FLOATVIEW_VERSION
        "\n"
        "Decodes scientific and HDR images and renders them to 8-bit PNGs",
        "floatview is available under the GPLv3 License.",
    };

    Flag autoFlag{
        parser,
        "AUTO",
        "Stretch the observed finite min/max of the image to the display range. Default for float images.",
        {"auto"},
    };

    ValueFlag<float> exposureFlag{
        parser,
        "EXPOSURE",
        "Scales the normalized value by 2^EXPOSURE in gamma mode. Default is 0.",
        {"exposure"},
    };

    Flag flipYFlag{
        parser,
        "FLIP Y",
        "Flip the rendered image vertically.",
        {"flip-y"},
    };

    ValueFlag<float> gammaInFlag{
        parser,
        "GAMMA IN",
        "Input gamma, removed before exposure is applied. Default is 1.",
        {"gamma-in"},
    };

    Flag gammaModeFlag{
        parser,
        "GAMMA MODE",
        "Display the full native range of the image and apply gamma and exposure. Default for integer images.",
        {"gamma-mode"},
    };

    ValueFlag<float> gammaOutFlag{
        parser,
        "GAMMA OUT",
        "Output gamma, applied after exposure. Default is 1.",
        {"gamma-out"},
    };

    HelpFlag helpFlag{
        parser,
        "HELP",
        "Display this help menu.",
        {'h', "help"},
    };

    Flag histogramFlag{
        parser,
        "HISTOGRAM",
        "Print histogram statistics of the displayed values.",
        {"histogram"},
    };

    ValueFlag<string> maskFlag{
        parser,
        "MASK",
        "Image whose first channel decides which pixels to filter out.",
        {"mask"},
    };

    Flag maskHigherFlag{
        parser,
        "MASK HIGHER",
        "Filter out pixels whose mask value is above the threshold instead of below it.",
        {"mask-higher"},
    };

    ValueFlag<double> maskThresholdFlag{
        parser,
        "MASK THRESHOLD",
        "Threshold applied to the mask. Default is 0.",
        {"mask-threshold"},
    };

    ValueFlag<double> maxFlag{
        parser,
        "MAX",
        "Upper bound of the manual display range.",
        {"max"},
    };

    ValueFlag<double> minFlag{
        parser,
        "MIN",
        "Lower bound of the manual display range.",
        {"min"},
    };

    ValueFlag<string> nanColorFlag{
        parser,
        "NAN COLOR",
        "Color of pixels with non-finite values: black or fuchsia. Default is black.",
        {"nan-color"},
    };

    Flag normalizedFloatFlag{
        parser,
        "NORMALIZED FLOAT",
        "Interpret the manual range of integer images as a fraction of their full-scale value.",
        {"normalized-float"},
    };

    ValueFlag<string> outputFlag{
        parser,
        "OUTPUT",
        "Render the image and write it to this PNG file.",
        {'o', "output"},
    };

    ValueFlag<string> pixelFlag{
        parser,
        "PIXEL",
        "Print the value of the pixel at 'x,y'.",
        {"pixel"},
    };

    Flag rgb24Flag{
        parser,
        "RGB24",
        "Interpret RGB channels as one packed 24-bit integer.",
        {"rgb24"},
    };

    ValueFlag<double> scale24Flag{
        parser,
        "SCALE24",
        "Divisor of packed 24-bit values in pixel readouts. Default is 1000.",
        {"scale24"},
    };

    Flag verboseFlag{
        parser,
        "VERBOSE",
        "Verbose log output.",
        {'v', "verbose"},
    };

    Flag versionFlag{
        parser,
        "VERSION",
        "Display the version of floatview.",
        {"version"},
    };

    Positional<string> imageFile{
        parser,
        "image",
        "The image file to decode.",
    };

    // Parse command line arguments and react to parsing errors using exceptions.
    try {
        FLOATVIEW_ASSERT(arguments.size() > 0, "Number of arguments must be bigger than 0.");

        parser.Prog(arguments.front());
        parser.ParseArgs(begin(arguments) + 1, end(arguments));
    } catch (const Help&) {
        cout << parser;
        return 0;
    } catch (const ParseError& e) {
        cerr << e.what() << endl;
        return -1;
    } catch (const ValidationError& e) {
        cerr << e.what() << endl;
        return -2;
    }

    if (verboseFlag) {
        tlog::Logger::global()->showSeverity(tlog::ESeverity::Debug);
    }

    if (versionFlag) {
        tlog::none() << "floatview -- the float image viewer\nversion " FLOATVIEW_VERSION;
        return 0;
    }

    if (!imageFile) {
        tlog::error() << "No image file given.";
        return -3;
    }

    const fs::path imagePath = get(imageFile);

    ImageSession session;
    try {
        session.load(imagePath);
    } catch (const ImageLoadError& e) {
        tlog::error() << fmt::format("Could not load {}: {}", imagePath, e.what());
        return 1;
    }

    const DecodedImage& image = *session.image();
    const FormatInfo& info = image.info;
    tlog::info() << fmt::format(
        "{}: {} {}x{}, {} channel(s), {} bits, {}",
        imagePath,
        info.formatLabel,
        info.width,
        info.height,
        info.samplesPerPixel,
        info.bitsPerSample,
        toString(image.buffer.sampleKind(), image.buffer.isSigned())
    );

    if (!info.dtype.empty()) {
        tlog::info() << fmt::format("dtype {}{}", info.dtype, info.arrayName.empty() ? "" : fmt::format(", array '{}'", info.arrayName));
    }

    // Start from the per-format defaults and override whatever was given on the command line.
    ViewSettings settings = session.settings();

    if (autoFlag || gammaModeFlag || minFlag || maxFlag) {
        settings.normalization.autoNormalize = autoFlag;
        settings.normalization.gammaMode = gammaModeFlag;
    }

    if (minFlag) {
        settings.normalization.min = get(minFlag);
    }

    if (maxFlag) {
        settings.normalization.max = get(maxFlag);
    }

    if ((minFlag || maxFlag) && !settings.normalization.hasManualRange()) {
        tlog::warning() << "A manual range needs both --min and --max. Falling back to the full native range.";
    }

    settings.normalization.normalizedFloatMode = normalizedFloatFlag;

    if (gammaInFlag) {
        settings.tone.gammaIn = get(gammaInFlag);
    }

    if (gammaOutFlag) {
        settings.tone.gammaOut = get(gammaOutFlag);
    }

    if (exposureFlag) {
        settings.tone.exposureStops = get(exposureFlag);
    }

    settings.rgbAs24BitGrayscale = rgb24Flag;
    if (scale24Flag) {
        settings.scale24BitFactor = get(scale24Flag);
    }

    try {
        if (nanColorFlag) {
            settings.nanColor = toNanColor(get(nanColorFlag));
        }

        if (maskFlag) {
            MaskFilter mask;
            mask.mask = make_shared<const DecodedImage>(loadImage(fs::path{get(maskFlag)}));
            mask.threshold = maskThresholdFlag ? get(maskThresholdFlag) : 0.0;
            mask.filterHigher = maskHigherFlag;
            settings.masks.emplace_back(std::move(mask));
        }

        session.updateSettings(std::move(settings));
    } catch (const SettingsError& e) {
        tlog::error() << e.what();
        return -2;
    } catch (const ImageLoadError& e) {
        tlog::error() << fmt::format("Could not load mask: {}", e.what());
        return 1;
    }

    if (auto stats = session.stats()) {
        tlog::info() << fmt::format("Finite range: [{}, {}]", toPrecision(stats->min, 6), toPrecision(stats->max, 6));
    } else {
        tlog::warning() << "Image contains no finite samples.";
    }

    if (pixelFlag) {
        try {
            auto [x, y] = parsePixelCoordinates(get(pixelFlag));
            tlog::info() << fmt::format("Pixel ({}, {}): {}", x, y, session.pixelValue(x, y));
        } catch (const invalid_argument& e) {
            tlog::error() << e.what();
            return -2;
        }
    }

    if (histogramFlag) {
        printHistogram(session.histogram());
    }

    if (outputFlag) {
        const RGBA8Buffer raster = session.render(flipYFlag);
        try {
            PngImageSaver{}.save(fs::path{get(outputFlag)}, raster.data, raster.width, raster.height, 4);
        } catch (const ImageSaveError& e) {
            tlog::error() << fmt::format("Could not save {}: {}", get(outputFlag), e.what());
            return 1;
        }
    }

    return 0;
}

} // namespace floatview

int main(int argc, char* argv[]) {
    try {
        vector<string> arguments;
        for (int i = 0; i < argc; ++i) {
            arguments.emplace_back(argv[i]);
        }

        return floatview::mainFunc(arguments);
    } catch (const exception& e) {
        tlog::error() << fmt::format("Uncaught exception: {}", e.what());
        return 1;
    }
}
