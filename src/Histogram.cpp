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

#include <floatview/Histogram.h>
#include <floatview/ImageRenderer.h>

#include <limits>

using namespace std;

namespace floatview {

namespace {
int directBin(double value, const NormRange& range) {
    const double bin = floor(range.normalize(value) * 255.0);
    if (std::isnan(bin)) {
        return 0;
    }

    return (int)std::clamp(bin, 0.0, 255.0);
}

int toneBin(double value, const NormRange& range, const ToneSettings& tone) {
    const double displayed = applyTone(clamp01(range.normalize(value)), tone);
    if (std::isnan(displayed)) {
        return 0;
    }

    return (int)round(clamp01(displayed) * 255.0);
}

BinStats computeBinStats(const array<uint32_t, NUM_HISTOGRAM_BINS>& counts) {
    BinStats result;

    for (int i = 0; i < NUM_HISTOGRAM_BINS; ++i) {
        if (counts[i] > 0) {
            result.minBin = i;
            break;
        }
    }

    for (int i = NUM_HISTOGRAM_BINS - 1; i >= 0; --i) {
        if (counts[i] > 0) {
            result.maxBin = i;
            break;
        }
    }

    double sum = 0;
    for (int i = 0; i < NUM_HISTOGRAM_BINS; ++i) {
        sum += (double)i * counts[i];
        result.total += counts[i];
    }

    result.meanBin = result.total > 0 ? sum / result.total : 0;
    return result;
}

class Accumulator {
public:
    Accumulator(Histogram& histogram) : mHistogram{histogram} {
        for (auto& stats : mValueStats) {
            stats = {numeric_limits<double>::infinity(), -numeric_limits<double>::infinity(), 0, 0};
        }
    }

    void add(const array<int, 3>& bins, const array<double, 3>& values) {
        for (int c = 0; c < 3; ++c) {
            ++mHistogram.counts[c][bins[c]];

            ChannelStats& stats = mValueStats[c];
            stats.min = std::min(stats.min, values[c]);
            stats.max = std::max(stats.max, values[c]);
            stats.mean += values[c];
            ++stats.count;
        }

        // Luminance of the already binned channels
        const int lum = (int)round(0.299 * bins[0] + 0.587 * bins[1] + 0.114 * bins[2]);
        ++mHistogram.counts[Luminance][std::clamp(lum, 0, NUM_HISTOGRAM_BINS - 1)];
    }

    void addNan() { ++mHistogram.nanCount; }

    void finish() {
        for (int c = 0; c < NumHistogramChannels; ++c) {
            mHistogram.binStats[c] = computeBinStats(mHistogram.counts[c]);
        }

        for (int c = 0; c < 3; ++c) {
            ChannelStats stats = mValueStats[c];
            if (stats.count > 0) {
                stats.mean /= stats.count;
            } else {
                stats = {};
            }

            mHistogram.channelStats[c] = stats;
        }
    }

private:
    Histogram& mHistogram;
    array<ChannelStats, 3> mValueStats;
};

// Bins every pixel of `buffer` whose color channels are finite. `binOf` maps a raw sample index to its bin.
template <typename BinOf> void accumulatePixels(Accumulator& acc, const SampleBuffer& buffer, BinOf binOf) {
    const int nChannels = buffer.numChannels();
    const int nColorChannels = min(nChannels, 3);

    for (size_t i = 0; i < buffer.numPixels(); ++i) {
        const size_t base = i * nChannels;

        bool finite = true;
        for (int c = 0; c < nColorChannels; ++c) {
            finite = finite && isfinite(buffer.at(base + c));
        }

        if (!finite) {
            acc.addNan();
            continue;
        }

        if (nColorChannels < 3) {
            const int bin = binOf(base);
            const double value = buffer.at(base);
            acc.add({bin, bin, bin}, {value, value, value});
        } else {
            acc.add({binOf(base), binOf(base + 1), binOf(base + 2)}, {buffer.at(base), buffer.at(base + 1), buffer.at(base + 2)});
        }
    }
}
} // namespace

uint64_t Histogram::totalCount(EHistogramChannel channel) const {
    uint64_t result = 0;
    for (uint32_t count : counts[channel]) {
        result += count;
    }

    return result;
}

pair<double, double> Histogram::valueRangeOfBin(int bin) const {
    bin = std::clamp(bin, 0, NUM_HISTOGRAM_BINS - 1);
    const NormRange range{valueRange.min, valueRange.max};

    double lo, hi;
    if (binning == EBinning::Direct) {
        lo = bin / 255.0;
        hi = (bin + 1) / 255.0;
    } else {
        // Displayed bytes are rounded, so a bin covers half a step to either side.
        lo = invertTone(clamp01((bin - 0.5) / 255.0), tone);
        hi = invertTone(clamp01((bin + 0.5) / 255.0), tone);
    }

    return {linearMap(clamp01(lo), range.min, range.max), linearMap(clamp01(hi), range.min, range.max)};
}

HistogramEngine::HistogramEngine(shared_ptr<LutCache> lutCache) : mLutCache{lutCache ? std::move(lutCache) : make_shared<LutCache>()} {}

Histogram HistogramEngine::compute(const SampleBuffer& buffer, const HistogramOptions& options) const {
    Histogram result;
    Accumulator acc{result};

    const double typeMax = resolveTypeMax(buffer, options.typeMax);
    const int nChannels = buffer.numChannels();
    const bool useTone = options.normalization.gammaMode && !options.tone.isIdentity();

    if (chooseRenderPath(options.normalization, options.tone, options.rgbAs24BitGrayscale, nChannels) == ERenderPath::Packed24Bit) {
        const NormRange range = resolveRange(options.normalization, options.stats, MAX_24BIT, false);
        result.valueRange = {range.min, range.max, false};
        result.binning = useTone ? EBinning::Tone : EBinning::Direct;
        result.tone = options.tone;

        tlog::debug() << fmt::format("Histogram via 24-bit path, range [{}, {}]", range.min, range.max);

        for (size_t i = 0; i < buffer.numPixels(); ++i) {
            uint32_t combined;
            if (!combine24Bit(buffer, i, typeMax, combined)) {
                acc.addNan();
                continue;
            }

            const int bin = useTone ? toneBin(combined, range, options.tone) : directBin(combined, range);
            acc.add({bin, bin, bin}, {(double)combined, (double)combined, (double)combined});
        }

        acc.finish();
        return result;
    }

    const NormRange range = resolveRange(options.normalization, options.stats, typeMax, buffer.isFloat());
    result.valueRange = {range.min, range.max, buffer.isFloat()};
    result.binning = useTone ? EBinning::Tone : EBinning::Direct;
    result.tone = options.tone;

    tlog::debug() << fmt::format(
        "Histogram of {}x{}x{} via {} path, range [{}, {}]",
        buffer.width(),
        buffer.height(),
        nChannels,
        useTone ? "LUT" : "direct",
        range.min,
        range.max
    );

    // Bins mirror the renderer's path choice.
    if (!useTone) {
        accumulatePixels(acc, buffer, [&](size_t i) { return directBin(buffer.at(i), range); });
    } else if (buffer.pixelFormat() == EPixelFormat::U8) {
        const auto lut = mLutCache->get(options.tone, range, 256);
        auto data = buffer.data<uint8_t>();
        accumulatePixels(acc, buffer, [&](size_t i) { return (int)(*lut)[data[i]]; });
    } else if (buffer.pixelFormat() == EPixelFormat::U16) {
        const auto lut = mLutCache->get(options.tone, range, 65536);
        auto data = buffer.data<uint16_t>();
        accumulatePixels(acc, buffer, [&](size_t i) { return (int)(*lut)[data[i]]; });
    } else {
        const auto lut = mLutCache->get(options.tone, {0.0, (double)(FLOAT_LUT_SIZE - 1)}, FLOAT_LUT_SIZE);
        auto data = buffer.data<float>();
        accumulatePixels(acc, buffer, [&](size_t i) { return (int)(*lut)[quantizeFloat(data[i], range)]; });
    }

    acc.finish();
    return result;
}

} // namespace floatview
