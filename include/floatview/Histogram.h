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

#include <floatview/Lut.h>
#include <floatview/Normalization.h>
#include <floatview/SampleBuffer.h>
#include <floatview/Statistics.h>
#include <floatview/ToneMapper.h>

#include <array>
#include <memory>
#include <optional>
#include <utility>

namespace floatview {

enum EHistogramChannel {
    Red = 0,
    Green,
    Blue,
    Luminance,
    NumHistogramChannels,
};

static const int NUM_HISTOGRAM_BINS = 256;

struct BinStats {
    int minBin = 0;
    int maxBin = NUM_HISTOGRAM_BINS - 1;
    double meanBin = 0;
    uint64_t total = 0;
};

// Statistics of the original sample values, as opposed to bin indices.
struct ChannelStats {
    double min = 0;
    double max = 0;
    double mean = 0;
    uint64_t count = 0;
};

struct ValueRange {
    double min;
    double max;
    bool isFloat;
};

enum class EBinning {
    // bin = floor(normalized * 255)
    Direct,
    // bin = displayed byte, i.e. round(tone(normalized) * 255)
    Tone,
};

struct Histogram {
    std::array<std::array<uint32_t, NUM_HISTOGRAM_BINS>, NumHistogramChannels> counts = {};
    uint32_t nanCount = 0;

    // The normalization range samples were binned against.
    ValueRange valueRange = {0, 1, true};

    std::array<BinStats, NumHistogramChannels> binStats;
    std::array<ChannelStats, 3> channelStats;

    EBinning binning = EBinning::Direct;
    ToneSettings tone;

    uint64_t totalCount(EHistogramChannel channel) const;

    // Interval of original values that ends up in the given bin.
    std::pair<double, double> valueRangeOfBin(int bin) const;
};

struct HistogramOptions {
    NormalizationSettings normalization;
    ToneSettings tone;
    // In 24-bit mode, the statistics of the packed values.
    std::optional<Stats> stats;
    std::optional<double> typeMax;
    bool rgbAs24BitGrayscale = false;
};

// Bins raw samples by the value the renderer would display for them.
class HistogramEngine {
public:
    HistogramEngine(std::shared_ptr<LutCache> lutCache = nullptr);

    Histogram compute(const SampleBuffer& buffer, const HistogramOptions& options) const;

private:
    std::shared_ptr<LutCache> mLutCache;
};

} // namespace floatview
