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

#include <floatview/Colormap.h>
#include <floatview/Normalization.h>

#include <limits>

using namespace std;

namespace floatview {

namespace {
using ControlPoint = array<double, 3>;

uint8_t toByte(double v) { return (uint8_t)round(v * 255.0); }

template <typename F> ColormapTable generate(F colorAt) {
    ColormapTable result;
    for (int i = 0; i < 256; ++i) {
        auto [r, g, b] = colorAt(i / 255.0);
        result[i] = {toByte(r), toByte(g), toByte(b)};
    }

    return result;
}

ColormapTable interpolate(const vector<ControlPoint>& points) {
    const size_t n = points.size();
    ColormapTable result;
    for (int i = 0; i < 256; ++i) {
        const double pos = (i / 255.0) * (n - 1);
        const size_t idx = (size_t)floor(pos);
        const double frac = pos - idx;

        const ControlPoint& a = points[min(idx, n - 1)];
        const ControlPoint& b = points[min(idx + 1, n - 1)];
        for (int c = 0; c < 3; ++c) {
            result[i][c] = toByte(a[c] * (1 - frac) + b[c] * frac);
        }
    }

    return result;
}

ColormapTable jet() {
    return generate([](double v) -> ControlPoint {
        if (v < 0.125) {
            return {0, 0, 0.5 + v * 4};
        } else if (v < 0.375) {
            return {0, (v - 0.125) * 4, 1};
        } else if (v < 0.625) {
            return {(v - 0.375) * 4, 1, 1 - (v - 0.375) * 4};
        } else if (v < 0.875) {
            return {1, 1 - (v - 0.625) * 4, 0};
        } else {
            return {1 - (v - 0.875) * 4, 0, 0};
        }
    });
}

ColormapTable hot() {
    return generate([](double v) -> ControlPoint {
        if (v < 0.33) {
            return {v / 0.33, 0, 0};
        } else if (v < 0.66) {
            return {1, (v - 0.33) / 0.33, 0};
        } else {
            return {1, 1, (v - 0.66) / 0.34};
        }
    });
}

// Sampled from the matplotlib colormaps.
const vector<ControlPoint> VIRIDIS = {
    {0.267004, 0.004874, 0.329415},
    {0.282623, 0.140926, 0.457517},
    {0.253935, 0.265254, 0.529983},
    {0.206756, 0.371758, 0.553117},
    {0.163625, 0.471133, 0.558148},
    {0.127568, 0.566949, 0.550556},
    {0.134692, 0.658636, 0.517649},
    {0.266941, 0.748751, 0.440573},
    {0.477504, 0.821444, 0.318195},
    {0.741388, 0.873449, 0.149561},
    {0.993248, 0.906157, 0.143936},
};

const vector<ControlPoint> PLASMA = {
    {0.050383, 0.029803, 0.527975},
    {0.287076, 0.010384, 0.627010},
    {0.476230, 0.011158, 0.657865},
    {0.647257, 0.125289, 0.593542},
    {0.785914, 0.274290, 0.472908},
    {0.877850, 0.439704, 0.345067},
    {0.936213, 0.605205, 0.231465},
    {0.972355, 0.771125, 0.155626},
    {0.994617, 0.938336, 0.165141},
    {0.987053, 0.991438, 0.749504},
};

const vector<ControlPoint> INFERNO = {
    {0.001462, 0.000466, 0.013866},
    {0.094329, 0.042852, 0.225802},
    {0.239903, 0.067979, 0.343397},
    {0.412470, 0.102815, 0.380271},
    {0.591217, 0.155410, 0.347824},
    {0.758643, 0.237267, 0.275196},
    {0.889650, 0.360829, 0.210001},
    {0.969788, 0.514135, 0.186861},
    {0.994738, 0.683489, 0.240902},
    {0.988362, 0.998364, 0.644924},
};

const vector<ControlPoint> MAGMA = {
    {0.001462, 0.000466, 0.013866},
    {0.091904, 0.051667, 0.200303},
    {0.234547, 0.090739, 0.348341},
    {0.408198, 0.131574, 0.416555},
    {0.595732, 0.180653, 0.421399},
    {0.776405, 0.266630, 0.373397},
    {0.924010, 0.406370, 0.330720},
    {0.987622, 0.583041, 0.382914},
    {0.996212, 0.771453, 0.543135},
    {0.987053, 0.991438, 0.749504},
};

const vector<ControlPoint> TURBO = {
    {0.18995, 0.07176, 0.23217},
    {0.25107, 0.25237, 0.63374},
    {0.19659, 0.47276, 0.82300},
    {0.12756, 0.66813, 0.82565},
    {0.13094, 0.82030, 0.65899},
    {0.37408, 0.92478, 0.41642},
    {0.66987, 0.95987, 0.19659},
    {0.90842, 0.87640, 0.10899},
    {0.98999, 0.64450, 0.03932},
    {0.93702, 0.25023, 0.01583},
};
} // namespace

ColormapConverter::ColormapConverter() {
    mColormaps["gray"] = generate([](double v) -> ControlPoint { return {v, v, v}; });
    mColormaps["jet"] = jet();
    mColormaps["hot"] = hot();
    mColormaps["cool"] = generate([](double v) -> ControlPoint { return {v, 1 - v, 1}; });
    mColormaps["viridis"] = interpolate(VIRIDIS);
    mColormaps["plasma"] = interpolate(PLASMA);
    mColormaps["inferno"] = interpolate(INFERNO);
    mColormaps["magma"] = interpolate(MAGMA);
    mColormaps["turbo"] = interpolate(TURBO);
}

const ColormapTable& ColormapConverter::colormap(const string& name) const {
    auto it = mColormaps.find(name);
    if (it == mColormaps.end()) {
        throw invalid_argument{fmt::format("Unknown colormap: {}", name)};
    }

    return it->second;
}

vector<string> ColormapConverter::names() const {
    vector<string> result;
    for (const auto& [name, _] : mColormaps) {
        result.emplace_back(name);
    }

    return result;
}

int ColormapConverter::findClosestIndex(const ColormapTable& table, uint8_t r, uint8_t g, uint8_t b) {
    int closest = 0;
    int minDistance = numeric_limits<int>::max();

    // Squared distances preserve the ordering of Euclidean ones.
    for (int i = 0; i < (int)table.size(); ++i) {
        const int dr = r - table[i][0];
        const int dg = g - table[i][1];
        const int db = b - table[i][2];
        const int distance = dr * dr + dg * dg + db * db;
        if (distance < minDistance) {
            minDistance = distance;
            closest = i;
        }
    }

    return closest;
}

SampleBuffer ColormapConverter::convertToFloat(
    const RGBA8Buffer& image, const string& name, double min, double max, bool inverted, bool logarithmic
) const {
    const ColormapTable& table = colormap(name);

    SampleBuffer result{image.width, image.height, 1, EPixelFormat::F32, ESampleKind::F32, false, true};
    auto data = result.data<float>();

    for (size_t i = 0; i < data.size(); ++i) {
        const uint8_t* px = image.data.data() + i * 4;
        int index = findClosestIndex(table, px[0], px[1], px[2]);
        if (inverted) {
            index = 255 - index;
        }

        const double t = index / 255.0;
        data[i] = (float)(logarithmic ? logMap(t, min, max) : linearMap(t, min, max));
    }

    tlog::debug() << fmt::format(
        "Converted {}x{} {} image to float [{}, {}]{}{}",
        image.width,
        image.height,
        name,
        min,
        max,
        inverted ? " inverted" : "",
        logarithmic ? " log" : ""
    );

    return result;
}

} // namespace floatview
