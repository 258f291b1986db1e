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

#include <floatview/Lut.h>

using namespace std;

namespace floatview {

shared_ptr<const Lut> Lut::build(const ToneSettings& tone, const NormRange& range, size_t domainSize) {
    vector<uint8_t> entries(domainSize);
    const double invRange = range.invRange();
    const bool identity = tone.isIdentity();

    for (size_t i = 0; i < domainSize; ++i) {
        const double normalized = clamp01((i - range.min) * invRange);
        const double displayed = identity ? normalized : applyTone(normalized, tone);
        entries[i] = (uint8_t)round(clamp01(displayed) * 255.0);
    }

    return shared_ptr<const Lut>{new Lut{std::move(entries)}};
}

shared_ptr<const Lut> LutCache::get(const ToneSettings& tone, const NormRange& range, size_t domainSize) {
    const Key key{tone, range, domainSize};

    auto it = find_if(mEntries.begin(), mEntries.end(), [&](const Entry& entry) { return entry.key == key; });
    if (it != mEntries.end()) {
        mEntries.splice(mEntries.begin(), mEntries, it);
        return mEntries.front().lut;
    }

    tlog::debug() << fmt::format(
        "Building {}-entry LUT for range [{}, {}] gamma={}/{} exposure={}",
        domainSize,
        range.min,
        range.max,
        tone.gammaIn,
        tone.gammaOut,
        tone.exposureStops
    );

    ++mNumBuilds;
    mEntries.push_front({key, Lut::build(tone, range, domainSize)});
    while (mEntries.size() > mCapacity) {
        mEntries.pop_back();
    }

    return mEntries.front().lut;
}

} // namespace floatview
