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

#include <cctype>
#include <cstdlib>

using namespace std;

namespace floatview {

vector<string_view> split(string_view text, string_view delim) {
    vector<string_view> result;
    size_t begin = 0;
    while (true) {
        size_t end = text.find_first_of(delim, begin);
        if (end == string::npos) {
            result.emplace_back(text.substr(begin));
            break;
        } else {
            result.emplace_back(text.substr(begin, end - begin));
            begin = end + 1;
        }
    }

    return result;
}

string toLower(string_view str) {
    string result{str};
    transform(begin(result), end(result), begin(result), [](unsigned char c) { return (char)tolower(c); });
    return result;
}

string toPrecision(double value, int precision) {
    if (isnan(value)) {
        return "NaN";
    } else if (isinf(value)) {
        return value > 0 ? "Inf" : "-Inf";
    }

    precision = std::max(precision, 1);
    if (value == 0) {
        // Also folds -0 into 0
        return precision > 1 ? fmt::format("{:.{}f}", 0.0, precision - 1) : "0";
    }

    // Let the exponential formatting do the rounding so that e.g. 9.9996 correctly becomes 10.00 rather than 9.999 or 10.000.
    const string scientific = fmt::format("{:.{}e}", value, precision - 1);
    const size_t ePos = scientific.find('e');
    const int exponent = atoi(scientific.c_str() + ePos + 1);

    if (exponent < -6 || exponent >= precision) {
        return fmt::format("{}e{}{}", scientific.substr(0, ePos), exponent < 0 ? "-" : "+", std::abs(exponent));
    }

    return fmt::format("{:.{}f}", value, precision - 1 - exponent);
}

string_view toString(EFormatError kind) {
    switch (kind) {
        case EFormatError::BadMagic: return "bad magic";
        case EFormatError::Malformed: return "malformed header";
        case EFormatError::Truncated: return "truncated payload";
        case EFormatError::Unsupported: return "unsupported layout";
    }

    return "unknown";
}

} // namespace floatview
