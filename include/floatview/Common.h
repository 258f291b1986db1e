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

#define FMT_HEADER_ONLY 1
#include <fmt/core.h>

#include <tinylogger/tinylogger.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Throws std::runtime_error with a formatted message if the condition does not hold. Active in release builds.
#define FLOATVIEW_ASSERT(cond, description, ...) \
    if (!(cond))                                 \
        throw std::runtime_error { fmt::format(description, ##__VA_ARGS__) }

#ifndef FLOATVIEW_VERSION
#   define FLOATVIEW_VERSION "undefined"
#endif

// Make std::filesystem::path formattable.
template <> struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return formatter<std::string_view>::format(path.string(), ctx);
    }
};

namespace floatview {

namespace fs = std::filesystem;

template <typename T> T swapBytes(T value) {
    T result;
    auto valueChars = reinterpret_cast<char*>(&value);
    auto resultChars = reinterpret_cast<char*>(&result);

    for (size_t i = 0; i < sizeof(T); ++i) {
        resultChars[i] = valueChars[sizeof(T) - 1 - i];
    }

    return result;
}

template <typename T> T clamp01(T value) { return std::clamp(value, (T)0, (T)1); }

template <typename T> class ScopeGuard {
public:
    ScopeGuard(const T& callback) : mCallback{callback} {}
    ScopeGuard(T&& callback) : mCallback{std::move(callback)} {}
    ScopeGuard(const ScopeGuard<T>& other) = delete;
    ScopeGuard& operator=(const ScopeGuard<T>& other) = delete;
    ~ScopeGuard() { mCallback(); }

private:
    T mCallback;
};

template <typename T> std::string join(const T& components, const std::string& delim) {
    std::ostringstream s;
    for (const auto& component : components) {
        if (&components[0] != &component) {
            s << delim;
        }
        s << component;
    }

    return s.str();
}

std::vector<std::string_view> split(std::string_view text, std::string_view delim);

std::string toLower(std::string_view str);

// Formats a number with `precision` significant digits. Switches to exponential notation for very large or small magnitudes and
// spells out non-finite values as NaN, Inf and -Inf.
std::string toPrecision(double value, int precision);

// Exceptions
class ImageLoadError : public std::runtime_error {
public:
    ImageLoadError(const std::string& message) : std::runtime_error{message} {}
};

enum class EFormatError {
    BadMagic,
    Malformed,
    Truncated,
    Unsupported,
};

std::string_view toString(EFormatError kind);

class FormatError : public ImageLoadError {
public:
    FormatError(EFormatError kind, const std::string& message, std::string_view token = {}) :
        ImageLoadError{token.empty() ? message : fmt::format("{} ('{}')", message, token)}, mKind{kind}, mToken{token} {}

    EFormatError kind() const { return mKind; }
    const std::string& token() const { return mToken; }

private:
    EFormatError mKind;
    std::string mToken;
};

class ImageSaveError : public std::runtime_error {
public:
    ImageSaveError(const std::string& message) : std::runtime_error{message} {}
};

class SettingsError : public std::invalid_argument {
public:
    SettingsError(const std::string& message) : std::invalid_argument{message} {}
};

} // namespace floatview
