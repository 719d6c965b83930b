// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * DLock a distributed lock manager for shared file-backed stores.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "common/Settings.hpp"
#include "common/Error.hpp"
#include <cstdlib>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <unordered_map>

namespace dlock {

namespace {

template<typename T, typename Parse>
T parseNumber(const std::string& key, const std::string& raw, Parse parse) {
    try {
        std::size_t used = 0;
        T v = parse(raw, &used);
        if (used != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return v;
    } catch (const std::exception&) {
        throw ConfigurationError(key + " must be a number, got '" + raw + "'.");
    }
}

} // namespace

Settings::Settings(std::unordered_map<std::string, std::string> overrides)
    : values {std::move(overrides)} {}

std::optional<std::string> Settings::lookup(const std::string& key) const {
    auto i = values.find(key);
    if (i != values.end()) {
        return i->second;
    }
    if (const char* env = std::getenv(key.c_str()); env != nullptr) {
        return std::string{env};
    }
    return std::nullopt;
}

std::string Settings::get(const std::string& key) const {
    auto v = lookup(key);
    if (!v.has_value()) {
        throw ConfigurationError(key + " or environment variable " + key + " is required but not set.");
    }
    return v.value();
}

std::string Settings::get(const std::string& key, const std::string& fallback) const {
    return lookup(key).value_or(fallback);
}

int Settings::getInt(const std::string& key) const {
    return parseNumber<int>(key, get(key), [](const std::string& s, std::size_t* n) { return std::stoi(s, n); });
}

int Settings::getInt(const std::string& key, int fallback) const {
    auto v = lookup(key);
    if (!v.has_value()) {
        return fallback;
    }
    return parseNumber<int>(key, v.value(), [](const std::string& s, std::size_t* n) { return std::stoi(s, n); });
}

double Settings::getDouble(const std::string& key) const {
    return parseNumber<double>(key, get(key), [](const std::string& s, std::size_t* n) { return std::stod(s, n); });
}

} // namespace dlock
