/*
 * Copyright 2025 Portico Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Portico Settings - Implementation

#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace portico::control {

Settings Settings::from_environment() {
    Values values;

    for (std::string_view name : setting::kAll) {
        std::string env_name{name};
        std::transform(env_name.begin(), env_name.end(), env_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (const char* raw = std::getenv(env_name.c_str()); raw != nullptr) {
            values.emplace(std::string(name), std::string(raw));
        }
    }

    return Settings(std::move(values));
}

const std::string* Settings::find(std::string_view name) const {
    auto it = values_.find(std::string(name));
    if (it == values_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool Settings::is_set(std::string_view name) const {
    return find(name) != nullptr;
}

std::string Settings::get_string(std::string_view name) const {
    const std::string* raw = find(name);
    return raw ? *raw : std::string();
}

int Settings::get_int(std::string_view name) const {
    const std::string* raw = find(name);
    int value = 0;
    if (!raw || !parse_int(*raw, value)) {
        return 0;
    }
    return value;
}

bool Settings::get_bool(std::string_view name) const {
    const std::string* raw = find(name);
    bool value = false;
    if (!raw || !parse_bool(*raw, value)) {
        return false;
    }
    return value;
}

bool parse_bool(std::string_view raw, bool& out) noexcept {
    if (raw == "1" || raw == "t" || raw == "T" || raw == "TRUE" || raw == "true" ||
        raw == "True") {
        out = true;
        return true;
    }
    if (raw == "0" || raw == "f" || raw == "F" || raw == "FALSE" || raw == "false" ||
        raw == "False") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int(std::string_view raw, int& out) noexcept {
    // from_chars rejects a leading '+'
    if (!raw.empty() && raw.front() == '+') {
        raw.remove_prefix(1);
        if (!raw.empty() && raw.front() == '-') {
            return false;
        }
    }
    if (raw.empty()) {
        return false;
    }

    int value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return false;
    }

    out = value;
    return true;
}

}  // namespace portico::control
