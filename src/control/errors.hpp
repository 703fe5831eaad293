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

// Portico Startup Errors - Header
// Error category for fatal configuration and lifecycle conditions

#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace portico::control {

/// Fatal condition kinds. Every value terminates the process once it reaches main().
enum class StartupErrc {
    RootCaUnreadable = 1,
    RootCaUnparsable,
    ClientKeyEmpty,
    ClientCertKeyMismatch,  // cert set without key (or key without cert)
    ClientKeyPairInvalid,
    InvalidSetting,
    MetricsBindFailed,
    ServerStartFailed,
    ServerCloseFailed,
    ServerTerminated,
};

/// Startup error category for std::error_code
class StartupErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "portico.startup";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get startup error category instance
[[nodiscard]] const StartupErrorCategory& startup_category() noexcept;

[[nodiscard]] std::error_code make_error_code(StartupErrc e) noexcept;

/// Fatal error returned up to main() instead of terminating in place.
/// `message` carries the operator-facing detail (paths, library errors).
struct FatalError {
    std::error_code code;
    std::string message;

    FatalError() = default;
    FatalError(StartupErrc errc, std::string msg)
        : code(make_error_code(errc)), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return static_cast<bool>(code);
    }
};

}  // namespace portico::control

template <>
struct std::is_error_code_enum<portico::control::StartupErrc> : std::true_type {};
