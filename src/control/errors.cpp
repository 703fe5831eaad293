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

// Portico Startup Errors - Implementation

#include "errors.hpp"

namespace portico::control {

std::string StartupErrorCategory::message(int ev) const {
    switch (static_cast<StartupErrc>(ev)) {
        case StartupErrc::RootCaUnreadable:
            return "root CA file unreadable";
        case StartupErrc::RootCaUnparsable:
            return "root CA file contains no parsable certificates";
        case StartupErrc::ClientKeyEmpty:
            return "empty client_key path";
        case StartupErrc::ClientCertKeyMismatch:
            return "client_cert and client_key must be provided together";
        case StartupErrc::ClientKeyPairInvalid:
            return "invalid client certificate/key pair";
        case StartupErrc::InvalidSetting:
            return "invalid setting value";
        case StartupErrc::MetricsBindFailed:
            return "failed to start metrics server";
        case StartupErrc::ServerStartFailed:
            return "unable to start adapter server";
        case StartupErrc::ServerCloseFailed:
            return "graceful shutdown failed";
        case StartupErrc::ServerTerminated:
            return "adapter server terminated with an error";
    }
    return "unknown startup error";
}

const StartupErrorCategory& startup_category() noexcept {
    static StartupErrorCategory instance;
    return instance;
}

std::error_code make_error_code(StartupErrc e) noexcept {
    return {static_cast<int>(e), startup_category()};
}

}  // namespace portico::control
