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

// Portico Authorization Adapter - Main Entry Point
#include <cstdio>
#include <cstdlib>
#include <string_view>

#include "control/errors.hpp"
#include "control/settings.hpp"
#include "core/logging.hpp"
#include "core/shutdown.hpp"
#include "core/tls.hpp"
#include "runtime/bootstrap.hpp"
#include "runtime/lifecycle.hpp"

#ifndef PORTICO_VERSION
#define PORTICO_VERSION ""
#endif

namespace {

// Log, flush and terminate without unwinding: background threads may still be running
[[noreturn]] void exit_fatal(const portico::control::FatalError& error) {
    LOG_CRITICAL(portico::logging::get_logger(), "{}", error.message);
    portico::logging::flush_logging();
    std::_Exit(EXIT_FAILURE);
}

}  // namespace

int main() {
    // Before any thread exists, so only the signal watcher consumes SIGINT/SIGTERM
    if (auto ec = portico::core::block_shutdown_signals(); ec) {
        fprintf(stderr, "Failed to block shutdown signals: %s\n", ec.message().c_str());
        return EXIT_FAILURE;
    }

    const auto settings = portico::control::Settings::from_environment();

    portico::logging::init_logging_system();
    portico::logging::configure_logging(portico::logging::resolve_log_settings(settings));

    portico::core::initialize_openssl();

    portico::control::FatalError error;
    auto app = portico::runtime::build_application(settings, PORTICO_VERSION, error);
    if (!app) {
        exit_fatal(error);
    }

    portico::core::ShutdownQueue events;
    portico::core::SignalWatcher watcher(events);
    watcher.start();

    portico::runtime::LifecycleController controller(*app->authorizer, *app->server, events,
                                                     app->config.version);
    error = controller.run();
    if (error) {
        exit_fatal(error);
    }

    watcher.stop();
    app.reset();

    portico::core::cleanup_openssl();
    portico::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
