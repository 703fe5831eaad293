#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/JsonConsoleSink.h>

#include <string_view>

namespace portico::control {
class Settings;
}

namespace portico::logging {

// Logger names: the process logger and the adapter server (RPC layer) scope
inline constexpr std::string_view kMainLoggerName = "portico";
inline constexpr std::string_view kAdapterLoggerName = "adapter";

// Resolved logging options (log_level, log_json, log_grpc)
struct LogSettings {
    quill::LogLevel level = quill::LogLevel::Info;
    bool json = false;
    bool log_grpc = true;  // false silences the adapter server's own logger
};

// Map debug/info/warn/error/none (case-insensitive) to a quill level; unknown -> Info
quill::LogLevel parse_log_level(std::string_view level);

LogSettings resolve_log_settings(const control::Settings& settings);

// Start the quill backend thread (called once at startup, after signal masking)
void init_logging_system();

// Create or reconfigure the process and adapter loggers
quill::Logger* configure_logging(const LogSettings& settings);

// Process logger; falls back to an Info console logger if configure_logging was never called
quill::Logger* get_logger();

// Logger handed to the adapter server
quill::Logger* get_adapter_logger();

// Block until every queued message of both loggers is written
void flush_logging();

// Shutdown logging system (called at exit)
void shutdown_logging();

}  // namespace portico::logging
