#include "logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>

#include "../control/settings.hpp"

namespace portico::logging {

namespace {

std::atomic<quill::Logger*> g_main_logger{nullptr};
std::atomic<quill::Logger*> g_adapter_logger{nullptr};

quill::Logger* create_logger(std::string_view name, bool json) {
    if (json) {
        auto sink = quill::Frontend::create_or_get_sink<quill::JsonConsoleSink>("json_console");
        return quill::Frontend::create_or_get_logger(std::string(name), std::move(sink));
    }
    auto sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    return quill::Frontend::create_or_get_logger(std::string(name), std::move(sink));
}

}  // namespace

quill::LogLevel parse_log_level(std::string_view level) {
    std::string level_lower{level};
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level_lower == "debug") {
        return quill::LogLevel::Debug;
    } else if (level_lower == "info") {
        return quill::LogLevel::Info;
    } else if (level_lower == "warn") {
        return quill::LogLevel::Warning;
    } else if (level_lower == "error") {
        return quill::LogLevel::Error;
    } else if (level_lower == "none") {
        return quill::LogLevel::None;
    }
    return quill::LogLevel::Info;
}

LogSettings resolve_log_settings(const control::Settings& settings) {
    LogSettings out;
    out.level = parse_log_level(settings.get_string(control::setting::kLogLevel));
    out.json = settings.get_bool(control::setting::kLogJson);

    // Unset means enabled; only an explicit false silences the adapter logger
    if (settings.is_set(control::setting::kLogGrpc) &&
        !settings.get_bool(control::setting::kLogGrpc)) {
        out.log_grpc = false;
    }
    return out;
}

void init_logging_system() {
    quill::Backend::start();
}

quill::Logger* configure_logging(const LogSettings& settings) {
    quill::Logger* main_logger = create_logger(kMainLoggerName, settings.json);
    main_logger->set_log_level(settings.level);

    quill::Logger* adapter_logger = create_logger(kAdapterLoggerName, settings.json);
    adapter_logger->set_log_level(settings.log_grpc ? settings.level : quill::LogLevel::None);

    g_main_logger.store(main_logger, std::memory_order_release);
    g_adapter_logger.store(adapter_logger, std::memory_order_release);
    return main_logger;
}

quill::Logger* get_logger() {
    quill::Logger* logger = g_main_logger.load(std::memory_order_acquire);
    if (logger) {
        return logger;
    }
    return configure_logging(LogSettings{});
}

quill::Logger* get_adapter_logger() {
    quill::Logger* logger = g_adapter_logger.load(std::memory_order_acquire);
    if (logger) {
        return logger;
    }
    configure_logging(LogSettings{});
    return g_adapter_logger.load(std::memory_order_acquire);
}

void flush_logging() {
    if (quill::Logger* logger = g_main_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    if (quill::Logger* logger = g_adapter_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
}

void shutdown_logging() {
    flush_logging();
    quill::Backend::stop();
}

}  // namespace portico::logging
