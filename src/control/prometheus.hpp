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

// Portico Prometheus Exporter - Header
// Formats metrics in Prometheus text exposition format

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "metrics.hpp"

namespace portico::control {

/// Prometheus metric types
enum class PrometheusType {
    Counter,  // Monotonically increasing counter
};

/// Prometheus exporter
class PrometheusExporter {
public:
    PrometheusExporter() = default;
    ~PrometheusExporter() = default;

    // Non-copyable, non-movable
    PrometheusExporter(const PrometheusExporter&) = delete;
    PrometheusExporter& operator=(const PrometheusExporter&) = delete;

    /// Export metrics in Prometheus text format
    [[nodiscard]] static std::string export_metrics(const MetricsSnapshot& metrics,
                                                    std::string_view namespace_prefix = "portico") {
        std::ostringstream out;

        write_header(out, namespace_prefix, "system_responses_total",
                     "Total responses from the system (configuration) API by host and status",
                     PrometheusType::Counter);
        for (const auto& response : metrics.responses) {
            write_sample(out, namespace_prefix, "system_responses_total", response.count,
                         {{"host", response.host}, {"code", std::to_string(response.status)}});
        }

        write_header(out, namespace_prefix, "system_latency_microseconds_total",
                     "Total system API latency in microseconds by host", PrometheusType::Counter);
        for (const auto& latency : metrics.latencies) {
            write_sample(out, namespace_prefix, "system_latency_microseconds_total",
                         latency.total_latency_us, {{"host", latency.host}});
        }

        write_header(out, namespace_prefix, "system_requests_observed_total",
                     "Total system API responses observed by host", PrometheusType::Counter);
        for (const auto& latency : metrics.latencies) {
            write_sample(out, namespace_prefix, "system_requests_observed_total",
                         latency.observations, {{"host", latency.host}});
        }

        write_header(out, namespace_prefix, "system_cache_hits_total",
                     "Total system cache hits", PrometheusType::Counter);
        write_sample(out, namespace_prefix, "system_cache_hits_total", metrics.cache_hits);

        return out.str();
    }

private:
    /// Label for Prometheus metrics
    struct Label {
        std::string name;
        std::string value;
    };

    /// Write HELP and TYPE lines
    static void write_header(std::ostringstream& out, std::string_view namespace_prefix,
                             std::string_view metric_name, std::string_view help,
                             PrometheusType type) {
        out << "# HELP " << namespace_prefix << "_" << metric_name << " " << help << "\n";

        out << "# TYPE " << namespace_prefix << "_" << metric_name << " ";
        switch (type) {
            case PrometheusType::Counter:
                out << "counter";
                break;
        }
        out << "\n";
    }

    /// Write one sample line
    static void write_sample(std::ostringstream& out, std::string_view namespace_prefix,
                             std::string_view metric_name, uint64_t value,
                             const std::vector<Label>& labels = {}) {
        out << namespace_prefix << "_" << metric_name;

        if (!labels.empty()) {
            out << "{";
            for (size_t i = 0; i < labels.size(); ++i) {
                out << labels[i].name << "=\"" << escape_label(labels[i].value) << "\"";
                if (i < labels.size() - 1) {
                    out << ",";
                }
            }
            out << "}";
        }

        out << " " << value << "\n";
    }

    /// Escape backslash, quote and newline in label values
    static std::string escape_label(std::string_view value) {
        std::string escaped;
        escaped.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '\\':
                    escaped += "\\\\";
                    break;
                case '"':
                    escaped += "\\\"";
                    break;
                case '\n':
                    escaped += "\\n";
                    break;
                default:
                    escaped += c;
                    break;
            }
        }
        return escaped;
    }
};

}  // namespace portico::control
