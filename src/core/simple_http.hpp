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

// Portico Simple HTTP - Header
// Minimal HTTP/1.1 request-line parser and response writer for internal listeners

#pragma once

#include <string>
#include <string_view>

namespace portico::core {

/// Parsed request line ("GET /path HTTP/1.1")
struct SimpleRequest {
    std::string method;
    std::string path;  // query string stripped
    bool valid = false;
};

/// Parse the request line of a buffered request (minimal parser for GET only)
[[nodiscard]] SimpleRequest parse_simple_request(std::string_view data);

/// Serialize a complete response with Content-Length
[[nodiscard]] std::string format_simple_response(int status_code, std::string_view content_type,
                                                 std::string_view body, bool keep_alive = false);

/// Send the whole buffer on a blocking or non-blocking socket
/// @return false if the peer went away
bool send_all(int fd, std::string_view data);

}  // namespace portico::core
