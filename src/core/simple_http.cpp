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

// Portico Simple HTTP - Implementation

#include "simple_http.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <sstream>

namespace portico::core {

SimpleRequest parse_simple_request(std::string_view data) {
    SimpleRequest req;

    // Find first line (method and path)
    size_t line_end = data.find('\n');
    if (line_end == std::string_view::npos) {
        return req;
    }
    std::string_view line = data.substr(0, line_end);

    // Parse "GET /path HTTP/1.1"
    size_t space1 = line.find(' ');
    if (space1 == std::string_view::npos) {
        return req;
    }

    size_t space2 = line.find(' ', space1 + 1);
    if (space2 == std::string_view::npos) {
        return req;
    }

    std::string_view target = line.substr(space1 + 1, space2 - space1 - 1);
    if (size_t query = target.find('?'); query != std::string_view::npos) {
        target = target.substr(0, query);
    }

    req.method = std::string(line.substr(0, space1));
    req.path = std::string(target);
    req.valid = !req.method.empty() && !req.path.empty();

    return req;
}

std::string format_simple_response(int status_code, std::string_view content_type,
                                   std::string_view body, bool keep_alive) {
    std::ostringstream response;

    // Status line
    response << "HTTP/1.1 " << status_code << " ";
    switch (status_code) {
        case 200:
            response << "OK";
            break;
        case 400:
            response << "Bad Request";
            break;
        case 404:
            response << "Not Found";
            break;
        case 405:
            response << "Method Not Allowed";
            break;
        case 431:
            response << "Request Header Fields Too Large";
            break;
        case 500:
            response << "Internal Server Error";
            break;
        case 503:
            response << "Service Unavailable";
            break;
        default:
            response << "Unknown";
            break;
    }
    response << "\r\n";

    // Headers
    response << "Content-Type: " << content_type << "\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n";
    response << "Server: Portico\r\n";
    response << "\r\n";

    // Body
    response << body;

    return response.str();
}

bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n > 0) {
            data.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (poll(&pfd, 1, 1000) <= 0) {
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

}  // namespace portico::core
