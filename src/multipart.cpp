/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "meshq/multipart.hpp"
#include <algorithm>
#include <cctype>

namespace meshq {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Value of name="..." inside a Content-Disposition header line.
std::optional<std::string> dispositionName(const std::string& headers) {
    std::string lower = toLowerCopy(headers);
    auto line = lower.find("content-disposition:");
    if (line == std::string::npos) {
        return std::nullopt;
    }
    auto lineEnd = lower.find("\r\n", line);

    std::size_t pos = line;
    while (true) {
        pos = lower.find("name=\"", pos);
        if (pos == std::string::npos || (lineEnd != std::string::npos && pos > lineEnd)) {
            return std::nullopt;
        }
        // Skip filename="..."
        if (pos > 0 && std::isalpha(static_cast<unsigned char>(lower[pos - 1]))) {
            pos += 6;
            continue;
        }
        auto start = pos + 6;
        auto end = headers.find('"', start);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return headers.substr(start, end - start);
    }
}
}

std::optional<std::string> multipartBoundary(const std::string& contentType) {
    std::string lower = toLowerCopy(contentType);
    if (lower.rfind("multipart/form-data", 0) != 0) {
        return std::nullopt;
    }
    auto pos = lower.find("boundary=");
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string boundary = contentType.substr(pos + 9);
    auto semi = boundary.find(';');
    if (semi != std::string::npos) {
        boundary.erase(semi);
    }
    while (!boundary.empty() && std::isspace(static_cast<unsigned char>(boundary.back()))) {
        boundary.pop_back();
    }
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.size() - 2);
    }
    if (boundary.empty()) {
        return std::nullopt;
    }
    return boundary;
}

std::optional<std::string> extractMultipartField(const std::string& contentType,
                                                 const std::string& body,
                                                 const std::string& field) {
    auto boundary = multipartBoundary(contentType);
    if (!boundary) {
        return std::nullopt;
    }

    const std::string delimiter = "--" + *boundary;
    const std::string partDelimiter = "\r\n" + delimiter;

    auto pos = body.find(delimiter);
    while (pos != std::string::npos) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            break;  // closing delimiter
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            return std::nullopt;
        }
        pos += 2;

        auto headersEnd = body.find("\r\n\r\n", pos);
        if (headersEnd == std::string::npos) {
            return std::nullopt;
        }
        std::string headers = body.substr(pos, headersEnd - pos);
        auto contentStart = headersEnd + 4;

        auto next = body.find(partDelimiter, contentStart);
        if (next == std::string::npos) {
            return std::nullopt;
        }

        auto name = dispositionName(headers);
        if (name && *name == field) {
            return body.substr(contentStart, next - contentStart);
        }
        pos = next + 2;
    }
    return std::nullopt;
}

}
