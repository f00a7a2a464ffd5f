/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

namespace meshq {

// boundary parameter of a multipart/form-data Content-Type, unquoted.
[[nodiscard]] std::optional<std::string> multipartBoundary(const std::string& contentType);

// Body of the form part whose Content-Disposition name equals field.
[[nodiscard]] std::optional<std::string> extractMultipartField(const std::string& contentType,
                                                               const std::string& body,
                                                               const std::string& field);

}
