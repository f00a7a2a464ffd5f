/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <istream>
#include <optional>
#include <string>

#include "meshq/types.hpp"

namespace meshq {

// SHA-256 of the given bytes as 64 lowercase hex characters.
[[nodiscard]] Fingerprint fingerprint(const std::string& bytes);

// Reads the stream to EOF. Returns nullopt if the stream fails before EOF.
[[nodiscard]] std::optional<Fingerprint> fingerprint(std::istream& in);

[[nodiscard]] bool isFingerprint(const std::string& value) noexcept;

// Workspace-relative names derived from a fingerprint.
[[nodiscard]] std::string inputRefFor(const Fingerprint& fp);
[[nodiscard]] std::string outputRefFor(const Fingerprint& fp);

// Inverse of inputRefFor(): "uploads/input-<fp>.stl" -> "<fp>".
[[nodiscard]] std::optional<Fingerprint> fingerprintFromInputRef(const std::string& inputRef);

}
