/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace meshq {

// Opaque job identifier, unique for the lifetime of the process.
using JobId = std::string;

// Lowercase hex SHA-256 of the submitted bytes.
using Fingerprint = std::string;

// One unit of render work. inputRef is relative to the workspace,
// outputRef is a file name inside the output directory.
struct Job {
    JobId id;
    std::string inputRef;
    std::string outputRef;
};

// Pending: waiting for its channel to register. Queued: handed to the worker.
enum class JobPhase : std::uint8_t { Pending, Queued };

} // namespace meshq
