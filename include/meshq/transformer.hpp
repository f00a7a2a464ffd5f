/*
 * meshq - Content-Addressed Render Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "meshq/types.hpp"

namespace meshq {

struct TransformResult {
    bool ok = false;
    std::string outputRef;
    std::string error;
};

// Turns a job's input into its output file. Called from the worker thread
// only; implementations need not be reentrant.
class Transformer {
public:
    virtual ~Transformer() = default;
    [[nodiscard]] virtual TransformResult transform(const Job& job) = 0;
};

}
