// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace gasket
{
/// The maximum number of operand stack items of a function invocation.
constexpr auto STACK_LIMIT = 1024;

/// The number of words of the frame memory of a function invocation.
constexpr auto MEMORY_WORDS = 1024;

/// The default limit of nested call frames (and of nested internal invocations).
constexpr int32_t DEFAULT_MAX_DEPTH = 1024;

/// The default gas budget of a deployment.
constexpr int64_t DEFAULT_DEPLOY_GAS = 1'000'000;
}  // namespace gasket
