// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gasket/gasket.hpp>

namespace gasket
{
const char* version() noexcept
{
    return PROJECT_VERSION;
}
}  // namespace gasket
