// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#ifndef GASKET_HPP
#define GASKET_HPP

#include <gasket/code.hpp>
#include <gasket/errors.hpp>
#include <gasket/event.hpp>
#include <gasket/tracing.hpp>
#include <gasket/value.hpp>
#include <gasket/state/engine.hpp>

namespace gasket
{
using state::CallResult;
using state::DeployResult;
using state::Engine;
using state::EventFilter;

/// The version of the gasket library.
const char* version() noexcept;
}  // namespace gasket

#endif  // GASKET_HPP
