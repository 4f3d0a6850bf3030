// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "constants.hpp"
#include "execution_state.hpp"
#include "tracing.hpp"
#include <memory>
#include <span>
#include <string_view>

namespace gasket
{
/// The outcome of VM::set_option().
enum class SetOptionResult
{
    success,
    invalid_name,
    invalid_value,
};

/// The gasket interpreter instance.
class VM
{
    std::unique_ptr<Tracer> m_first_tracer;
    int32_t m_max_depth = DEFAULT_MAX_DEPTH;

public:
    VM() noexcept = default;
    VM(const VM&) = delete;
    VM& operator=(const VM&) = delete;

    /// Configures the VM with a named option.
    ///
    /// Supported options:
    /// - "trace": reports every executed instruction to std::clog,
    /// - "histogram": reports instruction counts of every function execution to std::clog,
    /// - "max_depth": the limit of nested call frames and internal invocations (1..1024).
    SetOptionResult set_option(std::string_view name, std::string_view value) noexcept;

    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept
    {
        // Find the first empty unique_ptr and assign the new tracer to it.
        auto* end = &m_first_tracer;
        while (*end)
            end = &(*end)->m_next_tracer;
        *end = std::move(tracer);
    }

    [[nodiscard]] Tracer* get_tracer() const noexcept { return m_first_tracer.get(); }

    [[nodiscard]] int32_t max_depth() const noexcept { return m_max_depth; }

    /// Executes the function in the frame with already bound arguments.
    ///
    /// The failure policy of the gas meter is applied to the failures originating
    /// in this frame. The caller is responsible for reverting state changes on failure.
    Result execute(CallFrame& frame, const Function& fn, std::span<const uint256> args) noexcept;
};
}  // namespace gasket
