// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "host.hpp"
#include <intx/intx.hpp>
#include <memory>
#include <ostream>
#include <span>

namespace gasket
{
class CallFrame;
struct Function;
struct Instruction;

class Tracer
{
    friend class VM;  // Has access the m_next_tracer to traverse the list forward.
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    void notify_execution_start(  // NOLINT(misc-no-recursion)
        const Message& msg, const Function& fn) noexcept
    {
        on_execution_start(msg, fn);
        if (m_next_tracer)
            m_next_tracer->notify_execution_start(msg, fn);
    }

    void notify_execution_end(  // NOLINT(misc-no-recursion)
        const Result& result, const CallFrame& frame) noexcept
    {
        on_execution_end(result, frame);
        if (m_next_tracer)
            m_next_tracer->notify_execution_end(result, frame);
    }

    void notify_instruction_start(  // NOLINT(misc-no-recursion)
        uint32_t pc, const Instruction& instr, std::span<const intx::uint256> stack, int64_t gas,
        const CallFrame& frame) noexcept
    {
        on_instruction_start(pc, instr, stack, gas, frame);
        if (m_next_tracer)
            m_next_tracer->notify_instruction_start(pc, instr, stack, gas, frame);
    }

private:
    virtual void on_execution_start(const Message& msg, const Function& fn) noexcept = 0;
    virtual void on_instruction_start(uint32_t pc, const Instruction& instr,
        std::span<const intx::uint256> stack, int64_t gas, const CallFrame& frame) noexcept = 0;
    virtual void on_execution_end(const Result& result, const CallFrame& frame) noexcept = 0;
};

/// Creates the "histogram" tracer which counts occurrences of individual instructions during
/// execution and reports this data in CSV format.
///
/// @param out  Report output stream.
/// @return     Histogram tracer object.
std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out);

/// Creates the tracer reporting every executed instruction as a JSON object in a separate line.
std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out);

}  // namespace gasket
