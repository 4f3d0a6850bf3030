// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include <evmc/hex.hpp>
#include <stack>
#include <string_view>

namespace gasket
{
namespace
{
std::string get_name(uint8_t opcode)
{
    const auto name = instr::traits[opcode].name;
    return (name != nullptr) ? name : "0x" + evmc::hex(opcode);
}

/// @see create_histogram_tracer()
class HistogramTracer : public Tracer
{
    struct Context
    {
        const int32_t depth;
        const std::string function;
        uint32_t counts[256]{};

        Context(int32_t _depth, std::string _function) noexcept
          : depth{_depth}, function{std::move(_function)}
        {}
    };

    std::stack<Context> m_contexts;
    std::ostream& m_out;

    void on_execution_start(const Message& msg, const Function& fn) noexcept override
    {
        m_contexts.emplace(msg.depth, fn.name);
    }

    void on_instruction_start(uint32_t /*pc*/, const Instruction& instr,
        std::span<const intx::uint256> /*stack*/, int64_t /*gas*/,
        const CallFrame& /*frame*/) noexcept override
    {
        auto& ctx = m_contexts.top();
        ++ctx.counts[instr.opcode];
    }

    void on_execution_end(const Result& /*result*/, const CallFrame& /*frame*/) noexcept override
    {
        const auto& ctx = m_contexts.top();

        m_out << "--- # HISTOGRAM depth=" << ctx.depth << " function=" << ctx.function
              << "\nopcode,count\n";
        for (size_t i = 0; i < std::size(ctx.counts); ++i)
        {
            if (ctx.counts[i] != 0)
                m_out << get_name(static_cast<uint8_t>(i)) << ',' << ctx.counts[i] << '\n';
        }

        m_contexts.pop();
    }

public:
    explicit HistogramTracer(std::ostream& out) noexcept : m_out{out} {}
};


class InstructionTracer : public Tracer
{
    std::ostream& m_out;  ///< Output stream.

    void output_stack(std::span<const intx::uint256> stack)
    {
        m_out << R"(,"stack":[)";
        for (auto it = stack.begin(); it != stack.end(); ++it)
        {
            if (it != stack.begin())
                m_out << ',';
            m_out << R"("0x)" << to_string(*it, 16) << '"';
        }
        m_out << ']';
    }

    /// Outputs the JSON string literal.
    void output_string(std::string_view str)
    {
        m_out << '"';
        for (const auto c : str)
        {
            if (c == '"' || c == '\\')
                m_out << '\\' << c;
            else if (static_cast<unsigned char>(c) < 0x20)
                m_out << "\\u00" << evmc::hex(static_cast<uint8_t>(c));
            else
                m_out << c;
        }
        m_out << '"';
    }

    void on_execution_start(const Message& msg, const Function& fn) noexcept override
    {
        m_out << "{";
        m_out << R"("depth":)" << std::dec << (msg.depth + 1);
        m_out << R"(,"kind":")" << (msg.kind == CallKind::delegatecall ? "delegatecall" : "call")
              << '"';
        m_out << R"(,"sender":"0x)" << evmc::hex(msg.sender) << '"';
        m_out << R"(,"recipient":"0x)" << evmc::hex(msg.recipient) << '"';
        m_out << R"(,"function":)";
        output_string(fn.name);
        m_out << R"(,"gas":"0x)" << std::hex << msg.gas << '"';
        m_out << "}\n";
    }

    void on_instruction_start(uint32_t pc, const Instruction& instr,
        std::span<const intx::uint256> stack, int64_t gas, const CallFrame& frame) noexcept override
    {
        m_out << "{";
        m_out << R"("pc":)" << std::dec << pc;
        m_out << R"(,"op":)" << std::dec << int{instr.opcode};
        m_out << R"(,"gas":"0x)" << std::hex << gas << '"';
        m_out << R"(,"gasCost":"0x)" << std::hex << instr::gas_costs[instr.opcode] << '"';
        output_stack(stack);
        m_out << R"(,"depth":)" << std::dec << (frame.msg.depth + 1);
        m_out << R"(,"opName":")" << get_name(instr.opcode) << '"';
        m_out << "}\n";
    }

    void on_execution_end(const Result& result, const CallFrame& frame) noexcept override
    {
        m_out << "{";
        m_out << R"("depth":)" << std::dec << (frame.msg.depth + 1);
        m_out << R"(,"status":")"
              << (result.status == SUCCESS ? "success" : make_error_code(result.status).message())
              << '"';
        m_out << R"(,"gasUsed":"0x)" << std::hex << frame.gas.used() << '"';
        if (!result.reason.empty())
        {
            m_out << R"(,"reason":)";
            output_string(result.reason);
        }
        m_out << "}\n";
    }

public:
    explicit InstructionTracer(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // Set number formatting to dec, JSON does not support other forms.
    }
};
}  // namespace

std::unique_ptr<Tracer> create_histogram_tracer(std::ostream& out)
{
    return std::make_unique<HistogramTracer>(out);
}

std::unique_ptr<Tracer> create_instruction_tracer(std::ostream& out)
{
    return std::make_unique<InstructionTracer>(out);
}
}  // namespace gasket
