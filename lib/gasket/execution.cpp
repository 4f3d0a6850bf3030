// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "hash_utils.hpp"
#include "instructions.hpp"
#include "instructions_traits.hpp"
#include "vm.hpp"
#include <algorithm>
#include <iterator>
#include <vector>

namespace gasket
{
namespace
{
/// The outcome of a single function invocation.
struct Outcome
{
    ErrorCode status = SUCCESS;
    std::optional<uint256> output;
    std::string reason;

    /// The failure has been reported by a child frame and is only propagated by this frame.
    bool propagated = false;
};

/// Converts the instruction immediate to a count.
/// The count larger than the stack limit can never be satisfied by the stack.
size_t to_count(const uint256& immediate) noexcept
{
    return immediate > STACK_LIMIT ? size_t{STACK_LIMIT + 1} : static_cast<size_t>(immediate);
}

/// Pops the call arguments. The first argument is the deepest stack item.
std::vector<uint256> pop_args(Stack& stack, size_t argc)
{
    std::vector<uint256> args(argc);
    for (auto it = args.rbegin(); it != args.rend(); ++it)
        *it = stack.pop();
    return args;
}

class Interpreter
{
    const VM& m_vm;
    CallFrame& m_frame;
    Tracer* const m_tracer;

public:
    Interpreter(const VM& vm, CallFrame& frame) noexcept
      : m_vm{vm}, m_frame{frame}, m_tracer{vm.get_tracer()}
    {}

    /// Runs the function body with a fresh stack and memory.
    Outcome run(const Function& fn, std::span<const uint256> args) noexcept;

private:
    /// Checks the stack height requirements of the instruction.
    [[nodiscard]] static ErrorCode check_stack(
        const Instruction& instr, size_t stack_size) noexcept;

    template <Opcode Op>
    Outcome call(const Instruction& instr, Stack& stack) noexcept;

    Outcome invoke(const Instruction& instr, Stack& stack) noexcept;

    ErrorCode emit(const Instruction& instr, Stack& stack) noexcept;
};

ErrorCode Interpreter::check_stack(const Instruction& instr, size_t stack_size) noexcept
{
    const auto& tr = instr::traits[instr.opcode];

    auto required = static_cast<size_t>(tr.stack_height_required);
    auto change = static_cast<int64_t>(tr.stack_height_change);
    switch (instr.opcode)
    {
    case OP_DUP:
        required = to_count(instr.immediate);
        break;
    case OP_SWAP:
        required = to_count(instr.immediate) + 1;
        break;
    case OP_EMIT:
    case OP_CALL:
    case OP_TRYCALL:
    case OP_DELEGATECALL:
    case OP_TRYDELEGATECALL:
    case OP_INVOKE:
    {
        const auto argc = to_count(instr.immediate);
        required += argc;
        change -= static_cast<int64_t>(argc);
        break;
    }
    default:
        break;
    }

    if (stack_size < required)
        return STACK_UNDERFLOW;
    if (static_cast<int64_t>(stack_size) + change > STACK_LIMIT)
        return STACK_OVERFLOW;
    return SUCCESS;
}

template <Opcode Op>
Outcome Interpreter::call(const Instruction& instr, Stack& stack) noexcept
{
    static_assert(
        Op == OP_CALL || Op == OP_TRYCALL || Op == OP_DELEGATECALL || Op == OP_TRYDELEGATECALL);
    constexpr bool is_delegate = Op == OP_DELEGATECALL || Op == OP_TRYDELEGATECALL;
    constexpr bool is_try = Op == OP_TRYCALL || Op == OP_TRYDELEGATECALL;

    if (m_frame.in_constructor)
        return {DEPLOYMENT_ERROR, {}, "external call in constructor"};

    const auto& msg = m_frame.msg;
    const auto target = to_address(stack.pop());
    const auto requested_gas = stack.pop();
    // The delegated call executes in the caller's message context and transfers nothing.
    const auto value = is_delegate ? msg.value : stack.pop();
    auto args = pop_args(stack, to_count(instr.immediate));

    const auto has_value = !is_delegate && value != 0;
    if (has_value)
    {
        if (m_frame.in_static_mode())
            return {STATIC_MODE_VIOLATION};
        if (!m_frame.gas.charge(instr::call_value_cost))
            return {OUT_OF_GAS};
    }

    const auto remaining = m_frame.gas.remaining();
    const auto gas = (requested_gas == 0 || requested_gas > static_cast<uint64_t>(remaining)) ?
                         remaining :
                         static_cast<int64_t>(requested_gas);
    if (!m_frame.gas.charge(gas))
        return {OUT_OF_GAS};

    const Message child{
        .kind = is_delegate ? CallKind::delegatecall : CallKind::call,
        .is_static = m_frame.in_static_mode(),
        .depth = m_frame.depth() + 1,
        .gas = gas + (has_value ? instr::call_stipend : 0),
        .recipient = is_delegate ? msg.recipient : target,
        .sender = is_delegate ? msg.sender : msg.recipient,
        .code_address = target,
        .value = value,
        .function = instr.name,
        .input = std::move(args),
    };

    auto result = m_frame.host.call(child, &m_frame);
    m_frame.gas.refund(result.gas_left);

    const auto success = result.status == SUCCESS;
    if (success)
    {
        std::move(result.events.begin(), result.events.end(),
            std::back_inserter(m_frame.pending_events));
    }

    if constexpr (is_try)
    {
        // The failed call yields 0,0.
        stack.push(success ? result.output.value_or(0) : 0);
        stack.push(success ? 1 : 0);
        return {};
    }
    else
    {
        if (!success)
            return {result.status, {}, std::move(result.reason), true};
        stack.push(result.output.value_or(0));
        return {};
    }
}

Outcome Interpreter::invoke(const Instruction& instr, Stack& stack) noexcept
{
    const auto* fn = m_frame.code->find_function(instr.name);
    if (fn == nullptr || fn->visibility == Visibility::external)
        return {INVALID_INSTRUCTION};

    const auto args = pop_args(stack, to_count(instr.immediate));
    if (args.size() != fn->params.size())
        return {ARGUMENT_MISMATCH};
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (!fits(fn->params[i].type, args[i]))
            return {ARGUMENT_MISMATCH};
    }

    if (m_frame.depth() + 1 >= m_vm.max_depth())
        return {CALL_DEPTH_EXCEEDED};

    ReentrancyGuard::Token token;
    if (fn->non_reentrant)
    {
        auto r = m_frame.host.reentrancy_guard().enter(m_frame.msg.recipient);
        if (auto* t = std::get_if<ReentrancyGuard::Token>(&r))
            token = std::move(*t);
        else
            return {REENTRANCY_BLOCKED};
    }

    ++m_frame.invoke_depth;
    auto outcome = run(*fn, args);
    --m_frame.invoke_depth;

    if (outcome.status == SUCCESS)
        stack.push(outcome.output.value_or(0));
    return outcome;
}

ErrorCode Interpreter::emit(const Instruction& instr, Stack& stack) noexcept
{
    if (m_frame.in_static_mode())
        return STATIC_MODE_VIOLATION;

    const auto* decl = m_frame.code->find_event(instr.name);
    if (decl == nullptr || instr.immediate != decl->fields.size())
        return INVALID_INSTRUCTION;

    const auto num_indexed = static_cast<int64_t>(decl->num_indexed());
    if (!m_frame.gas.charge(num_indexed * instr::emit_indexed_field_cost))
        return OUT_OF_GAS;

    Event event{m_frame.msg.recipient, decl->name, {}};
    event.fields.resize(decl->fields.size());
    for (size_t i = decl->fields.size(); i-- > 0;)
    {
        const auto& f = decl->fields[i];
        event.fields[i] = {f.name, stack.pop(), f.indexed};
    }
    m_frame.pending_events.emplace_back(std::move(event));
    return SUCCESS;
}

Outcome Interpreter::run(const Function& fn, std::span<const uint256> args) noexcept
{
    const auto& msg = m_frame.msg;
    const auto& code = fn.code;
    const auto code_size = static_cast<int64_t>(code.size());

    Stack stack;
    // Grown on the first store. The words beyond the size read as zero.
    std::vector<uint256> memory;

    int64_t pc = 0;
    while (pc < code_size)
    {
        const auto& instr = code[static_cast<size_t>(pc)];

        if (m_tracer != nullptr)
        {
            m_tracer->notify_instruction_start(
                static_cast<uint32_t>(pc), instr, stack.items(), m_frame.gas.remaining(), m_frame);
        }

        const auto cost = instr::gas_costs[instr.opcode];
        if (cost == instr::undefined)
            return {INVALID_INSTRUCTION};
        if (const auto ec = check_stack(instr, stack.size()); ec != SUCCESS)
            return {ec};
        if (!m_frame.gas.charge(cost))
            return {OUT_OF_GAS};

        auto next_pc = pc + 1;
        switch (instr.opcode)
        {
        case OP_STOP:
            return {};

        case OP_PUSH:
            stack.push(instr.immediate);
            break;
        case OP_POP:
            stack.pop();
            break;
        case OP_DUP:
            instr::core::dup(stack, static_cast<size_t>(instr.immediate));
            break;
        case OP_SWAP:
            instr::core::swap(stack, static_cast<size_t>(instr.immediate));
            break;

        case OP_ADD:
            instr::core::add(stack);
            break;
        case OP_SUB:
            instr::core::sub(stack);
            break;
        case OP_MUL:
            instr::core::mul(stack);
            break;
        case OP_DIV:
            instr::core::div(stack);
            break;
        case OP_MOD:
            instr::core::mod(stack);
            break;
        case OP_LT:
            instr::core::lt(stack);
            break;
        case OP_GT:
            instr::core::gt(stack);
            break;
        case OP_EQ:
            instr::core::eq(stack);
            break;
        case OP_ISZERO:
            instr::core::iszero(stack);
            break;
        case OP_AND:
            instr::core::and_(stack);
            break;
        case OP_OR:
            instr::core::or_(stack);
            break;
        case OP_NOT:
            instr::core::not_(stack);
            break;

        case OP_ARG:
            if (instr.immediate >= args.size())
                return {INVALID_INSTRUCTION};
            stack.push(args[static_cast<size_t>(instr.immediate)]);
            break;
        case OP_CALLER:
            stack.push(to_word(msg.sender));
            break;
        case OP_CALLVALUE:
            stack.push(msg.value);
            break;
        case OP_ADDRESS:
            stack.push(to_word(msg.recipient));
            break;
        case OP_TIMESTAMP:
            stack.push(static_cast<uint64_t>(m_frame.host.get_tx_context().block_timestamp));
            break;
        case OP_NUMBER:
            stack.push(static_cast<uint64_t>(m_frame.host.get_tx_context().block_number));
            break;
        case OP_GAS:
            stack.push(static_cast<uint64_t>(m_frame.gas.remaining()));
            break;
        case OP_BALANCE:
            stack.top() = m_frame.host.get_balance(to_address(stack.top()));
            break;
        case OP_SELFBALANCE:
            stack.push(m_frame.host.get_balance(msg.recipient));
            break;

        case OP_MLOAD:
        {
            auto& index = stack.top();
            if (index >= MEMORY_WORDS)
                return {MEMORY_OUT_OF_BOUNDS};
            const auto i = static_cast<size_t>(index);
            index = i < memory.size() ? memory[i] : 0;
            break;
        }
        case OP_MSTORE:
        {
            const auto index = stack.pop();
            const auto value = stack.pop();
            if (index >= MEMORY_WORDS)
                return {MEMORY_OUT_OF_BOUNDS};
            const auto i = static_cast<size_t>(index);
            if (i >= memory.size())
                memory.resize(i + 1);
            memory[i] = value;
            break;
        }
        case OP_MAPSLOT:
        {
            const auto slot = stack.pop();
            auto& key = stack.top();
            key = to_word(mapping_slot(key, slot));
            break;
        }
        case OP_SLOAD:
        {
            auto& key = stack.top();
            key = to_word(m_frame.storage().read(to_bytes32(key)));
            break;
        }
        case OP_SSTORE:
        {
            const auto key = stack.pop();
            const auto value = stack.pop();
            if (const auto ec = m_frame.storage().write(to_bytes32(key), to_bytes32(value));
                ec != SUCCESS)
                return {ec};
            break;
        }

        case OP_JUMP:
            next_pc = pc + instr.offset;
            break;
        case OP_JUMPI:
            if (stack.pop() != 0)
                next_pc = pc + instr.offset;
            break;

        case OP_REQUIRE:
            if (stack.pop() == 0)
                return {REQUIRE_FAILED, {}, instr.name};
            break;
        case OP_ASSERT:
            if (stack.pop() == 0)
                return {ASSERT_FAILED};
            break;
        case OP_REVERT:
            return {REVERTED, {}, instr.name};

        case OP_EMIT:
            if (const auto ec = emit(instr, stack); ec != SUCCESS)
                return {ec};
            break;

        case OP_CALL:
        case OP_TRYCALL:
        case OP_DELEGATECALL:
        case OP_TRYDELEGATECALL:
        case OP_INVOKE:
        {
            auto outcome = [&]() noexcept {
                switch (instr.opcode)
                {
                case OP_CALL:
                    return call<OP_CALL>(instr, stack);
                case OP_TRYCALL:
                    return call<OP_TRYCALL>(instr, stack);
                case OP_DELEGATECALL:
                    return call<OP_DELEGATECALL>(instr, stack);
                case OP_TRYDELEGATECALL:
                    return call<OP_TRYDELEGATECALL>(instr, stack);
                default:
                    return invoke(instr, stack);
                }
            }();
            if (outcome.status != SUCCESS)
                return outcome;
            break;
        }

        case OP_RETURN:
            return {SUCCESS, stack.pop()};

        case OP_SELFDESTRUCT:
        {
            if (m_frame.in_static_mode())
                return {STATIC_MODE_VIOLATION};
            const auto beneficiary = to_address(stack.pop());
            m_frame.host.selfdestruct(msg.recipient, beneficiary);
            return {};
        }

        default:
            return {INVALID_INSTRUCTION};
        }

        if (next_pc < 0 || next_pc > code_size)
            return {BAD_JUMP_DESTINATION};
        pc = next_pc;
    }
    return {};
}
}  // namespace

Result VM::execute(CallFrame& frame, const Function& fn, std::span<const uint256> args) noexcept
{
    auto* const tracer = get_tracer();
    if (tracer != nullptr)
        tracer->notify_execution_start(frame.msg, fn);

    auto outcome = Interpreter{*this, frame}.run(fn, args);

    // The failure policy applies to the frame in which the failure happened.
    if (outcome.status != SUCCESS && !outcome.propagated)
        frame.gas.apply_failure_policy(outcome.status);

    Result result{
        .status = outcome.status,
        .gas_left = frame.gas.remaining(),
        .output = outcome.status == SUCCESS ? outcome.output : std::nullopt,
        .reason = std::move(outcome.reason),
        .events = {},
    };

    if (tracer != nullptr)
        tracer->notify_execution_end(result, frame);
    return result;
}
}  // namespace gasket
