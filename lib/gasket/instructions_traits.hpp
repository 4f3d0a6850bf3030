// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "opcodes.hpp"
#include <array>
#include <cstdint>

namespace gasket::instr
{
/// The special gas cost value marking an instruction as "undefined".
constexpr int16_t undefined = -1;

/// Storage and call costs.
/// @{
inline constexpr auto sstore_set_cost = 20000;
inline constexpr auto sstore_reset_cost = 5000;
inline constexpr auto sload_cost = 200;
inline constexpr auto call_cost = 700;
inline constexpr auto call_value_cost = 9000;
inline constexpr auto call_stipend = 2300;
inline constexpr auto emit_cost = 375;
inline constexpr auto emit_indexed_field_cost = 375;
/// @}

/// The table of instruction base gas costs.
///
/// The dynamic part of SSTORE, EMIT and the value transfer surcharge of CALL
/// are charged by the instruction implementations.
using GasCostTable = std::array<int16_t, 256>;

constexpr inline GasCostTable gas_costs = []() noexcept {
    GasCostTable table{};
    for (auto& t : table)
        t = undefined;

    table[OP_STOP] = 0;
    table[OP_PUSH] = 3;
    table[OP_POP] = 2;
    table[OP_DUP] = 3;
    table[OP_SWAP] = 3;

    table[OP_ADD] = 3;
    table[OP_SUB] = 3;
    table[OP_MUL] = 5;
    table[OP_DIV] = 5;
    table[OP_MOD] = 5;
    table[OP_LT] = 3;
    table[OP_GT] = 3;
    table[OP_EQ] = 3;
    table[OP_ISZERO] = 3;
    table[OP_AND] = 3;
    table[OP_OR] = 3;
    table[OP_NOT] = 3;

    table[OP_ARG] = 3;
    table[OP_CALLER] = 2;
    table[OP_CALLVALUE] = 2;
    table[OP_ADDRESS] = 2;
    table[OP_TIMESTAMP] = 2;
    table[OP_NUMBER] = 2;
    table[OP_GAS] = 2;
    table[OP_BALANCE] = 400;
    table[OP_SELFBALANCE] = 5;

    table[OP_MLOAD] = 3;
    table[OP_MSTORE] = 3;
    table[OP_MAPSLOT] = 36;
    table[OP_SLOAD] = sload_cost;
    table[OP_SSTORE] = 0;

    table[OP_JUMP] = 8;
    table[OP_JUMPI] = 10;

    table[OP_REQUIRE] = 0;
    table[OP_ASSERT] = 0;
    table[OP_REVERT] = 0;

    table[OP_EMIT] = emit_cost;

    table[OP_CALL] = call_cost;
    table[OP_TRYCALL] = call_cost;
    table[OP_DELEGATECALL] = call_cost;
    table[OP_TRYDELEGATECALL] = call_cost;
    table[OP_INVOKE] = 10;

    table[OP_RETURN] = 0;
    table[OP_SELFDESTRUCT] = 5000;
    return table;
}();


/// The instruction traits.
struct Traits
{
    /// The instruction name;
    const char* name = nullptr;

    /// The number of stack items the instruction accesses during execution.
    /// For the call instructions this does not include the arguments.
    int8_t stack_height_required = 0;

    /// The stack height change caused by the instruction execution. Can be negative.
    /// For the call instructions this does not include the arguments.
    int8_t stack_height_change = 0;

    /// Whether the instruction modifies state and is forbidden in static frames.
    bool is_state_mutating = false;

    /// Whether the instruction reads state or block context and is forbidden in pure functions.
    bool is_state_reading = false;

    /// Whether the instruction performs an external call.
    bool is_external_call = false;
};

/// The global, revision-independent table of traits of all known instructions.
constexpr inline std::array<Traits, 256> traits = []() noexcept {
    std::array<Traits, 256> table{};

    table[OP_STOP] = {"STOP", 0, 0};
    table[OP_PUSH] = {"PUSH", 0, 1};
    table[OP_POP] = {"POP", 1, -1};
    table[OP_DUP] = {"DUP", 0, 1};
    table[OP_SWAP] = {"SWAP", 0, 0};

    table[OP_ADD] = {"ADD", 2, -1};
    table[OP_SUB] = {"SUB", 2, -1};
    table[OP_MUL] = {"MUL", 2, -1};
    table[OP_DIV] = {"DIV", 2, -1};
    table[OP_MOD] = {"MOD", 2, -1};
    table[OP_LT] = {"LT", 2, -1};
    table[OP_GT] = {"GT", 2, -1};
    table[OP_EQ] = {"EQ", 2, -1};
    table[OP_ISZERO] = {"ISZERO", 1, 0};
    table[OP_AND] = {"AND", 2, -1};
    table[OP_OR] = {"OR", 2, -1};
    table[OP_NOT] = {"NOT", 1, 0};

    table[OP_ARG] = {"ARG", 0, 1};
    table[OP_CALLER] = {"CALLER", 0, 1};
    table[OP_CALLVALUE] = {"CALLVALUE", 0, 1};
    table[OP_ADDRESS] = {"ADDRESS", 0, 1};
    table[OP_TIMESTAMP] = {"TIMESTAMP", 0, 1, false, true};
    table[OP_NUMBER] = {"NUMBER", 0, 1, false, true};
    table[OP_GAS] = {"GAS", 0, 1};
    table[OP_BALANCE] = {"BALANCE", 1, 0, false, true};
    table[OP_SELFBALANCE] = {"SELFBALANCE", 0, 1, false, true};

    table[OP_MLOAD] = {"MLOAD", 1, 0};
    table[OP_MSTORE] = {"MSTORE", 2, -2};
    table[OP_MAPSLOT] = {"MAPSLOT", 2, -1};
    table[OP_SLOAD] = {"SLOAD", 1, 0, false, true};
    table[OP_SSTORE] = {"SSTORE", 2, -2, true, true};

    table[OP_JUMP] = {"JUMP", 0, 0};
    table[OP_JUMPI] = {"JUMPI", 1, -1};

    table[OP_REQUIRE] = {"REQUIRE", 1, -1};
    table[OP_ASSERT] = {"ASSERT", 1, -1};
    table[OP_REVERT] = {"REVERT", 0, 0};

    table[OP_EMIT] = {"EMIT", 0, 0, true, false};

    table[OP_CALL] = {"CALL", 3, -2, false, true, true};
    table[OP_TRYCALL] = {"TRYCALL", 3, -1, false, true, true};
    table[OP_DELEGATECALL] = {"DELEGATECALL", 2, -1, false, true, true};
    table[OP_TRYDELEGATECALL] = {"TRYDELEGATECALL", 2, 0, false, true, true};
    table[OP_INVOKE] = {"INVOKE", 0, 1};

    table[OP_RETURN] = {"RETURN", 1, -1};
    table[OP_SELFDESTRUCT] = {"SELFDESTRUCT", 1, -1, true, true};
    return table;
}();

}  // namespace gasket::instr
