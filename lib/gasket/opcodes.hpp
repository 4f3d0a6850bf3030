// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace gasket
{
/// The primitive operations a function body is made of.
enum Opcode : uint8_t
{
    OP_STOP = 0x00,
    OP_PUSH = 0x01,
    OP_POP = 0x02,
    OP_DUP = 0x03,
    OP_SWAP = 0x04,

    OP_ADD = 0x10,
    OP_SUB = 0x11,
    OP_MUL = 0x12,
    OP_DIV = 0x13,
    OP_MOD = 0x14,
    OP_LT = 0x15,
    OP_GT = 0x16,
    OP_EQ = 0x17,
    OP_ISZERO = 0x18,
    OP_AND = 0x19,
    OP_OR = 0x1a,
    OP_NOT = 0x1b,

    OP_ARG = 0x20,
    OP_CALLER = 0x21,
    OP_CALLVALUE = 0x22,
    OP_ADDRESS = 0x23,
    OP_TIMESTAMP = 0x24,
    OP_NUMBER = 0x25,
    OP_GAS = 0x26,
    OP_BALANCE = 0x27,
    OP_SELFBALANCE = 0x28,

    OP_MLOAD = 0x30,
    OP_MSTORE = 0x31,
    OP_MAPSLOT = 0x32,
    OP_SLOAD = 0x33,
    OP_SSTORE = 0x34,

    OP_JUMP = 0x40,
    OP_JUMPI = 0x41,

    OP_REQUIRE = 0x50,
    OP_ASSERT = 0x51,
    OP_REVERT = 0x52,

    OP_EMIT = 0x60,

    OP_CALL = 0x70,
    /// Pushes the output word and the success flag. Both are 0 when the call fails,
    /// the error kind and the reason of the failure are dropped.
    OP_TRYCALL = 0x71,
    OP_DELEGATECALL = 0x72,
    /// As OP_TRYCALL.
    OP_TRYDELEGATECALL = 0x73,
    OP_INVOKE = 0x74,

    OP_RETURN = 0x80,
    OP_SELFDESTRUCT = 0x81,
};
}  // namespace gasket
