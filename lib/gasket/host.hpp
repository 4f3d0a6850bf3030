// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "event.hpp"
#include "reentrancy_guard.hpp"
#include "value.hpp"
#include <evmc/evmc.h>
#include <optional>
#include <string>
#include <vector>

namespace gasket
{
class CallFrame;

enum class CallKind : uint8_t
{
    /// The callee executes against its own storage.
    call,

    /// The callee's code executes against the caller's storage and message context.
    delegatecall,
};

/// The block and transaction context available to the executing code.
struct TxContext
{
    int64_t block_number = 0;
    int64_t block_timestamp = 0;
};

/// The parameters of a call.
struct Message
{
    CallKind kind = CallKind::call;

    /// State modifications are not allowed.
    bool is_static = false;

    int32_t depth = 0;

    /// The gas forwarded to the callee.
    int64_t gas = 0;

    /// The storage owner: the callee for normal calls, the caller's storage owner
    /// for delegated calls.
    address recipient;

    address sender;

    /// The address of the contract whose code is executed.
    address code_address;

    uint256 value;

    /// The called function name. Empty for plain value transfers.
    std::string function;

    /// The argument words.
    std::vector<uint256> input;
};

/// The outcome of a call frame or of a function invocation.
struct Result
{
    ErrorCode status = SUCCESS;

    int64_t gas_left = 0;

    std::optional<uint256> output;

    /// The require/revert reason.
    std::string reason;

    /// The events of the committed frame, in emission order.
    std::vector<Event> events;
};

/// The interface the interpreter uses to access state and to create nested frames.
class Host
{
public:
    virtual ~Host() = default;

    [[nodiscard]] virtual bytes32 get_storage(
        const address& addr, const bytes32& key) const noexcept = 0;

    /// Writes the storage slot and reports the kind of modification.
    virtual evmc_storage_status set_storage(
        const address& addr, const bytes32& key, const bytes32& value) noexcept = 0;

    [[nodiscard]] virtual uint256 get_balance(const address& addr) const noexcept = 0;

    /// Moves the balance to the beneficiary and marks the contract for termination.
    virtual void selfdestruct(const address& addr, const address& beneficiary) noexcept = 0;

    /// Executes the message in a new frame, child of the parent frame.
    virtual Result call(const Message& msg, const CallFrame* parent) noexcept = 0;

    [[nodiscard]] virtual const TxContext& get_tx_context() const noexcept = 0;

    virtual ReentrancyGuard& reentrancy_guard() noexcept = 0;
};
}  // namespace gasket
