// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "code.hpp"
#include "gas_meter.hpp"
#include "host.hpp"
#include <memory>
#include <vector>

namespace gasket
{
/// The lifecycle of a call frame.
enum class FrameStatus : uint8_t
{
    pending,
    binding,
    executing,
    committing,
    reverting,
    committed,
    reverted,
};

/// The storage namespace bound to a frame.
///
/// For delegated calls the namespace is the one of the caller's storage owner.
class StorageView
{
    Host& m_host;
    address m_owner;
    GasMeter& m_gas;
    bool m_static;

public:
    StorageView(Host& host, const address& owner, GasMeter& gas, bool is_static) noexcept
      : m_host{host}, m_owner{owner}, m_gas{gas}, m_static{is_static}
    {}

    /// Reads the slot. Unset slots read as zero.
    [[nodiscard]] bytes32 read(const bytes32& key) const noexcept
    {
        return m_host.get_storage(m_owner, key);
    }

    /// Writes the slot and charges the new-slot or the update cost.
    [[nodiscard]] ErrorCode write(const bytes32& key, const bytes32& value) noexcept;
};

/// The execution context of a single call: the message, the gas budget,
/// the events waiting for the frame's commit and the held reentrancy locks.
class CallFrame
{
public:
    Host& host;
    const Message& msg;

    /// The frame which created this one. Null for the top-level frame.
    const CallFrame* parent = nullptr;

    /// The code being executed.
    std::shared_ptr<const ContractCode> code;

    GasMeter gas;

    /// The events emitted by this frame and by its committed descendants.
    std::vector<Event> pending_events;

    /// The reentrancy locks acquired on the frame's entry.
    std::vector<ReentrancyGuard::Token> guard_tokens;

    FrameStatus status = FrameStatus::pending;

    /// State modifications are not allowed. Inherited from the message,
    /// raised when the frame executes a view or pure function.
    bool is_static = false;

    /// The frame runs the constructor: external calls are forbidden.
    bool in_constructor = false;

    /// The depth of nested internal invocations.
    int32_t invoke_depth = 0;

    CallFrame(Host& h, const Message& message, const CallFrame* parent_frame) noexcept
      : host{h}, msg{message}, parent{parent_frame}, gas{message.gas}, is_static{message.is_static}
    {}

    CallFrame(const CallFrame&) = delete;
    CallFrame& operator=(const CallFrame&) = delete;

    [[nodiscard]] bool in_static_mode() const noexcept { return is_static; }

    /// The nesting level of the running function: the message depth
    /// plus the internal invocations active in this frame.
    [[nodiscard]] int32_t depth() const noexcept { return msg.depth + invoke_depth; }

    [[nodiscard]] StorageView storage() noexcept
    {
        return {host, msg.recipient, gas, is_static};
    }
};
}  // namespace gasket
