// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gasket/value.hpp>
#include <optional>

namespace gasket::state
{
/// The read-only view of the persisted state.
class StateView
{
public:
    struct Account
    {
        uint64_t nonce = 0;
        uint256 balance;
        bool has_storage = false;
    };

    virtual ~StateView() = default;
    virtual std::optional<Account> get_account(const address& addr) const noexcept = 0;
    virtual bytes32 get_storage(const address& addr, const bytes32& key) const noexcept = 0;
};
}  // namespace gasket::state
