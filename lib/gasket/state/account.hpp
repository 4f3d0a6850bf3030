// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gasket/value.hpp>
#include <unordered_map>

namespace gasket::state
{
/// The representation of the account storage value.
struct StorageValue
{
    /// The current value.
    bytes32 current;

    /// The value at the beginning of the top-level operation.
    bytes32 original;
};

/// The working copy of an account.
struct Account
{
    /// The account nonce. Counts the deployments made by the account.
    uint64_t nonce = 0;

    /// The account balance.
    uint256 balance;

    /// The cached and modified account storage entries.
    std::unordered_map<bytes32, StorageValue> storage;

    /// The contract has been self-destructed and is terminated when the top-level operation
    /// commits.
    bool destructed = false;

    /// The account should not be persisted if it is empty at the end of the operation.
    /// Set for the accounts which only have been read.
    bool erase_if_empty = false;

    [[nodiscard]] bool is_empty() const noexcept
    {
        if (nonce != 0 || balance != 0)
            return false;
        for (const auto& [_, v] : storage)
        {
            if (!evmc::is_zero(v.current))
                return false;
        }
        return true;
    }
};
}  // namespace gasket::state
