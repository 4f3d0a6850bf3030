// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gasket/value.hpp>
#include <utility>
#include <vector>

namespace gasket::state
{
/// Collection of changes to the State made by a committed top-level operation.
struct StateDiff
{
    struct Entry
    {
        /// Address of the modified account.
        address addr;

        /// New nonce value.
        uint64_t nonce = 0;

        /// New balance value.
        uint256 balance;

        /// The list of the account's storage modifications: key => new value.
        /// The value 0 means the storage entry is deleted.
        std::vector<std::pair<bytes32, bytes32>> modified_storage;

        bool operator==(const Entry&) const noexcept = default;
    };

    /// List of modified or created accounts.
    std::vector<Entry> modified_accounts;

    /// List of deleted (self-destructed or terminated) accounts.
    ///
    /// This list doesn't have common addresses with modified_accounts.
    std::vector<address> deleted_accounts;

    bool operator==(const StateDiff&) const noexcept = default;
};
}  // namespace gasket::state
