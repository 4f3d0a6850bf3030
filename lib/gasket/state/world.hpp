// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "state_diff.hpp"
#include "state_view.hpp"
#include <map>
#include <span>

namespace gasket::state
{
/// The persisted account.
struct WorldAccount
{
    uint64_t nonce = 0;
    uint256 balance;
    std::map<bytes32, bytes32> storage;

    bool operator==(const WorldAccount&) const noexcept = default;
};

/// The persisted state: the accounts mapped by their addresses.
///
/// The storage keeps only non-zero values. The World only changes by applying
/// the diffs of committed top-level operations.
class World : public StateView, public std::map<address, WorldAccount>
{
public:
    using map::map;

    std::optional<Account> get_account(const address& addr) const noexcept override;
    bytes32 get_storage(const address& addr, const bytes32& key) const noexcept override;

    /// Apply the state changes.
    void apply(const StateDiff& diff);

    /// Reconstructs the persisted state by applying the history of diffs to the empty state.
    [[nodiscard]] static World replay(std::span<const StateDiff> history);

    friend bool operator==(const World& a, const World& b) noexcept
    {
        return static_cast<const map&>(a) == static_cast<const map&>(b);
    }
};
}  // namespace gasket::state
