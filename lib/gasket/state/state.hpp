// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "account.hpp"
#include "state_diff.hpp"
#include "state_view.hpp"
#include <variant>
#include <vector>

namespace gasket::state
{
/// The working copy of the state used by a single top-level operation:
/// the accounts loaded from the persisted state and the journal of their modifications.
class State
{
    struct JournalBase
    {
        address addr;
    };

    struct JournalBalanceChange : JournalBase
    {
        uint256 prev_balance;
    };

    struct JournalStorageChange : JournalBase
    {
        bytes32 key;
        bytes32 prev_value;
    };

    struct JournalNonceBump : JournalBase
    {};

    struct JournalCreate : JournalBase
    {
        bool existed;
    };

    struct JournalDestruct : JournalBase
    {};

    using JournalEntry = std::variant<JournalBalanceChange, JournalStorageChange, JournalNonceBump,
        JournalCreate, JournalDestruct>;

    /// The read-only view of the persisted state.
    const StateView& m_initial;

    /// The accounts loaded from the persisted state and potentially modified.
    std::unordered_map<address, Account> m_modified;

    /// The state journal: the list of changes made to the state
    /// with information how to revert them.
    std::vector<JournalEntry> m_journal;

public:
    explicit State(const StateView& state_view) noexcept : m_initial{state_view} {}
    State(const State&) = delete;
    State(State&&) = delete;
    State& operator=(State&&) = delete;

    /// Inserts the new account at the address.
    /// There must not exist any account under this address before.
    Account& insert(const address& addr, Account account = {});

    /// Returns the pointer to the account at the address if the account exists. Null otherwise.
    Account* find(const address& addr) noexcept;

    /// Gets the account at the address (the account must exist).
    Account& get(const address& addr) noexcept;

    /// Gets an existing account or inserts new account.
    Account& get_or_insert(const address& addr, Account account = {});

    /// Gets the storage slot, loading its value from the persisted state if needed.
    /// The account is inserted as erasable if it does not exist.
    StorageValue& get_storage(const address& addr, const bytes32& key);

    /// Builds the list of changes to be applied to the persisted state.
    [[nodiscard]] StateDiff build_diff() const;

    /// Returns the state journal checkpoint. It can be later used to in rollback()
    /// to revert changes newer than the checkpoint.
    [[nodiscard]] size_t checkpoint() const noexcept { return m_journal.size(); }

    /// Reverts state changes made after the checkpoint.
    void rollback(size_t checkpoint);

    /// Moves the value between accounts. The recipient account is created if needed.
    ///
    /// @return  False if the sender's balance is insufficient. Nothing is modified then.
    [[nodiscard]] bool transfer(const address& from, const address& to, const uint256& value);

    /// Methods performing changes to the state which can be reverted by rollback().
    /// @{
    void journal_balance_change(const address& addr, const uint256& prev_balance);

    void journal_storage_change(const address& addr, const bytes32& key, const StorageValue& value);

    void journal_bump_nonce(const address& addr);

    void journal_create(const address& addr, bool existed);

    void journal_destruct(const address& addr);
    /// @}
};
}  // namespace gasket::state
