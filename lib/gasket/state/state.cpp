// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "state.hpp"
#include <algorithm>
#include <cassert>

namespace gasket::state
{
StateDiff State::build_diff() const
{
    StateDiff diff;
    for (const auto& [addr, m] : m_modified)
    {
        if (m.destructed)
        {
            diff.deleted_accounts.emplace_back(addr);
            continue;
        }
        if (m.erase_if_empty && m.is_empty())
            continue;

        // NOLINTNEXTLINE(modernize-use-emplace)
        auto& a = diff.modified_accounts.emplace_back(StateDiff::Entry{addr, m.nonce, m.balance});
        for (const auto& [k, v] : m.storage)
        {
            if (v.current != v.original)
                a.modified_storage.emplace_back(k, v.current);
        }
    }

    // The working copy is unordered. Sort the diff so equal operations produce equal diffs.
    std::sort(diff.modified_accounts.begin(), diff.modified_accounts.end(),
        [](const auto& a, const auto& b) { return a.addr < b.addr; });
    for (auto& e : diff.modified_accounts)
        std::sort(e.modified_storage.begin(), e.modified_storage.end());
    std::sort(diff.deleted_accounts.begin(), diff.deleted_accounts.end());
    return diff;
}

Account& State::insert(const address& addr, Account account)
{
    const auto r = m_modified.insert({addr, std::move(account)});
    assert(r.second);
    return r.first->second;
}

Account* State::find(const address& addr) noexcept
{
    if (const auto it = m_modified.find(addr); it != m_modified.end())
        return &it->second;
    if (const auto cacc = m_initial.get_account(addr); cacc)
        return &insert(addr, {.nonce = cacc->nonce, .balance = cacc->balance});
    return nullptr;
}

Account& State::get(const address& addr) noexcept
{
    auto acc = find(addr);
    assert(acc != nullptr);
    return *acc;
}

Account& State::get_or_insert(const address& addr, Account account)
{
    if (const auto acc = find(addr); acc != nullptr)
        return *acc;
    return insert(addr, std::move(account));
}

StorageValue& State::get_storage(const address& addr, const bytes32& key)
{
    auto& acc = get_or_insert(addr, {.erase_if_empty = true});
    const auto [it, missing] = acc.storage.try_emplace(key);
    if (missing)
    {
        const auto initial_value = m_initial.get_storage(addr, key);
        it->second = {initial_value, initial_value};
    }
    return it->second;
}

bool State::transfer(const address& from, const address& to, const uint256& value)
{
    auto* const src = find(from);
    if (src == nullptr || src->balance < value)
        return false;

    if (find(to) == nullptr)
    {
        journal_create(to, false);
        insert(to);
    }
    auto& dst = get(to);

    journal_balance_change(from, src->balance);
    journal_balance_change(to, dst.balance);
    src->balance -= value;
    dst.balance += value;
    return true;
}

void State::journal_balance_change(const address& addr, const uint256& prev_balance)
{
    m_journal.emplace_back(JournalBalanceChange{{addr}, prev_balance});
}

void State::journal_storage_change(
    const address& addr, const bytes32& key, const StorageValue& value)
{
    m_journal.emplace_back(JournalStorageChange{{addr}, key, value.current});
}

void State::journal_bump_nonce(const address& addr)
{
    m_journal.emplace_back(JournalNonceBump{addr});
}

void State::journal_create(const address& addr, bool existed)
{
    m_journal.emplace_back(JournalCreate{{addr}, existed});
}

void State::journal_destruct(const address& addr)
{
    m_journal.emplace_back(JournalDestruct{addr});
}

void State::rollback(size_t checkpoint)
{
    while (m_journal.size() != checkpoint)
    {
        std::visit(
            [this](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, JournalNonceBump>)
                {
                    get(e.addr).nonce -= 1;
                }
                else if constexpr (std::is_same_v<T, JournalDestruct>)
                {
                    get(e.addr).destructed = false;
                }
                else if constexpr (std::is_same_v<T, JournalCreate>)
                {
                    if (e.existed)
                    {
                        get(e.addr).nonce = 0;
                    }
                    else
                    {
                        m_modified.erase(e.addr);
                    }
                }
                else if constexpr (std::is_same_v<T, JournalStorageChange>)
                {
                    get(e.addr).storage.find(e.key)->second.current = e.prev_value;
                }
                else if constexpr (std::is_same_v<T, JournalBalanceChange>)
                {
                    get(e.addr).balance = e.prev_balance;
                }
                else
                {
                    static_assert(std::is_void_v<T>, "unhandled journal entry type");
                }
            },
            m_journal.back());
        m_journal.pop_back();
    }
}
}  // namespace gasket::state
