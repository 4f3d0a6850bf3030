// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gasket/code.hpp>
#include <gasket/errors.hpp>
#include <memory>
#include <unordered_map>
#include <variant>

namespace gasket::state
{
/// The deployed contract.
struct Contract
{
    address addr;

    /// The flattened code. Immutable after the deployment.
    std::shared_ptr<const ContractCode> code;

    /// The contract has been terminated and cannot be called any more.
    bool terminated = false;
};

/// The registry of deployed contracts.
///
/// Terminated contracts stay in the registry so their addresses are never reused.
class Registry
{
    std::unordered_map<address, Contract> m_contracts;

public:
    /// Registers the contract code at the address.
    ///
    /// @return  False if the address is already known. The registry is not modified then.
    bool insert(const address& addr, std::shared_ptr<const ContractCode> code);

    /// Returns the live contract at the address or null if the address is unknown
    /// or the contract has been terminated.
    [[nodiscard]] const Contract* find(const address& addr) const noexcept;

    /// Returns the live contract at the address or the NO_SUCH_CONTRACT error.
    [[nodiscard]] std::variant<const Contract*, std::error_code> lookup(
        const address& addr) const noexcept;

    /// Terminates the contract. Irreversible.
    ///
    /// @return  False if there is no live contract at the address.
    bool terminate(const address& addr) noexcept;

    /// Checks if a contract has ever been registered at the address.
    [[nodiscard]] bool is_known(const address& addr) const noexcept
    {
        return m_contracts.contains(addr);
    }

    [[nodiscard]] size_t size() const noexcept { return m_contracts.size(); }

    /// Visits all live contracts.
    template <typename Fn>
    void for_each(Fn&& fn) const
    {
        for (const auto& [_, c] : m_contracts)
        {
            if (!c.terminated)
                fn(c);
        }
    }
};
}  // namespace gasket::state
