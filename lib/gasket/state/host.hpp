// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "registry.hpp"
#include "state.hpp"
#include <gasket/host.hpp>
#include <gasket/vm.hpp>
#include <variant>

namespace gasket::state
{
/// Computes the address of a deployed contract with the CREATE scheme:
/// keccak256(rlp([deployer, deployer_nonce]))[12:].
///
/// @param sender        The address of the deployer.
/// @param sender_nonce  The deployer's nonce before the increase.
/// @return              The address of the deployed contract.
[[nodiscard]] address compute_create_address(const address& sender, uint64_t sender_nonce) noexcept;

/// The host of a single top-level operation: executes the call frames against the working copy
/// of the state.
class Host : public gasket::Host
{
    VM& m_vm;
    State& m_state;
    const Registry& m_registry;
    const TxContext& m_tx;
    ReentrancyGuard& m_guard;

public:
    Host(VM& vm, State& state, const Registry& registry, const TxContext& tx,
        ReentrancyGuard& guard) noexcept
      : m_vm{vm}, m_state{state}, m_registry{registry}, m_tx{tx}, m_guard{guard}
    {}

    Result call(const Message& msg, const CallFrame* parent) noexcept override;

    /// Creates the contract account and runs the constructor chain of the code.
    ///
    /// The message recipient is the address of the new contract. On failure
    /// all changes made by the deployment are reverted.
    Result create(const Message& msg, const std::shared_ptr<const ContractCode>& code) noexcept;

    [[nodiscard]] bytes32 get_storage(
        const address& addr, const bytes32& key) const noexcept override;

    evmc_storage_status set_storage(
        const address& addr, const bytes32& key, const bytes32& value) noexcept override;

    [[nodiscard]] uint256 get_balance(const address& addr) const noexcept override;

    void selfdestruct(const address& addr, const address& beneficiary) noexcept override;

    [[nodiscard]] const TxContext& get_tx_context() const noexcept override { return m_tx; }

    ReentrancyGuard& reentrancy_guard() noexcept override { return m_guard; }

private:
    /// Resolves the function executed by the message and checks the message against it.
    ///
    /// @return  The function or the binding error.
    [[nodiscard]] std::variant<const Function*, ErrorCode> bind(
        const Message& msg, const ContractCode& code) const noexcept;
};
}  // namespace gasket::state
