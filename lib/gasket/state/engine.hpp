// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "event_log.hpp"
#include "registry.hpp"
#include "state_diff.hpp"
#include "world.hpp"
#include <gasket/constants.hpp>
#include <gasket/vm.hpp>
#include <shared_mutex>
#include <system_error>
#include <variant>
#include <vector>

namespace gasket::state
{
/// The outcome of a top-level call.
struct CallResult
{
    ErrorCode status = SUCCESS;

    /// The returned word. Only set for the successful calls returning a value.
    std::optional<uint256> output;

    /// The require/revert reason.
    std::string reason;

    int64_t gas_used = 0;
    int64_t gas_left = 0;

    /// The events of the call, in emission order. Empty for failed calls.
    std::vector<Event> events;
};

/// The outcome of a deployment.
struct DeployResult
{
    ErrorCode status = SUCCESS;

    /// The address of the deployed contract. Only set for the successful deployment.
    address addr;

    /// The cause of the failure.
    std::string reason;

    int64_t gas_used = 0;
};

/// The embedding API: owns the persisted state, the registry of contracts, the event log
/// and the interpreter.
///
/// Mutating operations are serialised. Every mutating operation is atomic: it either commits
/// all its effects or none.
class Engine
{
    mutable std::shared_mutex m_mutex;

    VM m_vm;
    World m_world;
    Registry m_registry;
    EventLog m_event_log;
    ReentrancyGuard m_guard;
    TxContext m_block;

    /// The diffs of all committed operations, in commit order.
    std::vector<StateDiff> m_history;

public:
    Engine() = default;
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Deploys the contract: flattens the definition, runs the constructor chain once
    /// and registers the code.
    DeployResult deploy(const address& deployer, const ContractDefinition& definition,
        const std::vector<Value>& args = {}, const uint256& value = 0,
        int64_t gas = DEFAULT_DEPLOY_GAS);

    /// Calls the contract function as an external caller.
    CallResult call(const address& caller, const address& contract, std::string_view function,
        const std::vector<Value>& args, const uint256& value, int64_t gas);

    /// Returns the events of committed operations matching the filter, in emission order.
    ///
    /// @return  The events or FILTER_NOT_INDEXED if the filter uses a field which
    ///          the matching event declarations do not index.
    [[nodiscard]] std::variant<std::vector<Event>, std::error_code> query_events(
        const EventFilter& filter) const;

    /// Reads the persisted storage slot. Costs no gas.
    [[nodiscard]] bytes32 read_storage(const address& contract, const bytes32& key) const;

    [[nodiscard]] uint256 get_balance(const address& addr) const;

    /// Credits the account (genesis funding).
    void fund(const address& addr, const uint256& amount);

    /// Terminates the contract. The contract's account is removed from the persisted state.
    std::error_code terminate(const address& contract);

    /// Sets the block context of the following operations.
    void set_block(int64_t number, int64_t timestamp);

    /// The ordered list of committed state diffs.
    [[nodiscard]] std::vector<StateDiff> history() const;

    /// The copy of the persisted state.
    [[nodiscard]] World world() const;

    /// Checks if there is a live contract at the address.
    [[nodiscard]] bool is_contract(const address& addr) const;

    SetOptionResult set_option(std::string_view name, std::string_view value);

    void add_tracer(std::unique_ptr<Tracer> tracer);

private:
    /// Persists the working copy and records the diff in the history.
    void commit(const State& state);
};
}  // namespace gasket::state
