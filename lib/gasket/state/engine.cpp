// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "engine.hpp"
#include "host.hpp"
#include "state.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>

namespace gasket::state
{
namespace
{
std::vector<uint256> to_words(const std::vector<Value>& args)
{
    std::vector<uint256> words;
    words.reserve(args.size());
    for (const auto& v : args)
        words.emplace_back(v.word);
    return words;
}

/// Checks the typed arguments against the declared parameters.
bool check_types(const Function& fn, const std::vector<Value>& args) noexcept
{
    if (args.size() != fn.params.size())
        return false;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type != fn.params[i].type || !fits(args[i].type, args[i].word))
            return false;
    }
    return true;
}

/// Checks if the filter names a field declared, but not indexed, by an event the filter can match.
bool uses_non_indexed_field(const EventFilter& filter, const ContractCode& code) noexcept
{
    for (const auto& [name, decl] : code.events)
    {
        if (filter.name.has_value() && *filter.name != name)
            continue;
        for (const auto& [field, _] : filter.topics)
        {
            if (const auto* f = decl.find_field(field); f != nullptr && !f->indexed)
                return true;
        }
    }
    return false;
}

/// Checks if the logged event carries a non-indexed field named by the filter.
bool has_non_indexed_field(const EventFilter& filter, const Event& event) noexcept
{
    return std::ranges::any_of(filter.topics, [&event](const auto& topic) {
        return std::ranges::any_of(event.fields, [&topic](const Event::Field& f) {
            return !f.indexed && f.name == topic.first;
        });
    });
}

/// Checks if the error is reported before any code of the deployment executes.
constexpr bool is_binding_error(ErrorCode ec) noexcept
{
    return ec == ARGUMENT_MISMATCH || ec == PAYABLE_VIOLATION || ec == INSUFFICIENT_BALANCE;
}

std::string describe_failure(const Result& r)
{
    auto message = make_error_code(r.status).message();
    if (!r.reason.empty())
        message += ": " + r.reason;
    return message;
}
}  // namespace

DeployResult Engine::deploy(const address& deployer, const ContractDefinition& definition,
    const std::vector<Value>& args, const uint256& value, int64_t gas)
{
    std::unique_lock lock{m_mutex};
    gas = std::max(gas, int64_t{0});

    // The nonce is bumped by every deployment attempt so the address is never reused.
    State state{m_world};
    auto& deployer_acc = state.get_or_insert(deployer);
    const auto nonce = deployer_acc.nonce;
    state.journal_bump_nonce(deployer);
    ++deployer_acc.nonce;
    const auto addr = compute_create_address(deployer, nonce);

    DeployResult result;
    std::vector<Event> events;
    const auto code_or_error = flatten(definition);
    if (const auto* err = std::get_if<CodeValidationError>(&code_or_error))
    {
        result = {DEPLOYMENT_ERROR, {}, std::string{get_error_message(*err)}, 0};
    }
    else if (m_registry.is_known(addr))
    {
        result = {DEPLOYMENT_ERROR, {}, "address collision", 0};
    }
    else
    {
        const auto& code = std::get<std::shared_ptr<const ContractCode>>(code_or_error);
        const auto* const ctor = code->constructor();
        if (ctor != nullptr ? !check_types(*ctor, args) : !args.empty())
        {
            result = {ARGUMENT_MISMATCH, {}, {}, 0};
        }
        else
        {
            Host host{m_vm, state, m_registry, m_block, m_guard};
            const Message msg{
                .kind = CallKind::call,
                .is_static = false,
                .depth = 0,
                .gas = gas,
                .recipient = addr,
                .sender = deployer,
                .code_address = addr,
                .value = value,
                .function = std::string{CONSTRUCTOR_NAME},
                .input = to_words(args),
            };
            auto r = host.create(msg, code);

            result.gas_used = gas - r.gas_left;
            if (r.status == SUCCESS)
            {
                result.addr = addr;
                events = std::move(r.events);
                m_registry.insert(addr, code);
            }
            else if (is_binding_error(r.status))
                result.status = r.status;
            else
            {
                result.status = DEPLOYMENT_ERROR;
                result.reason = describe_failure(r);
            }
        }
    }

    commit(state);
    m_event_log.append(std::move(events));
    return result;
}

CallResult Engine::call(const address& caller, const address& contract, std::string_view function,
    const std::vector<Value>& args, const uint256& value, int64_t gas)
{
    std::unique_lock lock{m_mutex};
    gas = std::max(gas, int64_t{0});

    // The words do not carry types. Check the declared types while they are known.
    if (const auto* const c = m_registry.find(contract); c != nullptr)
    {
        const auto* const fn = c->code->find_function(function);
        if (fn != nullptr && fn->is_externally_visible() && fn->name != FALLBACK_NAME &&
            !check_types(*fn, args))
            return {.status = ARGUMENT_MISMATCH, .gas_left = gas};
    }

    State state{m_world};
    Host host{m_vm, state, m_registry, m_block, m_guard};
    const Message msg{
        .kind = CallKind::call,
        .is_static = false,
        .depth = 0,
        .gas = gas,
        .recipient = contract,
        .sender = caller,
        .code_address = contract,
        .value = value,
        .function = std::string{function},
        .input = to_words(args),
    };
    auto r = host.call(msg, nullptr);

    CallResult result{
        .status = r.status,
        .output = r.output,
        .reason = std::move(r.reason),
        .gas_used = gas - r.gas_left,
        .gas_left = r.gas_left,
        .events = {},
    };
    if (r.status == SUCCESS)
    {
        commit(state);
        result.events = r.events;
        m_event_log.append(std::move(r.events));
    }
    return result;
}

std::variant<std::vector<Event>, std::error_code> Engine::query_events(
    const EventFilter& filter) const
{
    std::shared_lock lock{m_mutex};

    if (!filter.topics.empty())
    {
        bool rejected = false;
        if (filter.emitter.has_value())
        {
            if (const auto* const c = m_registry.find(*filter.emitter); c != nullptr)
                rejected = uses_non_indexed_field(filter, *c->code);
        }
        else
        {
            m_registry.for_each([&](const Contract& c) {
                rejected = rejected || uses_non_indexed_field(filter, *c.code);
            });
        }

        // The logged events also cover the delegated emissions and the terminated emitters.
        if (!rejected)
        {
            const EventFilter scope{.emitter = filter.emitter, .name = filter.name, .topics = {}};
            rejected = std::ranges::any_of(m_event_log.query(scope),
                [&filter](const Event& e) { return has_non_indexed_field(filter, e); });
        }
        if (rejected)
            return make_error_code(FILTER_NOT_INDEXED);
    }

    std::vector<Event> events;
    std::ranges::copy(m_event_log.query(filter), std::back_inserter(events));
    return events;
}

bytes32 Engine::read_storage(const address& contract, const bytes32& key) const
{
    std::shared_lock lock{m_mutex};
    return m_world.get_storage(contract, key);
}

uint256 Engine::get_balance(const address& addr) const
{
    std::shared_lock lock{m_mutex};
    const auto acc = m_world.get_account(addr);
    return acc.has_value() ? acc->balance : uint256{};
}

void Engine::fund(const address& addr, const uint256& amount)
{
    std::unique_lock lock{m_mutex};
    State state{m_world};
    state.get_or_insert(addr).balance += amount;
    commit(state);
}

std::error_code Engine::terminate(const address& contract)
{
    std::unique_lock lock{m_mutex};
    if (m_registry.find(contract) == nullptr)
        return make_error_code(NO_SUCH_CONTRACT);

    // The remaining balance of the contract is burned.
    State state{m_world};
    state.get_or_insert(contract).destructed = true;
    commit(state);
    return {};
}

void Engine::set_block(int64_t number, int64_t timestamp)
{
    std::unique_lock lock{m_mutex};
    m_block.block_number = number;
    m_block.block_timestamp = timestamp;
}

std::vector<StateDiff> Engine::history() const
{
    std::shared_lock lock{m_mutex};
    return m_history;
}

World Engine::world() const
{
    std::shared_lock lock{m_mutex};
    return m_world;
}

bool Engine::is_contract(const address& addr) const
{
    std::shared_lock lock{m_mutex};
    return m_registry.find(addr) != nullptr;
}

SetOptionResult Engine::set_option(std::string_view name, std::string_view value)
{
    std::unique_lock lock{m_mutex};
    return m_vm.set_option(name, value);
}

void Engine::add_tracer(std::unique_ptr<Tracer> tracer)
{
    std::unique_lock lock{m_mutex};
    m_vm.add_tracer(std::move(tracer));
}

void Engine::commit(const State& state)
{
    auto diff = state.build_diff();
    m_world.apply(diff);
    for (const auto& addr : diff.deleted_accounts)
        m_registry.terminate(addr);
    m_history.emplace_back(std::move(diff));
}
}  // namespace gasket::state
