// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "host.hpp"
#include <gasket/hash_utils.hpp>
#include <algorithm>
#include <bit>

namespace gasket::state
{
namespace
{
/// Checks the argument words against the function parameters.
bool check_arguments(const Function& fn, std::span<const uint256> args) noexcept
{
    if (args.size() != fn.params.size())
        return false;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (!fits(fn.params[i].type, args[i]))
            return false;
    }
    return true;
}
}  // namespace

bytes32 Host::get_storage(const address& addr, const bytes32& key) const noexcept
{
    return m_state.get_storage(addr, key).current;
}

evmc_storage_status Host::set_storage(
    const address& addr, const bytes32& key, const bytes32& value) noexcept
{
    // Follow EVMC documentation https://evmc.ethereum.org/storagestatus.html#autotoc_md3
    // and EIP-2200 specification https://eips.ethereum.org/EIPS/eip-2200.

    auto& storage_slot = m_state.get_storage(addr, key);
    const auto& [current, original] = storage_slot;

    const auto dirty = original != current;
    const auto restored = original == value;
    const auto current_is_zero = evmc::is_zero(current);
    const auto value_is_zero = evmc::is_zero(value);

    auto status = EVMC_STORAGE_ASSIGNED;  // All other cases.
    if (!dirty && !restored)
    {
        if (current_is_zero)
            status = EVMC_STORAGE_ADDED;  // 0 → 0 → Z
        else if (value_is_zero)
            status = EVMC_STORAGE_DELETED;  // X → X → 0
        else
            status = EVMC_STORAGE_MODIFIED;  // X → X → Z
    }
    else if (dirty && !restored)
    {
        if (current_is_zero && !value_is_zero)
            status = EVMC_STORAGE_DELETED_ADDED;  // X → 0 → Z
        else if (!current_is_zero && value_is_zero)
            status = EVMC_STORAGE_MODIFIED_DELETED;  // X → Y → 0
    }
    else if (dirty && restored)
    {
        if (current_is_zero)
            status = EVMC_STORAGE_DELETED_RESTORED;  // X → 0 → X
        else if (value_is_zero)
            status = EVMC_STORAGE_ADDED_DELETED;  // 0 → Y → 0
        else
            status = EVMC_STORAGE_MODIFIED_RESTORED;  // X → Y → X
    }

    m_state.journal_storage_change(addr, key, storage_slot);
    storage_slot.current = value;  // Update current value.
    return status;
}

uint256 Host::get_balance(const address& addr) const noexcept
{
    const auto* const acc = m_state.find(addr);
    return (acc != nullptr) ? acc->balance : uint256{};
}

void Host::selfdestruct(const address& addr, const address& beneficiary) noexcept
{
    if (m_state.find(beneficiary) == nullptr)
    {
        m_state.journal_create(beneficiary, false);
        m_state.insert(beneficiary);
    }
    auto& acc = m_state.get(addr);
    const auto balance = acc.balance;
    auto& beneficiary_acc = m_state.get(beneficiary);

    m_state.journal_balance_change(beneficiary, beneficiary_acc.balance);
    m_state.journal_balance_change(addr, balance);

    // Transfer may happen multiple times per single account as account's balance
    // can be increased with a call following previous selfdestruct.
    beneficiary_acc.balance += balance;
    acc.balance = 0;  // Zero balance if acc is the beneficiary.

    // Mark the destruction if not done already.
    if (!acc.destructed)
    {
        m_state.journal_destruct(addr);
        acc.destructed = true;
    }
}

address compute_create_address(const address& sender, uint64_t sender_nonce) noexcept
{
    static constexpr auto RLP_STR_BASE = 0x80;
    static constexpr auto RLP_LIST_BASE = 0xc0;
    static constexpr auto ADDRESS_SIZE = sizeof(sender);
    static constexpr std::ptrdiff_t MAX_NONCE_SIZE = sizeof(sender_nonce);

    uint8_t buffer[ADDRESS_SIZE + MAX_NONCE_SIZE + 3];  // 3 for RLP prefix bytes.
    auto p = &buffer[1];                                // Skip RLP list prefix for now.
    *p++ = RLP_STR_BASE + ADDRESS_SIZE;                 // Set RLP string prefix for address.
    p = std::copy_n(sender.bytes, ADDRESS_SIZE, p);

    if (sender_nonce < RLP_STR_BASE)  // Short integer encoding including 0 as empty string (0x80).
    {
        *p++ = sender_nonce != 0 ? static_cast<uint8_t>(sender_nonce) : RLP_STR_BASE;
    }
    else  // Prefixed integer encoding.
    {
        const auto num_nonzero_bytes = static_cast<int>((std::bit_width(sender_nonce) + 7) / 8);
        *p++ = static_cast<uint8_t>(RLP_STR_BASE + num_nonzero_bytes);
        intx::be::unsafe::store(p, sender_nonce);
        p = std::shift_left(p, p + MAX_NONCE_SIZE, MAX_NONCE_SIZE - num_nonzero_bytes);
    }

    const auto total_size = static_cast<size_t>(p - buffer);
    buffer[0] = static_cast<uint8_t>(RLP_LIST_BASE + (total_size - 1));  // Set the RLP list prefix.

    const auto base_hash = keccak256({buffer, total_size});
    address addr;
    std::copy_n(&base_hash.bytes[sizeof(base_hash) - ADDRESS_SIZE], ADDRESS_SIZE, addr.bytes);
    return addr;
}

std::variant<const Function*, ErrorCode> Host::bind(
    const Message& msg, const ContractCode& code) const noexcept
{
    // Constructors are never callable. Without this check the name would resolve to the fallback.
    if (msg.function == CONSTRUCTOR_NAME)
        return VISIBILITY_VIOLATION;

    const auto* fn = code.resolve(msg.function);
    if (fn == nullptr || !fn->is_externally_visible())
        return VISIBILITY_VIOLATION;

    // The fallback function takes no arguments. The input of the call is ignored.
    if (fn->name != FALLBACK_NAME && !check_arguments(*fn, msg.input))
        return ARGUMENT_MISMATCH;

    // The delegated call does not transfer its inherited value.
    if (msg.kind == CallKind::call && msg.value != 0 && fn->mutability != Mutability::payable)
        return PAYABLE_VIOLATION;

    return fn;
}

Result Host::call(const Message& msg, const CallFrame* parent) noexcept
{
    CallFrame frame{*this, msg, parent};

    if (msg.depth >= m_vm.max_depth())
        return {.status = CALL_DEPTH_EXCEEDED, .gas_left = msg.gas};

    const auto* const contract = m_registry.find(msg.code_address);
    if (contract == nullptr)
    {
        // The plain value transfer to an address without code.
        if (msg.kind == CallKind::call && msg.function.empty() &&
            !m_registry.is_known(msg.code_address))
        {
            if (msg.value != 0 && !m_state.transfer(msg.sender, msg.recipient, msg.value))
                return {.status = INSUFFICIENT_BALANCE, .gas_left = msg.gas};
            return {.status = SUCCESS, .gas_left = msg.gas};
        }
        return {.status = NO_SUCH_CONTRACT, .gas_left = msg.gas};
    }

    frame.status = FrameStatus::binding;
    const auto bound = bind(msg, *contract->code);
    if (const auto* ec = std::get_if<ErrorCode>(&bound))
        return {.status = *ec, .gas_left = msg.gas};
    const auto& fn = *std::get<const Function*>(bound);

    frame.code = contract->code;
    frame.is_static = msg.is_static || fn.is_static();

    // The lock is held by the frame and released on every exit path.
    if (fn.non_reentrant)
    {
        auto token = m_guard.enter(msg.recipient);
        if (auto* t = std::get_if<ReentrancyGuard::Token>(&token))
            frame.guard_tokens.emplace_back(std::move(*t));
        else
            return {.status = REENTRANCY_BLOCKED, .gas_left = msg.gas};
    }

    const auto checkpoint = m_state.checkpoint();
    if (msg.kind == CallKind::call && msg.value != 0 &&
        !m_state.transfer(msg.sender, msg.recipient, msg.value))
        return {.status = INSUFFICIENT_BALANCE, .gas_left = msg.gas};

    frame.status = FrameStatus::executing;
    const auto args = fn.name != FALLBACK_NAME ? std::span<const uint256>{msg.input} :
                                                 std::span<const uint256>{};
    auto result = m_vm.execute(frame, fn, args);

    if (result.status == SUCCESS)
    {
        frame.status = FrameStatus::committing;
        result.events = std::move(frame.pending_events);
        frame.status = FrameStatus::committed;
    }
    else
    {
        frame.status = FrameStatus::reverting;
        m_state.rollback(checkpoint);
        frame.status = FrameStatus::reverted;
    }
    return result;
}

Result Host::create(const Message& msg, const std::shared_ptr<const ContractCode>& code) noexcept
{
    CallFrame frame{*this, msg, nullptr};
    frame.status = FrameStatus::binding;

    const auto* const ctor = code->constructor();
    const std::span<const uint256> args{msg.input};
    if (ctor != nullptr ? !check_arguments(*ctor, args) : !args.empty())
        return {.status = ARGUMENT_MISMATCH, .gas_left = msg.gas};
    if (msg.value != 0 && (ctor == nullptr || ctor->mutability != Mutability::payable))
        return {.status = PAYABLE_VIOLATION, .gas_left = msg.gas};

    const auto checkpoint = m_state.checkpoint();
    if (auto* const acc = m_state.find(msg.recipient); acc != nullptr)
    {
        m_state.journal_create(msg.recipient, true);
        acc->nonce = 1;
    }
    else
    {
        m_state.journal_create(msg.recipient, false);
        m_state.insert(msg.recipient, {.nonce = 1});
    }

    if (msg.value != 0 && !m_state.transfer(msg.sender, msg.recipient, msg.value))
    {
        m_state.rollback(checkpoint);
        return {.status = INSUFFICIENT_BALANCE, .gas_left = msg.gas};
    }

    frame.code = code;
    frame.in_constructor = true;
    frame.status = FrameStatus::executing;

    // The base constructors run first and take no arguments.
    Result result{.status = SUCCESS, .gas_left = msg.gas};
    for (const auto& c : code->constructors)
    {
        result = m_vm.execute(frame, c, &c == ctor ? args : std::span<const uint256>{});
        if (result.status != SUCCESS)
            break;
    }

    if (result.status == SUCCESS)
    {
        frame.status = FrameStatus::committed;
        result.events = std::move(frame.pending_events);
    }
    else
    {
        frame.status = FrameStatus::reverted;
        m_state.rollback(checkpoint);
    }
    return result;
}
}  // namespace gasket::state
