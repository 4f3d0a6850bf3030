// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "value.hpp"
#include <unordered_set>
#include <utility>
#include <variant>

namespace gasket
{
/// The per-contract reentrancy locks.
///
/// A lock is keyed by the address of the storage owner, so the functions executed
/// with a delegated call share the lock of the delegating contract.
class ReentrancyGuard
{
    std::unordered_set<address> m_locked;

public:
    /// The scoped ownership of a lock. Releases the lock when destroyed.
    class Token
    {
        ReentrancyGuard* m_guard = nullptr;
        address m_addr;

    public:
        Token() noexcept = default;
        Token(ReentrancyGuard& guard, const address& addr) noexcept : m_guard{&guard}, m_addr{addr}
        {}

        Token(const Token&) = delete;
        Token& operator=(const Token&) = delete;

        Token(Token&& other) noexcept
          : m_guard{std::exchange(other.m_guard, nullptr)}, m_addr{other.m_addr}
        {}

        Token& operator=(Token&& other) noexcept
        {
            if (this != &other)
            {
                release();
                m_guard = std::exchange(other.m_guard, nullptr);
                m_addr = other.m_addr;
            }
            return *this;
        }

        ~Token() { release(); }

        [[nodiscard]] const address& locked_address() const noexcept { return m_addr; }

        [[nodiscard]] bool owns_lock() const noexcept { return m_guard != nullptr; }

        void release() noexcept
        {
            if (m_guard != nullptr)
                std::exchange(m_guard, nullptr)->exit(m_addr);
        }
    };

    ReentrancyGuard() = default;
    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    /// Locks the contract.
    ///
    /// @return  The token owning the lock or REENTRANCY_BLOCKED if the contract is already locked.
    [[nodiscard]] std::variant<Token, std::error_code> enter(const address& addr)
    {
        if (!m_locked.insert(addr).second)
            return make_error_code(REENTRANCY_BLOCKED);
        return Token{*this, addr};
    }

    [[nodiscard]] bool is_locked(const address& addr) const noexcept
    {
        return m_locked.contains(addr);
    }

    [[nodiscard]] bool empty() const noexcept { return m_locked.empty(); }

private:
    void exit(const address& addr) noexcept { m_locked.erase(addr); }
};
}  // namespace gasket
