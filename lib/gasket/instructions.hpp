// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "constants.hpp"
#include "value.hpp"
#include <span>
#include <utility>
#include <vector>

namespace gasket
{
/// The operand stack of a function invocation.
///
/// The instruction implementations rely on the stack height checks done by the interpreter
/// before the instruction is executed.
class Stack
{
    std::vector<uint256> m_items;

public:
    [[nodiscard]] size_t size() const noexcept { return m_items.size(); }

    /// Returns the reference to the stack item by index, where 0 means the top item
    /// and positive index values the items further down the stack.
    [[nodiscard]] uint256& operator[](size_t index) noexcept
    {
        return m_items[m_items.size() - 1 - index];
    }

    [[nodiscard]] uint256& top() noexcept { return m_items.back(); }

    uint256 pop() noexcept
    {
        auto v = m_items.back();
        m_items.pop_back();
        return v;
    }

    void push(const uint256& value) noexcept { m_items.push_back(value); }

    /// The stack items, the bottom item first.
    [[nodiscard]] std::span<const uint256> items() const noexcept { return m_items; }
};

namespace instr::core
{
/// The arithmetic and comparison instructions.
/// The first operand is the top item, the second operand is the item below it.
/// @{
inline void add(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() += a;
}

inline void sub(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() = a - stack.top();
}

inline void mul(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() *= a;
}

inline void div(Stack& stack) noexcept
{
    const auto a = stack.pop();
    auto& v = stack.top();
    v = v != 0 ? a / v : 0;
}

inline void mod(Stack& stack) noexcept
{
    const auto a = stack.pop();
    auto& v = stack.top();
    v = v != 0 ? a % v : 0;
}

inline void lt(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() = a < stack.top();
}

inline void gt(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() = a > stack.top();
}

inline void eq(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() = a == stack.top();
}

inline void iszero(Stack& stack) noexcept
{
    stack.top() = stack.top() == 0;
}

inline void and_(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() &= a;
}

inline void or_(Stack& stack) noexcept
{
    const auto a = stack.pop();
    stack.top() |= a;
}

inline void not_(Stack& stack) noexcept
{
    stack.top() = ~stack.top();
}
/// @}

inline void dup(Stack& stack, size_t n) noexcept
{
    stack.push(stack[n - 1]);
}

inline void swap(Stack& stack, size_t n) noexcept
{
    std::swap(stack[0], stack[n]);
}
}  // namespace instr::core
}  // namespace gasket
