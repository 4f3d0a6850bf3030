// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>

namespace gasket
{
/// The gas budget of a single call frame.
class GasMeter
{
    /// The budget the frame started with.
    int64_t m_limit = 0;

    int64_t m_remaining = 0;

public:
    explicit GasMeter(int64_t limit) noexcept
      : m_limit{std::max(limit, int64_t{0})}, m_remaining{m_limit}
    {}

    [[nodiscard]] int64_t limit() const noexcept { return m_limit; }
    [[nodiscard]] int64_t remaining() const noexcept { return m_remaining; }
    [[nodiscard]] int64_t used() const noexcept { return m_limit - m_remaining; }

    /// Charges the amount of gas.
    ///
    /// @return  The new remaining gas or std::nullopt if the amount exceeds the remaining gas.
    ///          In the latter case the remaining gas is not modified.
    [[nodiscard]] std::optional<int64_t> charge(int64_t amount) noexcept
    {
        if (amount > m_remaining)
            return std::nullopt;
        m_remaining -= amount;
        return m_remaining;
    }

    /// Returns gas to the frame. The remaining gas never exceeds the frame's budget.
    void refund(int64_t amount) noexcept
    {
        m_remaining = std::min(m_limit, m_remaining + std::max(amount, int64_t{0}));
    }

    /// Applies the failure policy of the error: assert-class failures burn all remaining gas,
    /// require/revert-class failures keep it.
    void apply_failure_policy(ErrorCode ec) noexcept
    {
        if (burns_all_gas(ec))
            m_remaining = 0;
    }
};
}  // namespace gasket
