// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#include "registry.hpp"

namespace gasket::state
{
bool Registry::insert(const address& addr, std::shared_ptr<const ContractCode> code)
{
    return m_contracts.try_emplace(addr, Contract{addr, std::move(code)}).second;
}

const Contract* Registry::find(const address& addr) const noexcept
{
    const auto it = m_contracts.find(addr);
    if (it == m_contracts.end() || it->second.terminated)
        return nullptr;
    return &it->second;
}

std::variant<const Contract*, std::error_code> Registry::lookup(const address& addr) const noexcept
{
    if (const auto* c = find(addr); c != nullptr)
        return c;
    return make_error_code(NO_SUCH_CONTRACT);
}

bool Registry::terminate(const address& addr) noexcept
{
    const auto it = m_contracts.find(addr);
    if (it == m_contracts.end() || it->second.terminated)
        return false;
    it->second.terminated = true;
    return true;
}
}  // namespace gasket::state
