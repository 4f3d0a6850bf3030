// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#include "execution_state.hpp"
#include "instructions_traits.hpp"
#include <array>

namespace gasket
{
namespace
{
/// The lookup table of SSTORE costs by the storage update status.
///
/// Writing a non-zero value to a slot whose current value is zero costs the "set" price,
/// every other write costs the "reset" price.
constexpr auto sstore_costs = []() noexcept {
    std::array<int16_t, EVMC_STORAGE_MODIFIED_RESTORED + 1> tbl{};
    tbl[EVMC_STORAGE_ASSIGNED] = instr::sstore_reset_cost;
    tbl[EVMC_STORAGE_ADDED] = instr::sstore_set_cost;
    tbl[EVMC_STORAGE_DELETED] = instr::sstore_reset_cost;
    tbl[EVMC_STORAGE_MODIFIED] = instr::sstore_reset_cost;
    tbl[EVMC_STORAGE_DELETED_ADDED] = instr::sstore_set_cost;
    tbl[EVMC_STORAGE_MODIFIED_DELETED] = instr::sstore_reset_cost;
    tbl[EVMC_STORAGE_DELETED_RESTORED] = instr::sstore_set_cost;
    tbl[EVMC_STORAGE_ADDED_DELETED] = instr::sstore_reset_cost;
    tbl[EVMC_STORAGE_MODIFIED_RESTORED] = instr::sstore_reset_cost;
    return tbl;
}();
}  // namespace

ErrorCode StorageView::write(const bytes32& key, const bytes32& value) noexcept
{
    if (m_static)
        return STATIC_MODE_VIOLATION;

    const auto status = m_host.set_storage(m_owner, key, value);
    if (!m_gas.charge(sstore_costs[status]).has_value())
        return OUT_OF_GAS;
    return SUCCESS;
}
}  // namespace gasket
