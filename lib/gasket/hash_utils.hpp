// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "value.hpp"
#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <bit>
#include <ostream>

namespace gasket
{
/// Default type for 256-bit hash.
using hash256 = bytes32;

/// Computes Keccak hash out of input bytes (wrapper of ethash::keccak256).
inline hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}

/// Computes the storage slot of a mapping entry: keccak256(key ‖ slot).
inline hash256 mapping_slot(const uint256& key, const uint256& slot) noexcept
{
    uint8_t buffer[2 * sizeof(hash256)];
    intx::be::unsafe::store(&buffer[0], key);
    intx::be::unsafe::store(&buffer[sizeof(hash256)], slot);
    return keccak256({buffer, std::size(buffer)});
}
}  // namespace gasket

std::ostream& operator<<(std::ostream& out, const gasket::address& a);
std::ostream& operator<<(std::ostream& out, const gasket::bytes32& b);
