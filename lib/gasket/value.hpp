// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <cstdint>
#include <string_view>

namespace gasket
{
using evmc::address;
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using intx::uint256;
using namespace evmc::literals;

/// The declared type of a function parameter.
enum class ValueType : uint8_t
{
    uint256,
    address,
    boolean,
};

/// The typed value passed by the host as a function argument.
struct Value
{
    ValueType type = ValueType::uint256;
    uint256 word;

    static Value of_uint(const uint256& v) noexcept { return {ValueType::uint256, v}; }
    static Value of_address(const address& a) noexcept
    {
        return {ValueType::address, intx::be::load<uint256>(a)};
    }
    static Value of_bool(bool b) noexcept { return {ValueType::boolean, b ? 1 : 0}; }

    bool operator==(const Value&) const noexcept = default;
};

/// Checks if the stack word is a valid representation of a value of the given type.
inline bool fits(ValueType type, const uint256& word) noexcept
{
    switch (type)
    {
    case ValueType::boolean:
        return word <= 1;
    case ValueType::address:
        return (word >> 160) == 0;
    default:
        return true;
    }
}

inline uint256 to_word(const address& addr) noexcept
{
    return intx::be::load<uint256>(addr);
}

inline address to_address(const uint256& word) noexcept
{
    return intx::be::trunc<address>(word);
}

inline uint256 to_word(const bytes32& b) noexcept
{
    return intx::be::load<uint256>(b);
}

inline bytes32 to_bytes32(const uint256& word) noexcept
{
    return intx::be::store<bytes32>(word);
}

std::string_view to_string(ValueType type) noexcept;
}  // namespace gasket
