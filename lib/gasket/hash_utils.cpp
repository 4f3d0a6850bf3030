// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#include "hash_utils.hpp"

std::ostream& operator<<(std::ostream& out, const gasket::address& a)
{
    return out << "0x" << evmc::hex(a);
}

std::ostream& operator<<(std::ostream& out, const gasket::bytes32& b)
{
    return out << "0x" << evmc::hex(b);
}
