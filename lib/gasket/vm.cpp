// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0

/// @file
/// The interpreter instance (class VM) and its configuration options are defined here.

#include "vm.hpp"
#include <charconv>
#include <iostream>

namespace gasket
{
SetOptionResult VM::set_option(std::string_view name, std::string_view value) noexcept
{
    if (name == "trace")
    {
        add_tracer(create_instruction_tracer(std::clog));
        return SetOptionResult::success;
    }
    else if (name == "histogram")
    {
        add_tracer(create_histogram_tracer(std::clog));
        return SetOptionResult::success;
    }
    else if (name == "max_depth")
    {
        int32_t depth = 0;
        const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
        if (ec != std::errc{} || end != value.data() + value.size())
            return SetOptionResult::invalid_value;
        if (depth < 1 || depth > DEFAULT_MAX_DEPTH)
            return SetOptionResult::invalid_value;
        m_max_depth = depth;
        return SetOptionResult::success;
    }
    return SetOptionResult::invalid_name;
}
}  // namespace gasket
