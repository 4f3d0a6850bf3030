// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gasket
{
/// The emitted event.
struct Event
{
    struct Field
    {
        std::string name;
        uint256 value;
        bool indexed = false;

        bool operator==(const Field&) const noexcept = default;
    };

    /// The address of the contract whose storage context emitted the event.
    address emitter;

    std::string name;

    std::vector<Field> fields;

    bool operator==(const Event&) const noexcept = default;

    /// Returns the value of the indexed field or std::nullopt
    /// if the event has no indexed field with this name.
    [[nodiscard]] std::optional<uint256> indexed_value(std::string_view field_name) const noexcept
    {
        for (const auto& f : fields)
        {
            if (f.indexed && f.name == field_name)
                return f.value;
        }
        return std::nullopt;
    }
};
}  // namespace gasket
