// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gasket/event.hpp>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace gasket::state
{
/// The event query. Unset criteria match any event.
struct EventFilter
{
    std::optional<address> emitter;

    std::optional<std::string> name;

    /// The required values of indexed fields: field name => value.
    std::vector<std::pair<std::string, uint256>> topics;
};

/// The predicate matching events against a filter.
///
/// Only the emitter, the event name and the indexed field values are considered.
class EventMatcher
{
    EventFilter m_filter;

public:
    explicit EventMatcher(EventFilter filter) noexcept : m_filter{std::move(filter)} {}

    bool operator()(const Event& event) const noexcept;
};

/// The append-only log of events of the committed top-level operations.
class EventLog
{
    std::vector<Event> m_events;

public:
    using QueryView = std::ranges::filter_view<std::ranges::ref_view<const std::vector<Event>>,
        EventMatcher>;

    /// Appends the events of a committed operation, preserving their order.
    void append(std::vector<Event> events);

    [[nodiscard]] size_t size() const noexcept { return m_events.size(); }

    [[nodiscard]] const std::vector<Event>& events() const noexcept { return m_events; }

    /// Returns the lazy view of the events matching the filter, in emission order.
    /// The view is invalidated by append().
    [[nodiscard]] QueryView query(EventFilter filter) const
    {
        return QueryView{std::ranges::ref_view{m_events}, EventMatcher{std::move(filter)}};
    }
};
}  // namespace gasket::state
