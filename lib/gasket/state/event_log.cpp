// gasket: Deterministic contract execution engine
// Copyright 2026 The gasket Authors.
// SPDX-License-Identifier: Apache-2.0
#include "event_log.hpp"
#include <algorithm>
#include <iterator>

namespace gasket::state
{
bool EventMatcher::operator()(const Event& event) const noexcept
{
    if (m_filter.emitter.has_value() && *m_filter.emitter != event.emitter)
        return false;
    if (m_filter.name.has_value() && *m_filter.name != event.name)
        return false;
    return std::ranges::all_of(m_filter.topics, [&event](const auto& topic) {
        return event.indexed_value(topic.first) == topic.second;
    });
}

void EventLog::append(std::vector<Event> events)
{
    m_events.reserve(m_events.size() + events.size());
    std::ranges::move(events, std::back_inserter(m_events));
}
}  // namespace gasket::state
