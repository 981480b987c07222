#include "scheduler/trigger_store.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "common/errors.hpp"
#include "common/time_of_day.hpp"

namespace reveille {

TriggerListing::TriggerListing(std::shared_ptr<const std::vector<Trigger>> rows)
    : m_rows(std::move(rows))
{
}

TriggerListing::const_iterator TriggerListing::begin() const
{
    return const_iterator(m_rows.get(), 0);
}

TriggerListing::const_iterator TriggerListing::end() const
{
    return const_iterator(m_rows.get(), m_rows->size());
}

std::size_t TriggerListing::size() const
{
    return m_rows->size();
}

bool TriggerListing::empty() const
{
    return m_rows->empty();
}

TriggerId TriggerStore::add(Trigger trigger)
{
    if (trigger.label.empty()) {
        trigger.label = "Alarm at " + formatTimeOfDay(trigger.fireTime);
    }
    trigger.deferred = false;

    std::lock_guard<std::mutex> lock(m_mutex);
    trigger.id = m_nextId++;
    trigger.originId = trigger.id;
    m_triggers.push_back(trigger);
    return trigger.id;
}

bool TriggerStore::toggleEnabled(int index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    checkIndex(index);
    Trigger &trigger = m_triggers[static_cast<std::size_t>(index)];
    trigger.enabled = !trigger.enabled;
    return trigger.enabled;
}

Trigger TriggerStore::remove(int index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    checkIndex(index);
    const auto it = m_triggers.begin() + index;
    Trigger removed = *it;
    m_triggers.erase(it);
    return removed;
}

TriggerListing TriggerStore::list() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return TriggerListing(std::make_shared<const std::vector<Trigger>>(m_triggers));
}

TriggerId TriggerStore::resolveOrdinal(int index) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    checkIndex(index);
    return m_triggers[static_cast<std::size_t>(index)].id;
}

std::optional<Trigger> TriggerStore::get(TriggerId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = std::find_if(m_triggers.begin(), m_triggers.end(),
                                 [id](const Trigger &t) { return t.id == id; });
    if (it == m_triggers.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Trigger> TriggerStore::dueCandidates() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Trigger> candidates;
    for (const auto &trigger : m_triggers) {
        if (trigger.enabled && !trigger.deferred) {
            candidates.push_back(trigger);
        }
    }
    return candidates;
}

bool TriggerStore::markDeferred(TriggerId id, int deferCount)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &trigger : m_triggers) {
        if (trigger.id == id) {
            trigger.deferred = true;
            trigger.deferCount = deferCount;
            return true;
        }
    }
    return false;
}

bool TriggerStore::resetDeferral(TriggerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &trigger : m_triggers) {
        if (trigger.id == id) {
            trigger.deferred = false;
            trigger.deferCount = 0;
            return true;
        }
    }
    return false;
}

std::size_t TriggerStore::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_triggers.size();
}

std::size_t TriggerStore::enabledCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(
        m_triggers.begin(), m_triggers.end(),
        [](const Trigger &t) { return t.enabled; }));
}

std::vector<Trigger> TriggerStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_triggers;
}

void TriggerStore::checkIndex(int index) const
{
    if (index < 0 || static_cast<std::size_t>(index) >= m_triggers.size()) {
        throw OutOfRange("alarm index " + std::to_string(index)
                         + " outside [0, " + std::to_string(m_triggers.size()) + ")");
    }
}

} // namespace reveille
