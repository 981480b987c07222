#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace reveille {

// One row of a listing: 1-based ordinal as shown to the user.
struct ListedTrigger {
    int ordinal = 0;
    Trigger trigger;
};

// Restartable view over a snapshot of the store taken by TriggerStore::list().
// Rows are materialized on dereference; later store mutations do not affect it.
class TriggerListing {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ListedTrigger;
        using difference_type = std::ptrdiff_t;
        using pointer = const ListedTrigger *;
        using reference = ListedTrigger;

        const_iterator(const std::vector<Trigger> *rows, std::size_t pos)
            : m_rows(rows)
            , m_pos(pos)
        {
        }

        ListedTrigger operator*() const
        {
            return ListedTrigger{static_cast<int>(m_pos) + 1, (*m_rows)[m_pos]};
        }

        const_iterator &operator++()
        {
            ++m_pos;
            return *this;
        }

        const_iterator operator++(int)
        {
            const_iterator copy = *this;
            ++m_pos;
            return copy;
        }

        bool operator==(const const_iterator &other) const
        {
            return m_rows == other.m_rows && m_pos == other.m_pos;
        }

        bool operator!=(const const_iterator &other) const
        {
            return !(*this == other);
        }

    private:
        const std::vector<Trigger> *m_rows;
        std::size_t m_pos;
    };

    explicit TriggerListing(std::shared_ptr<const std::vector<Trigger>> rows);

    const_iterator begin() const;
    const_iterator end() const;
    std::size_t size() const;
    bool empty() const;

private:
    std::shared_ptr<const std::vector<Trigger>> m_rows;
};

// TriggerStore holds the user's alarms in insertion order. Every trigger gets a
// stable id on add; positional indexes are only resolved at the console
// boundary. All access is serialized by one mutex because the scan thread,
// watch threads and the console touch the same records.
class TriggerStore {
public:
    TriggerStore() = default;

    TriggerStore(const TriggerStore &) = delete;
    TriggerStore &operator=(const TriggerStore &) = delete;

    // Appends a copy of the trigger and returns its new id. An empty label
    // becomes "Alarm at HH:MM".
    TriggerId add(Trigger trigger);

    // 0-based index. Throws OutOfRange. Returns the new enabled state.
    bool toggleEnabled(int index);

    // 0-based index. Throws OutOfRange.
    Trigger remove(int index);

    TriggerListing list() const;

    TriggerId resolveOrdinal(int index) const;
    std::optional<Trigger> get(TriggerId id) const;

    // Enabled, non-deferred triggers in store order.
    std::vector<Trigger> dueCandidates() const;

    // Deferral bookkeeping on the store member. Both return false when the id
    // is no longer in the store (deleted while its follow-up was pending).
    bool markDeferred(TriggerId id, int deferCount);
    bool resetDeferral(TriggerId id);

    std::size_t size() const;
    std::size_t enabledCount() const;
    std::vector<Trigger> snapshot() const;

private:
    void checkIndex(int index) const;

    mutable std::mutex m_mutex;
    std::vector<Trigger> m_triggers;
    TriggerId m_nextId = 1;
};

} // namespace reveille
